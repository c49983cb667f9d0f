#ifndef PODIUM_DELIVERY_CLASSIFIER_H
#define PODIUM_DELIVERY_CLASSIFIER_H

#include "analysis/feature_extractor.h"
#include "core/config_loader.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace podium {
namespace analysis {

struct DeliveryLabel {
    std::optional<std::string> expressiveness;  // Empty when centroid variance is unknown
    std::string passion;
    std::string speed;
    std::string tip;
};

/**
 * @brief Ordered threshold ladder: the first rule whose lower bound the value exceeds wins.
 *
 * Bounds are exclusive, so a value equal to a bound falls through to the next rule.
 */
class ThresholdLadder {
   public:
    struct Rule {
        double lowerExclusive;
        std::string label;
    };

    ThresholdLadder(std::vector<Rule> rules, std::string fallback);

    const std::string& classify(double value) const;

    const std::vector<Rule>& rules() const {
        return rules_;
    }

   private:
    std::vector<Rule> rules_;
    std::string fallback_;
};

/**
 * @brief Maps a FeatureVector to delivery labels and one coaching tip.
 *
 * Tips come from an ordered rule list; the first applicable rule wins.
 */
class DeliveryClassifier {
   public:
    struct TipRule {
        std::string name;
        std::function<bool(const FeatureVector&, const DeliveryLabel&)> applies;
        std::string tip;
    };

    explicit DeliveryClassifier(const AnalysisConfig::ClassifierConfig& config);

    DeliveryLabel classify(const FeatureVector& features) const;

    std::optional<std::string> expressiveness(const std::optional<double>& centroidVariance) const;
    std::string passion(double dynamicRangeDb) const;
    std::string speed(double speechRatio) const;
    std::string tip(const FeatureVector& features, const DeliveryLabel& labels) const;

    const std::vector<TipRule>& tipRules() const {
        return tipRules_;
    }

    static const char* defaultTip();

   private:
    AnalysisConfig::ClassifierConfig config_;
    ThresholdLadder expressiveness_;
    ThresholdLadder passion_;
    ThresholdLadder speed_;
    std::vector<TipRule> tipRules_;
};

}  // namespace analysis
}  // namespace podium

#endif  // PODIUM_DELIVERY_CLASSIFIER_H
