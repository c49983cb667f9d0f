#include "analysis/delivery_classifier.h"

#include "logging/logger.h"

namespace podium {
namespace analysis {

ThresholdLadder::ThresholdLadder(std::vector<Rule> rules, std::string fallback)
    : rules_(std::move(rules)), fallback_(std::move(fallback)) {}

const std::string& ThresholdLadder::classify(double value) const {
    for (const auto& rule : rules_) {
        if (value > rule.lowerExclusive) {
            return rule.label;
        }
    }
    return fallback_;
}

DeliveryClassifier::DeliveryClassifier(const AnalysisConfig::ClassifierConfig& config)
    : config_(config),
      expressiveness_({{config.expressiveCentroidVar, "expressive"},
                       {config.neutralCentroidVar, "neutral"}},
                      "monotone"),
      passion_({{config.passionateRangeDb, "passionate"}, {config.balancedRangeDb, "balanced"}},
               "subdued"),
      speed_({{config.veryFastSpeechRatio, "very fast"},
              {config.fastSpeechRatio, "fast"},
              {config.moderateSpeechRatio, "moderate"}},
             "slow") {
    const double shortPause = config.shortPauseSec;
    tipRules_ = {
        {"monotone",
         [](const FeatureVector&, const DeliveryLabel& l) {
             return l.expressiveness && *l.expressiveness == "monotone";
         },
         "Vary your tone between arguments to keep the judge engaged."},
        {"neutral",
         [](const FeatureVector&, const DeliveryLabel& l) {
             return l.expressiveness && *l.expressiveness == "neutral";
         },
         "Use a bit more vocal variety to emphasise key points."},
        {"subdued",
         [](const FeatureVector&, const DeliveryLabel& l) { return l.passion == "subdued"; },
         "Project more confidence and energy to convey conviction."},
        {"fast",
         [](const FeatureVector&, const DeliveryLabel& l) {
             return l.speed == "fast" || l.speed == "very fast";
         },
         "Slow down and insert short pauses after important claims."},
        {"slow", [](const FeatureVector&, const DeliveryLabel& l) { return l.speed == "slow"; },
         "Pick up the pace slightly to maintain momentum."},
        {"short-pauses",
         [shortPause](const FeatureVector& f, const DeliveryLabel&) {
             return f.avgPauseSec < shortPause;
         },
         "Introduce brief pauses to separate ideas and aid clarity."},
    };
}

const char* DeliveryClassifier::defaultTip() {
    return "Maintain your current delivery while emphasising key points.";
}

std::optional<std::string> DeliveryClassifier::expressiveness(
    const std::optional<double>& centroidVariance) const {
    if (!centroidVariance) {
        return std::nullopt;
    }
    return expressiveness_.classify(*centroidVariance);
}

std::string DeliveryClassifier::passion(double dynamicRangeDb) const {
    return passion_.classify(dynamicRangeDb);
}

std::string DeliveryClassifier::speed(double speechRatio) const {
    return speed_.classify(speechRatio);
}

std::string DeliveryClassifier::tip(const FeatureVector& features,
                                    const DeliveryLabel& labels) const {
    for (const auto& rule : tipRules_) {
        if (rule.applies(features, labels)) {
            LOG_TRACE("Classifier: tip rule '{}' matched", rule.name);
            return rule.tip;
        }
    }
    return defaultTip();
}

DeliveryLabel DeliveryClassifier::classify(const FeatureVector& features) const {
    DeliveryLabel label;
    label.expressiveness = expressiveness(features.centroidVariance);
    label.passion = passion(features.dynamicRangeDb);
    label.speed = speed(features.speechRatio);
    label.tip = tip(features, label);
    return label;
}

}  // namespace analysis
}  // namespace podium
