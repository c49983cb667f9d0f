#ifndef PODIUM_ROLE_ASSIGNER_H
#define PODIUM_ROLE_ASSIGNER_H

#include "core/config_loader.h"
#include "segment/interval.h"

#include <optional>
#include <string>
#include <vector>

namespace podium {

struct RoleBinding {
    SpeakerId speaker;
    std::string role;
    std::size_t order = 0;  // Position in the role template
};

class RoleAssignment {
   public:
    RoleAssignment() = default;
    explicit RoleAssignment(std::vector<RoleBinding> bindings);

    std::optional<RoleBinding> find(const SpeakerId& speaker) const;

    const std::vector<RoleBinding>& bindings() const {
        return bindings_;
    }
    bool empty() const {
        return bindings_.empty();
    }

   private:
    std::vector<RoleBinding> bindings_;
};

/**
 * @brief Binds speakers to debate roles by order of first appearance.
 *
 * The template alternates sides starting with the declared first team:
 * "First 1st Speaker", "Second 1st Speaker", "First 2nd Speaker", ...
 */
class RoleAssigner {
   public:
    explicit RoleAssigner(const AnalysisConfig::RoleConfig& config);

    // Intervals need not be sorted. Speakers past expectedParticipants get no role.
    RoleAssignment assign(const IntervalList& intervals) const;

    std::vector<std::string> roleTemplate(std::size_t participants) const;

    const std::string& firstTeam() const {
        return first_;
    }
    const std::string& secondTeam() const {
        return second_;
    }

   private:
    AnalysisConfig::RoleConfig config_;
    std::string first_;
    std::string second_;
};

// "1st", "2nd", "3rd", "4th", ..., "11th", "12th", "13th", "21st"
std::string ordinal(std::size_t n);

}  // namespace podium

#endif  // PODIUM_ROLE_ASSIGNER_H
