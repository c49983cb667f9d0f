#include "segment/role_assigner.h"

#include "logging/logger.h"

#include <algorithm>
#include <cctype>
#include <unordered_set>

namespace podium {

namespace {

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

}  // namespace

std::string ordinal(std::size_t n) {
    const std::size_t mod100 = n % 100;
    const char* suffix = "th";
    if (mod100 < 11 || mod100 > 13) {
        switch (n % 10) {
        case 1:
            suffix = "st";
            break;
        case 2:
            suffix = "nd";
            break;
        case 3:
            suffix = "rd";
            break;
        default:
            break;
        }
    }
    return std::to_string(n) + suffix;
}

RoleAssignment::RoleAssignment(std::vector<RoleBinding> bindings)
    : bindings_(std::move(bindings)) {}

std::optional<RoleBinding> RoleAssignment::find(const SpeakerId& speaker) const {
    for (const auto& b : bindings_) {
        if (b.speaker == speaker) {
            return b;
        }
    }
    return std::nullopt;
}

RoleAssigner::RoleAssigner(const AnalysisConfig::RoleConfig& config) : config_(config) {
    // Validation has already checked that firstTeam names one of the two teams
    if (equalsIgnoreCase(config_.firstTeam, config_.team2)) {
        first_ = config_.team2;
        second_ = config_.team1;
    } else {
        first_ = config_.team1;
        second_ = config_.team2;
    }
}

std::vector<std::string> RoleAssigner::roleTemplate(std::size_t participants) const {
    std::vector<std::string> roles;
    roles.reserve(participants);
    for (std::size_t i = 0; i < participants; ++i) {
        const std::string& team = (i % 2 == 0) ? first_ : second_;
        roles.push_back(team + " " + ordinal(i / 2 + 1) + " Speaker");
    }
    return roles;
}

RoleAssignment RoleAssigner::assign(const IntervalList& intervals) const {
    IntervalList ordered = intervals;
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const Interval& a, const Interval& b) { return a.start < b.start; });

    const std::size_t expected = static_cast<std::size_t>(config_.expectedParticipants);
    std::vector<SpeakerId> firstSeen;
    std::unordered_set<SpeakerId> seen;
    for (const auto& iv : ordered) {
        if (firstSeen.size() >= expected) {
            break;
        }
        if (seen.insert(iv.speaker).second) {
            firstSeen.push_back(iv.speaker);
        }
    }

    std::vector<std::string> roles = roleTemplate(expected);
    std::vector<RoleBinding> bindings;
    for (std::size_t i = 0; i < firstSeen.size(); ++i) {
        bindings.push_back({firstSeen[i], roles[i], i});
        LOG_INFO("Roles: {} -> {}", firstSeen[i], roles[i]);
    }

    for (const auto& iv : ordered) {
        if (seen.count(iv.speaker) == 0) {
            seen.insert(iv.speaker);
            LOG_WARN("Roles: {} appears after all {} roles were filled, excluded from report",
                     iv.speaker, expected);
        }
    }
    return RoleAssignment(std::move(bindings));
}

}  // namespace podium
