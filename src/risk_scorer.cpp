// risk_scorer.cpp
#include "breachguard/risk_scorer.hpp"

#include <algorithm> // For std::clamp, std::max

#include <fmt/format.h>

namespace breachguard {

auto RiskScorer::score(std::span<const RiskFactor> factors, const BreachResult& breach) const
    -> RiskAssessment {
    RiskAssessment assessment;
    double accumulator{0.0};

    for (const auto& factor : factors) {
        const auto contribution{factor.contribution()};
        accumulator += contribution;

        // Factors that did not move the score stay silent
        if (contribution != 0.0) {
            assessment.reasons.push_back(factor.detail);
        }
    }

    assessment.risk_score = std::clamp(accumulator, 0.0, 1.0);
    assessment.label = classify(assessment.risk_score);

    if (breach.offline_hit) {
        assessment.reasons.emplace_back("Matches a password from the offline breach corpus");
    }
    if (breach.online_hit) {
        assessment.reasons.push_back(breach.online_count
            ? fmt::format("Found in the online breach corpus ({} occurrences)", *breach.online_count)
            : std::string{"Found in the online breach corpus"});
    }

    if (breach.any_hit()) {
        assessment.risk_score = std::max(assessment.risk_score, BREACH_SCORE_FLOOR);
        assessment.label = RiskLabel::HIGH;
    }

    if (breach.online_requested) {
        if (!breach.online_checked) {
            assessment.reasons.emplace_back("Online breach lookup unavailable");
        } else if (!breach.online_hit) {
            assessment.reasons.emplace_back("Not found in the online breach corpus");
        }
    }

    return assessment;
}

} // namespace breachguard
