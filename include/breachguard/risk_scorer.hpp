// risk_scorer.hpp
#ifndef BREACHGUARD_RISK_SCORER_HPP
#define BREACHGUARD_RISK_SCORER_HPP

#include <span>   // For std::span
#include <string> // For std::string
#include <vector> // For std::vector

#include "breachguard/types.hpp"

namespace breachguard {

/// @brief Score, label and ordered reasons produced by the scorer.
struct RiskAssessment final {
    double risk_score{0.0};
    RiskLabel label{RiskLabel::LOW};
    std::vector<std::string> reasons;
};

/**
 * @brief Folds weighted risk factors and breach flags into a bounded score and a label.
 * @approach Sums signed factor contributions, clamps to [0, 1], then applies the breach floor:
 * any offline or online hit raises the score to at least `BREACH_SCORE_FLOOR` and the label to
 * `HIGH`. Reasons follow extraction order, then breach hits, then the lookup status.
 * @complexity Time: O(F) for F factors. Space: O(F).
 */
class RiskScorer final {
public:
    static constexpr double MEDIUM_THRESHOLD{0.34};
    static constexpr double HIGH_THRESHOLD{0.67};
    static constexpr double BREACH_SCORE_FLOOR{0.9};

    [[nodiscard]] auto score(std::span<const RiskFactor> factors, const BreachResult& breach) const
        -> RiskAssessment;

    /// @brief Maps a clamped score to its label.
    [[nodiscard]] static constexpr auto classify(double risk_score) noexcept -> RiskLabel {
        if (risk_score >= HIGH_THRESHOLD) return RiskLabel::HIGH;
        if (risk_score >= MEDIUM_THRESHOLD) return RiskLabel::MEDIUM;
        return RiskLabel::LOW;
    }
};

} // namespace breachguard

#endif // BREACHGUARD_RISK_SCORER_HPP
