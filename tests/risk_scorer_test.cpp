// risk_scorer_test.cpp
#include "breachguard/risk_scorer.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace breachguard {
namespace {

auto MakeFactor(std::string name, double weight, bool triggered,
                FactorPolarity polarity = FactorPolarity::RISK) -> RiskFactor {
    return RiskFactor{
        .name = name,
        .weight = weight,
        .triggered = triggered,
        .polarity = polarity,
        .detail = name + (triggered ? " triggered" : " quiet"),
    };
}

TEST(RiskScorerTest, ClassifiesByThreshold) {
    EXPECT_EQ(RiskScorer::classify(0.0), RiskLabel::LOW);
    EXPECT_EQ(RiskScorer::classify(0.33), RiskLabel::LOW);
    EXPECT_EQ(RiskScorer::classify(RiskScorer::MEDIUM_THRESHOLD), RiskLabel::MEDIUM);
    EXPECT_EQ(RiskScorer::classify(0.66), RiskLabel::MEDIUM);
    EXPECT_EQ(RiskScorer::classify(RiskScorer::HIGH_THRESHOLD), RiskLabel::HIGH);
    EXPECT_EQ(RiskScorer::classify(1.0), RiskLabel::HIGH);
}

TEST(RiskScorerTest, ClampsToUnitInterval) {
    const RiskScorer scorer;

    const std::vector<RiskFactor> heavy{MakeFactor("a", 0.8, true), MakeFactor("b", 0.8, true)};
    const auto high{scorer.score(heavy, BreachResult{})};
    EXPECT_DOUBLE_EQ(high.risk_score, 1.0);
    EXPECT_EQ(high.label, RiskLabel::HIGH);

    const std::vector<RiskFactor> strong{MakeFactor("diverse", 0.5, true, FactorPolarity::STRENGTH)};
    const auto low{scorer.score(strong, BreachResult{})};
    EXPECT_DOUBLE_EQ(low.risk_score, 0.0);
    EXPECT_EQ(low.label, RiskLabel::LOW);
}

TEST(RiskScorerTest, StrengthFactorAddsWeightWhenAbsent) {
    const RiskScorer scorer;
    const std::vector<RiskFactor> factors{MakeFactor("diverse", 0.4, false, FactorPolarity::STRENGTH)};

    const auto assessment{scorer.score(factors, BreachResult{})};
    EXPECT_DOUBLE_EQ(assessment.risk_score, 0.4);
    EXPECT_EQ(assessment.label, RiskLabel::MEDIUM);
    ASSERT_EQ(assessment.reasons.size(), 1u);
    EXPECT_EQ(assessment.reasons[0], "diverse quiet");
}

TEST(RiskScorerTest, ReasonsFollowFactorOrderAndSkipSilentFactors) {
    const RiskScorer scorer;
    const std::vector<RiskFactor> factors{
        MakeFactor("first", 0.1, true),
        MakeFactor("silent", 0.3, false),
        MakeFactor("second", 0.1, true, FactorPolarity::STRENGTH),
        MakeFactor("third", 0.1, true),
    };

    const auto assessment{scorer.score(factors, BreachResult{})};
    const std::vector<std::string> expected{"first triggered", "second triggered", "third triggered"};
    EXPECT_EQ(assessment.reasons, expected);
    EXPECT_NEAR(assessment.risk_score, 0.1, 1e-9);
}

TEST(RiskScorerTest, OfflineHitAppliesBreachFloor) {
    const RiskScorer scorer;
    const std::vector<RiskFactor> factors{MakeFactor("minor", 0.1, true)};

    const auto assessment{scorer.score(factors, BreachResult{.offline_hit = true})};
    EXPECT_DOUBLE_EQ(assessment.risk_score, RiskScorer::BREACH_SCORE_FLOOR);
    EXPECT_EQ(assessment.label, RiskLabel::HIGH);
    ASSERT_EQ(assessment.reasons.size(), 2u);
    EXPECT_EQ(assessment.reasons[1], "Matches a password from the offline breach corpus");
}

TEST(RiskScorerTest, BreachFloorNeverLowersScore) {
    const RiskScorer scorer;
    const std::vector<RiskFactor> factors{MakeFactor("major", 1.0, true)};

    const auto assessment{scorer.score(factors, BreachResult{.offline_hit = true})};
    EXPECT_DOUBLE_EQ(assessment.risk_score, 1.0);
}

TEST(RiskScorerTest, OnlineHitReportsCount) {
    const RiskScorer scorer;
    const BreachResult breach{
        .online_requested = true,
        .online_checked = true,
        .online_hit = true,
        .online_count = 3861493,
    };

    const auto assessment{scorer.score({}, breach)};
    EXPECT_EQ(assessment.label, RiskLabel::HIGH);
    EXPECT_GE(assessment.risk_score, RiskScorer::BREACH_SCORE_FLOOR);
    ASSERT_EQ(assessment.reasons.size(), 1u);
    EXPECT_EQ(assessment.reasons[0], "Found in the online breach corpus (3861493 occurrences)");
}

TEST(RiskScorerTest, OnlineStatusReasons) {
    const RiskScorer scorer;

    const auto unavailable{scorer.score({}, BreachResult{.online_requested = true})};
    ASSERT_EQ(unavailable.reasons.size(), 1u);
    EXPECT_EQ(unavailable.reasons[0], "Online breach lookup unavailable");
    EXPECT_EQ(unavailable.label, RiskLabel::LOW);

    const auto clean{scorer.score({}, BreachResult{.online_requested = true, .online_checked = true,
                                                   .online_count = 0})};
    ASSERT_EQ(clean.reasons.size(), 1u);
    EXPECT_EQ(clean.reasons[0], "Not found in the online breach corpus");

    const auto not_requested{scorer.score({}, BreachResult{})};
    EXPECT_TRUE(not_requested.reasons.empty());
}

} // namespace
} // namespace breachguard
