// analyzer_test.cpp
#include "breachguard/analyzer.hpp"

#include <array>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "breachguard/digest.hpp"

namespace breachguard {
namespace {

using namespace std::chrono_literals;

class FakeRangeFetcher final : public RangeFetcher {
public:
    std::expected<std::string, std::string> response{std::unexpected(std::string{"offline"})};
    std::string last_prefix;
    std::chrono::milliseconds last_timeout{0};
    int calls{0};

    auto fetch_range(std::string_view prefix, std::chrono::milliseconds timeout, std::stop_token)
        -> std::expected<std::string, std::string> override {
        ++calls;
        last_prefix = std::string{prefix};
        last_timeout = timeout;
        return response;
    }
};

class AnalyzerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeRangeFetcher> fetcher_{std::make_shared<FakeRangeFetcher>()};

    auto MakeAnalyzer(EngineConfig config = {}) -> PasswordRiskAnalyzer {
        constexpr std::array<std::string_view, 4> entries{"password", "mypassword", "123456", "qwerty"};
        auto corpus{std::make_shared<const BreachCorpus>(BreachCorpus::from_entries(entries))};
        return PasswordRiskAnalyzer{std::move(config), std::make_shared<const CorpusLoader>(std::move(corpus)),
                                    fetcher_};
    }

    // Body listing `password` among unrelated suffixes.
    static auto RangeBodyFor(std::string_view password, std::string_view count) -> std::string {
        const auto digest{sha1_hex(password)};
        return "0018A45C4D1DEF81644B54AB7F969B88D65:1\r\n" + digest.substr(RANGE_PREFIX_LENGTH) + ":" +
               std::string{count} + "\r\n00D4F6E8FA6EECAD2A3AA415EEC418D38EC:2\r\n";
    }
};

TEST_F(AnalyzerTest, RepeatedAndSequentialIsHigh) {
    const auto analyzer{MakeAnalyzer()};
    const auto result{analyzer.analyze("aaaa1111", false)};

    EXPECT_EQ(result.password, "aaaa1111");
    EXPECT_DOUBLE_EQ(result.risk_score, 1.0);
    EXPECT_EQ(result.label, RiskLabel::HIGH);
    EXPECT_FALSE(result.breach.offline_hit);
    EXPECT_FALSE(result.breach.online_checked);

    const std::vector<std::string> expected{
        "Too short (8 characters, 12+ recommended)",
        "Limited character variety (2 of 4 categories)",
        "Contains sequential or keyboard patterns",
        "Contains a character repeated three or more times in a row",
    };
    EXPECT_EQ(result.reasons, expected);
    EXPECT_EQ(result.suggestions.size(), 3u);
    EXPECT_EQ(fetcher_->calls, 0);
}

TEST_F(AnalyzerTest, EmptyPasswordIsHighWithSuggestions) {
    const auto analyzer{MakeAnalyzer()};
    const auto result{analyzer.analyze("", false)};

    EXPECT_NEAR(result.risk_score, 0.70, 1e-9);
    EXPECT_EQ(result.label, RiskLabel::HIGH);
    ASSERT_EQ(result.reasons.size(), 2u);
    EXPECT_EQ(result.reasons[0], "Too short (0 characters, 12+ recommended)");
    EXPECT_EQ(result.suggestions.size(), 3u);
}

TEST_F(AnalyzerTest, LongDiversePasswordIsLow) {
    const auto analyzer{MakeAnalyzer()};
    const auto result{analyzer.analyze("Tr0ub4dor&3xyz!Q", false)};

    EXPECT_DOUBLE_EQ(result.risk_score, 0.0);
    EXPECT_EQ(result.label, RiskLabel::LOW);
    EXPECT_FALSE(result.breach.any_hit());

    const std::vector<std::string> expected{
        "Uses multiple character categories (4 of 4)",
        "Contains sequential or keyboard patterns",
    };
    EXPECT_EQ(result.reasons, expected);
}

TEST_F(AnalyzerTest, SubstitutedCorpusEntryIsHigh) {
    const auto analyzer{MakeAnalyzer()};
    const auto result{analyzer.analyze("MyP@ssw0rd", false)};

    EXPECT_TRUE(result.breach.offline_hit);
    EXPECT_GE(result.risk_score, 0.9);
    EXPECT_EQ(result.label, RiskLabel::HIGH);
    ASSERT_FALSE(result.reasons.empty());
    EXPECT_EQ(result.reasons.back(), "Matches a password from the offline breach corpus");

    for (const auto& suggestion : result.suggestions) {
        EXPECT_NE(suggestion, "MyP@ssw0rd");
    }
}

TEST_F(AnalyzerTest, OnlineHitForcesHigh) {
    const std::string password{"Orbit#Falcon47!"};
    fetcher_->response = RangeBodyFor(password, "42");
    const auto analyzer{MakeAnalyzer()};

    const auto offline{analyzer.analyze(password, false)};
    EXPECT_EQ(offline.label, RiskLabel::LOW);

    const auto online{analyzer.analyze(password, true)};
    EXPECT_EQ(fetcher_->last_prefix, sha1_hex(password).substr(0, RANGE_PREFIX_LENGTH));
    EXPECT_TRUE(online.breach.online_checked);
    EXPECT_TRUE(online.breach.online_hit);
    EXPECT_EQ(online.breach.online_count, 42u);
    EXPECT_GE(online.risk_score, 0.9);
    EXPECT_EQ(online.label, RiskLabel::HIGH);
    EXPECT_EQ(online.reasons.back(), "Found in the online breach corpus (42 occurrences)");
    EXPECT_TRUE(online.to_json().contains("\"hibp_count\": 42"));
}

TEST_F(AnalyzerTest, OnlineMissIsReported) {
    fetcher_->response = RangeBodyFor("something else", "7");
    const auto analyzer{MakeAnalyzer()};

    const auto result{analyzer.analyze("Orbit#Falcon47!", true)};
    EXPECT_TRUE(result.breach.online_checked);
    EXPECT_FALSE(result.breach.online_hit);
    EXPECT_EQ(result.label, RiskLabel::LOW);
    EXPECT_EQ(result.reasons.back(), "Not found in the online breach corpus");
    EXPECT_TRUE(result.to_json().contains("\"breached_online\": false"));
}

TEST_F(AnalyzerTest, OnlineFailureDegradesToOfflineVerdict) {
    const auto analyzer{MakeAnalyzer()};

    const auto offline{analyzer.analyze("aaaa1111", false)};
    const auto online{analyzer.analyze("aaaa1111", true)};

    EXPECT_EQ(fetcher_->calls, 1);
    EXPECT_FALSE(online.breach.online_checked);
    EXPECT_FALSE(online.breach.online_hit);
    EXPECT_FALSE(online.breach.online_count.has_value());
    EXPECT_DOUBLE_EQ(online.risk_score, offline.risk_score);
    EXPECT_EQ(online.label, offline.label);
    EXPECT_EQ(online.reasons.back(), "Online breach lookup unavailable");
    EXPECT_TRUE(online.to_json().contains("\"breached_online\": null"));
}

TEST_F(AnalyzerTest, UsesConfiguredTimeout) {
    EngineConfig config;
    config.lookup_timeout = 1234ms;
    const auto analyzer{MakeAnalyzer(config)};

    static_cast<void>(analyzer.analyze("anything", true));
    EXPECT_EQ(fetcher_->last_timeout, 1234ms);
}

TEST_F(AnalyzerTest, ZeroConfiguredTimeoutSkipsTheNetwork) {
    EngineConfig config;
    config.lookup_timeout = 0ms;
    const auto analyzer{MakeAnalyzer(config)};

    const auto result{analyzer.analyze("Orbit#Falcon47!", true)};
    EXPECT_EQ(fetcher_->calls, 0);
    EXPECT_FALSE(result.breach.online_checked);
    EXPECT_EQ(result.reasons.back(), "Online breach lookup unavailable");
}

TEST_F(AnalyzerTest, RequestTimeoutOverridesConfig) {
    const auto analyzer{MakeAnalyzer()};
    const auto result{analyzer.analyze(AnalysisRequest{
        .password = "anything",
        .enable_online = true,
        .timeout = 300ms,
    })};

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(fetcher_->last_timeout, 300ms);
}

TEST_F(AnalyzerTest, RejectsMalformedRequests) {
    const auto analyzer{MakeAnalyzer()};

    const auto missing{analyzer.analyze(AnalysisRequest{.enable_online = true})};
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), "Malformed request: missing required field 'password'");
    EXPECT_EQ(fetcher_->calls, 0);

    const auto bad_timeout{analyzer.analyze(AnalysisRequest{.password = "x", .timeout = 0ms})};
    ASSERT_FALSE(bad_timeout.has_value());
    EXPECT_EQ(bad_timeout.error(), "Malformed request: 'timeout' must be positive");
}

TEST_F(AnalyzerTest, HonorsSuggestionCount) {
    EngineConfig config;
    config.suggestion_count = 5;
    const auto analyzer{MakeAnalyzer(config)};

    EXPECT_EQ(analyzer.analyze("hello", false).suggestions.size(), 5u);
}

TEST_F(AnalyzerTest, ScoreAndLabelStayConsistent) {
    const auto analyzer{MakeAnalyzer()};

    for (const std::string_view password :
         {"", "a", "qwerty", "Password1", "correct horse battery staple", "Zx!9", "|-|3ll0W0rld", "\t\n"}) {
        const auto result{analyzer.analyze(password, false)};
        EXPECT_GE(result.risk_score, 0.0) << password;
        EXPECT_LE(result.risk_score, 1.0) << password;
        if (!result.breach.any_hit()) {
            EXPECT_EQ(result.label, RiskScorer::classify(result.risk_score)) << password;
        }
    }
}

TEST_F(AnalyzerTest, ConcurrentCallsAgree) {
    const auto analyzer{MakeAnalyzer()};
    const auto expected{analyzer.analyze("MyP@ssw0rd", false)};

    std::vector<AnalysisResult> results(8);
    {
        std::vector<std::jthread> workers;
        for (std::size_t i{0}; i < results.size(); ++i) {
            workers.emplace_back([&analyzer, &results, i] { results[i] = analyzer.analyze("MyP@ssw0rd", false); });
        }
    }

    for (const auto& result : results) {
        EXPECT_DOUBLE_EQ(result.risk_score, expected.risk_score);
        EXPECT_EQ(result.label, expected.label);
        EXPECT_EQ(result.reasons, expected.reasons);
        EXPECT_TRUE(result.breach.offline_hit);
    }
}

} // namespace
} // namespace breachguard
