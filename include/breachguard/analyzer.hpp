// analyzer.hpp
#ifndef BREACHGUARD_ANALYZER_HPP
#define BREACHGUARD_ANALYZER_HPP

#include <chrono>      // For std::chrono::milliseconds
#include <expected>    // For std::expected
#include <memory>      // For std::shared_ptr
#include <stop_token>  // For std::stop_token
#include <string>      // For std::string
#include <string_view> // For std::string_view

#include "breachguard/breach_corpus.hpp"
#include "breachguard/config.hpp"
#include "breachguard/feature_extractor.hpp"
#include "breachguard/online_lookup.hpp"
#include "breachguard/risk_scorer.hpp"
#include "breachguard/types.hpp"

namespace breachguard {

/**
 * @brief Password risk and breach intelligence engine.
 * @intuition An offline verdict is always available; the network only ever adds evidence, so
 * every external failure degrades into a recorded "unknown" rather than an error.
 * @approach normalize -> extract factors -> offline match -> optional online lookup -> score
 * (breach floor applied) -> suggestions -> assemble an immutable `AnalysisResult`.
 * @complexity Time: O(N * D) for the heuristics plus one bounded network round trip when the
 * online lookup is enabled. Space: O(N + S) per call.
 */
class PasswordRiskAnalyzer final {
private:
    EngineConfig config_;
    std::shared_ptr<const CorpusLoader> corpus_loader_;
    OnlineBreachLookup online_lookup_;
    FeatureExtractor extractor_;
    RiskScorer scorer_;

public:
    /// @brief Production wiring: process-wide lazily loaded corpus and a libcurl range fetcher.
    explicit PasswordRiskAnalyzer(EngineConfig config);

    /// @brief Explicit wiring, used by tests and embedders.
    PasswordRiskAnalyzer(EngineConfig config, std::shared_ptr<const CorpusLoader> corpus_loader,
                         std::shared_ptr<RangeFetcher> fetcher);

    /// @brief Analyzes one password. Any string, including the empty one, is valid input.
    /// Only the online lookup may block, and only for about `config.lookup_timeout`.
    [[nodiscard]] auto analyze(std::string_view password, bool enable_online, std::stop_token stop = {}) const
        -> AnalysisResult;

    /// @brief Validates a structured request, then analyzes it.
    /// @return The result, or an error if the request is malformed (e.g. missing `password`).
    [[nodiscard]] auto analyze(const AnalysisRequest& request, std::stop_token stop = {}) const
        -> std::expected<AnalysisResult, std::string>;

    [[nodiscard]] auto config() const noexcept -> const EngineConfig& { return config_; }

private:
    [[nodiscard]] auto run(std::string_view password, bool enable_online, std::chrono::milliseconds timeout,
                           std::stop_token stop) const -> AnalysisResult;
};

} // namespace breachguard

#endif // BREACHGUARD_ANALYZER_HPP
