// analyzer.cpp
#include "breachguard/analyzer.hpp"

#include <utility> // For std::move

#include "breachguard/curl_range_fetcher.hpp"
#include "breachguard/log.hpp"
#include "breachguard/normalizer.hpp"
#include "breachguard/suggestion_generator.hpp"

namespace breachguard {

PasswordRiskAnalyzer::PasswordRiskAnalyzer(EngineConfig config)
    : PasswordRiskAnalyzer(config,
                           CorpusLoader::process_wide(config.corpus_paths),
                           std::make_shared<CurlRangeFetcher>(config.range_endpoint, config.user_agent,
                                                              config.add_padding)) {}

PasswordRiskAnalyzer::PasswordRiskAnalyzer(EngineConfig config, std::shared_ptr<const CorpusLoader> corpus_loader,
                                           std::shared_ptr<RangeFetcher> fetcher)
    : config_{std::move(config)},
      corpus_loader_{std::move(corpus_loader)},
      online_lookup_{std::move(fetcher)} {}

auto PasswordRiskAnalyzer::analyze(std::string_view password, bool enable_online, std::stop_token stop) const
    -> AnalysisResult {
    return run(password, enable_online, config_.lookup_timeout, std::move(stop));
}

auto PasswordRiskAnalyzer::analyze(const AnalysisRequest& request, std::stop_token stop) const
    -> std::expected<AnalysisResult, std::string> {
    if (!request.password) [[unlikely]] {
        return std::unexpected("Malformed request: missing required field 'password'");
    }
    if (request.timeout && request.timeout->count() <= 0) [[unlikely]] {
        return std::unexpected("Malformed request: 'timeout' must be positive");
    }

    return run(*request.password, request.enable_online, request.timeout.value_or(config_.lookup_timeout),
               std::move(stop));
}

auto PasswordRiskAnalyzer::run(std::string_view password, bool enable_online, std::chrono::milliseconds timeout,
                               std::stop_token stop) const -> AnalysisResult {
    const auto normalized{normalize(password)};
    const auto factors{extractor_.extract(password, normalized)};

    const auto corpus{corpus_loader_ ? corpus_loader_->get() : std::make_shared<const BreachCorpus>()};

    BreachResult breach;
    breach.offline_hit = corpus->is_breached_offline(normalized);

    if (enable_online) {
        const auto online{online_lookup_.lookup_online(password, timeout, std::move(stop))};
        breach.online_requested = true;
        breach.online_checked = online.checked;
        breach.online_hit = online.hit;
        breach.online_count = online.count;
    }

    auto assessment{scorer_.score(factors, breach)};
    log_debug("Risk score {:.2f} ({})", assessment.risk_score, label_name(assessment.label));

    const SuggestionGenerator generator{extractor_, corpus, config_.suggestion_attempts};

    AnalysisResult result;
    result.password = std::string{password};
    result.risk_score = assessment.risk_score;
    result.label = assessment.label;
    result.reasons = std::move(assessment.reasons);
    result.suggestions = generator.generate(password, config_.suggestion_count);
    result.breach = breach;
    return result;
}

} // namespace breachguard
