// suggestion_generator.hpp
#ifndef BREACHGUARD_SUGGESTION_GENERATOR_HPP
#define BREACHGUARD_SUGGESTION_GENERATOR_HPP

#include <memory>      // For std::shared_ptr
#include <span>        // For std::span
#include <string>      // For std::string
#include <string_view> // For std::string_view
#include <vector>      // For std::vector

#include "breachguard/breach_corpus.hpp"
#include "breachguard/feature_extractor.hpp"
#include "breachguard/risk_scorer.hpp"
#include "breachguard/secure_random.hpp"

namespace breachguard {

/**
 * @brief Proposes replacement passwords that pass the same checks the scorer enforces.
 * @intuition A suggestion that echoes the user's word but buries it among unrelated tokens is
 * easier to adopt than pure noise, as long as it still clears every constraint.
 * @approach Per candidate: compose a themed token (input's dictionary word if any, another
 * themed word, random symbols and digits, varied casing) and retry a bounded number of times;
 * when the bound is exhausted, emit a run-free random password built so it cannot contain a
 * sequential, keyboard or repeated run.
 * @complexity Time: O(C * R * N * D) for C candidates, R retries, length N, D dictionary words.
 */
class SuggestionGenerator final {
private:
    const FeatureExtractor& extractor_;
    RiskScorer scorer_;
    std::shared_ptr<const BreachCorpus> corpus_;
    int attempts_per_candidate_;

public:
    static constexpr int DEFAULT_ATTEMPTS_PER_CANDIDATE{32};
    static constexpr int MAX_FALLBACK_ATTEMPTS{8};
    static constexpr std::size_t FALLBACK_LENGTH{16};
    static constexpr std::size_t DEFAULT_COUNT{3};

    /// @param extractor Must outlive the generator.
    SuggestionGenerator(const FeatureExtractor& extractor, std::shared_ptr<const BreachCorpus> corpus,
                        int attempts_per_candidate = DEFAULT_ATTEMPTS_PER_CANDIDATE);

    /// @brief Returns `count` distinct suggestions, none equal to `password`.
    [[nodiscard]] auto generate(std::string_view password, std::size_t count = DEFAULT_COUNT) const
        -> std::vector<std::string>;

    /// @brief True if `candidate` satisfies every suggestion constraint: length, classes, no runs,
    /// low heuristic risk, and absence from the offline corpus.
    [[nodiscard]] auto meets_constraints(std::string_view candidate) const -> bool;

private:
    [[nodiscard]] auto compose_candidate(std::string_view base_word, SecureRandom& rng) const -> std::string;
    [[nodiscard]] static auto random_strong_password(SecureRandom& rng) -> std::string;
    [[nodiscard]] auto accept(const std::string& candidate, std::string_view password,
                              std::span<const std::string> accepted) const -> bool;
};

} // namespace breachguard

#endif // BREACHGUARD_SUGGESTION_GENERATOR_HPP
