// suggestion_generator.cpp
#include "breachguard/suggestion_generator.hpp"

#include <algorithm> // For std::ranges::find, std::ranges::shuffle
#include <array>     // For std::array
#include <cctype>    // For std::isalpha, std::toupper, std::tolower
#include <cstdlib>   // For std::abs
#include <utility>   // For std::move

#include "breachguard/log.hpp"
#include "breachguard/normalizer.hpp"
#include "breachguard/word_lists.hpp"

namespace breachguard {

namespace {

constexpr std::string_view LOWERCASE{"abcdefghijklmnopqrstuvwxyz"};
constexpr std::string_view UPPERCASE{"ABCDEFGHIJKLMNOPQRSTUVWXYZ"};
constexpr std::string_view DIGITS{"0123456789"};
constexpr std::string_view SYMBOLS{"!#$%&*+-=?@^_~"};

[[nodiscard]] auto lower(char c) noexcept -> char {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

[[nodiscard]] auto upper(char c) noexcept -> char {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

/// True if `a` and `b` sit next to each other on a keyboard row (case-insensitive).
[[nodiscard]] auto keyboard_adjacent(char a, char b) noexcept -> bool {
    const auto la{lower(a)};
    const auto lb{lower(b)};
    for (const auto row : words::keyboard_rows()) {
        const auto pa{row.find(la)};
        const auto pb{row.find(lb)};
        if (pa != std::string_view::npos && pb != std::string_view::npos &&
            std::abs(static_cast<int>(pa) - static_cast<int>(pb)) == 1) {
            return true;
        }
    }
    return false;
}

/// A character may follow `prev` if no run of any kind can start from the pair.
[[nodiscard]] auto may_follow(char prev, char next) noexcept -> bool {
    const auto diff{static_cast<unsigned char>(next) - static_cast<unsigned char>(prev)};
    return std::abs(diff) > 1 && !keyboard_adjacent(prev, next);
}

[[nodiscard]] auto vary_case(std::string_view word, SecureRandom& rng) -> std::string {
    std::string varied;
    varied.reserve(word.size());
    for (const char c : word) {
        varied.push_back(rng.below(3) == 0 ? upper(c) : lower(c));
    }
    return varied;
}

[[nodiscard]] auto capitalize(std::string_view word) -> std::string {
    std::string capitalized{word};
    if (!capitalized.empty()) {
        capitalized.front() = upper(capitalized.front());
    }
    return capitalized;
}

} // namespace

SuggestionGenerator::SuggestionGenerator(const FeatureExtractor& extractor,
                                         std::shared_ptr<const BreachCorpus> corpus,
                                         int attempts_per_candidate)
    : extractor_{extractor},
      corpus_{corpus ? std::move(corpus) : std::make_shared<const BreachCorpus>()},
      attempts_per_candidate_{std::max(0, attempts_per_candidate)} {}

auto SuggestionGenerator::generate(std::string_view password, std::size_t count) const
    -> std::vector<std::string> {
    SecureRandom rng;
    std::vector<std::string> suggestions;
    suggestions.reserve(count);

    // A detected word only seeds suggestions if it cannot itself break the run constraints
    std::string base_word;
    if (const auto detected{extractor_.find_longest_word(normalize(password).desubstituted)};
        detected && !has_sequential_run(*detected) && !has_repeated_run(*detected)) {
        base_word = *detected;
    }

    for (std::size_t i{0}; i < count; ++i) {
        bool accepted{false};

        for (int attempt{0}; attempt < attempts_per_candidate_ && !accepted; ++attempt) {
            auto candidate{compose_candidate(base_word, rng)};
            if (accept(candidate, password, suggestions)) {
                suggestions.push_back(std::move(candidate));
                accepted = true;
            }
        }

        for (int attempt{0}; attempt < MAX_FALLBACK_ATTEMPTS && !accepted; ++attempt) {
            auto candidate{random_strong_password(rng)};
            if (accept(candidate, password, suggestions)) {
                suggestions.push_back(std::move(candidate));
                accepted = true;
            }
        }

        if (!accepted) [[unlikely]] {
            log_error("Could not produce suggestion {} of {} within the retry bound", i + 1, count);
        }
    }

    return suggestions;
}

auto SuggestionGenerator::meets_constraints(std::string_view candidate) const -> bool {
    if (candidate.length() < MIN_RECOMMENDED_LENGTH ||
        count_character_classes(candidate) < MIN_CHARACTER_CLASSES ||
        has_sequential_run(candidate) || has_repeated_run(candidate)) {
        return false;
    }

    const auto normalized{normalize(candidate)};
    if (corpus_->is_breached_offline(normalized)) {
        return false;
    }

    const auto factors{extractor_.extract(candidate, normalized)};
    return scorer_.score(factors, BreachResult{}).label == RiskLabel::LOW;
}

auto SuggestionGenerator::compose_candidate(std::string_view base_word, SecureRandom& rng) const -> std::string {
    const auto themed{words::themed_words()};
    const std::string_view first{base_word.empty() ? themed[rng.below(themed.size())] : base_word};

    std::string_view second{themed[rng.below(themed.size())]};
    while (second == first) {
        second = themed[rng.below(themed.size())];
    }

    std::string candidate{vary_case(first, rng)};
    candidate.push_back(rng.pick(SYMBOLS));
    candidate += capitalize(second);
    candidate.push_back(rng.pick(DIGITS));
    candidate.push_back(rng.pick(DIGITS));
    candidate.push_back(rng.pick(SYMBOLS));
    return candidate;
}

auto SuggestionGenerator::random_strong_password(SecureRandom& rng) -> std::string {
    std::array<std::string_view, 4> classes{LOWERCASE, UPPERCASE, DIGITS, SYMBOLS};
    std::ranges::shuffle(classes, rng);

    std::string password;
    password.reserve(FALLBACK_LENGTH);

    for (std::size_t i{0}; i < FALLBACK_LENGTH; ++i) {
        // First four positions cover every class once, the rest draw a class at random
        const auto alphabet{i < classes.size() ? classes[i] : classes[rng.below(classes.size())]};

        std::string allowed;
        for (const char c : alphabet) {
            if (password.empty() || may_follow(password.back(), c)) {
                allowed.push_back(c);
            }
        }
        password.push_back(rng.pick(allowed));
    }

    return password;
}

auto SuggestionGenerator::accept(const std::string& candidate, std::string_view password,
                                 std::span<const std::string> accepted) const -> bool {
    return candidate != password &&
           std::ranges::find(accepted, candidate) == accepted.end() &&
           meets_constraints(candidate);
}

} // namespace breachguard
