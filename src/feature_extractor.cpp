// feature_extractor.cpp
#include "breachguard/feature_extractor.hpp"

#include <algorithm> // For std::ranges::any_of
#include <cctype>    // For std::islower, std::isupper, std::isdigit
#include <cstdlib>   // For std::abs

#include <fmt/format.h>

#include "breachguard/normalizer.hpp"
#include "breachguard/word_lists.hpp"

namespace breachguard {

auto count_character_classes(std::string_view password) noexcept -> int {
    bool has_lowercase{false};
    bool has_uppercase{false};
    bool has_digits{false};
    bool has_symbols{false};

    for (const char c : password) {
        const auto uc{static_cast<unsigned char>(c)};
        has_lowercase = has_lowercase || (std::islower(uc) != 0);
        has_uppercase = has_uppercase || (std::isupper(uc) != 0);
        has_digits = has_digits || (std::isdigit(uc) != 0);
        has_symbols = has_symbols || (std::isalnum(uc) == 0);
    }

    return static_cast<int>(has_lowercase) + static_cast<int>(has_uppercase) +
           static_cast<int>(has_digits) + static_cast<int>(has_symbols);
}

auto has_sequential_run(std::string_view password) -> bool {
    const auto characters{decode_utf8(password)};
    if (characters.length() < RUN_LENGTH) return false;

    for (std::size_t i{2}; i < characters.length(); ++i) {
        const auto step_1{static_cast<long>(characters[i - 1]) - static_cast<long>(characters[i - 2])};
        const auto step_2{static_cast<long>(characters[i]) - static_cast<long>(characters[i - 1])};

        if (step_1 == step_2 && std::abs(step_1) <= 1) {
            return true;
        }
    }

    // Keyboard walks, e.g. "qwe", "lkj", "890"
    const auto lowered{to_lower_ascii(password)};
    for (const auto row : words::keyboard_rows()) {
        for (std::size_t i{0}; i + RUN_LENGTH <= row.length(); ++i) {
            const auto window{row.substr(i, RUN_LENGTH)};
            const std::string reversed{window.rbegin(), window.rend()};

            if (lowered.contains(window) || lowered.contains(reversed)) {
                return true;
            }
        }
    }

    return false;
}

auto has_repeated_run(std::string_view password) -> bool {
    const auto characters{decode_utf8(password)};
    std::size_t run{1};
    for (std::size_t i{1}; i < characters.length(); ++i) {
        run = (characters[i] == characters[i - 1]) ? run + 1 : 1;
        if (run >= RUN_LENGTH) return true;
    }
    return false;
}

FeatureExtractor::FeatureExtractor() {
    for (const auto word : words::common_words()) {
        dictionary_words_.emplace(word);
    }
}

FeatureExtractor::FeatureExtractor(const std::vector<std::string>& words) {
    for (const auto& word : words) {
        dictionary_words_.insert(to_lower_ascii(word));
    }
}

auto FeatureExtractor::extract(std::string_view password, const NormalizedForms& normalized) const
    -> std::vector<RiskFactor> {
    std::vector<RiskFactor> factors;
    factors.reserve(6);

    const auto length{decode_utf8(password).length()};
    const bool too_short{length < MIN_RECOMMENDED_LENGTH};
    factors.push_back(RiskFactor{
        .name = std::string{FACTOR_LENGTH},
        .weight = WEIGHT_LENGTH,
        .triggered = too_short,
        .polarity = FactorPolarity::RISK,
        .detail = too_short
            ? fmt::format("Too short ({} characters, {}+ recommended)", length, MIN_RECOMMENDED_LENGTH)
            : fmt::format("Length meets recommended minimum ({}+ characters)", MIN_RECOMMENDED_LENGTH),
    });

    const auto classes{count_character_classes(password)};
    const bool diverse{classes >= MIN_CHARACTER_CLASSES};
    factors.push_back(RiskFactor{
        .name = std::string{FACTOR_DIVERSITY},
        .weight = WEIGHT_DIVERSITY,
        .triggered = diverse,
        .polarity = FactorPolarity::STRENGTH,
        .detail = diverse
            ? fmt::format("Uses multiple character categories ({} of 4)", classes)
            : fmt::format("Limited character variety ({} of 4 categories)", classes),
    });

    const bool sequential{has_sequential_run(password)};
    factors.push_back(RiskFactor{
        .name = std::string{FACTOR_SEQUENTIAL},
        .weight = WEIGHT_SEQUENTIAL,
        .triggered = sequential,
        .polarity = FactorPolarity::RISK,
        .detail = sequential ? "Contains sequential or keyboard patterns"
                             : "No sequential or keyboard patterns",
    });

    const bool repeated{has_repeated_run(password)};
    factors.push_back(RiskFactor{
        .name = std::string{FACTOR_REPEATED},
        .weight = WEIGHT_REPEATED,
        .triggered = repeated,
        .polarity = FactorPolarity::RISK,
        .detail = repeated ? "Contains a character repeated three or more times in a row"
                           : "No repeated character runs",
    });

    const bool substituted{has_predictable_substitution(normalized)};
    factors.push_back(RiskFactor{
        .name = std::string{FACTOR_SUBSTITUTION},
        .weight = WEIGHT_SUBSTITUTION,
        .triggered = substituted,
        .polarity = FactorPolarity::RISK,
        .detail = substituted ? "Uses predictable substitutions of common words"
                              : "No predictable substitutions of common words",
    });

    const auto word{find_longest_word(normalized.desubstituted)};
    factors.push_back(RiskFactor{
        .name = std::string{FACTOR_DICTIONARY},
        .weight = WEIGHT_DICTIONARY,
        .triggered = word.has_value(),
        .polarity = FactorPolarity::RISK,
        .detail = word ? fmt::format("Contains the common word \"{}\"", *word)
                       : "No common dictionary words",
    });

    return factors;
}

auto FeatureExtractor::find_longest_word(std::string_view text) const -> std::optional<std::string> {
    const std::string* best{nullptr};

    for (const auto& word : dictionary_words_) {
        if (word.length() < words::MIN_WORD_LENGTH || !text.contains(word)) continue;

        // Ties go to the lexicographically smallest word so the result never depends on hash order
        if (best == nullptr || word.length() > best->length() ||
            (word.length() == best->length() && word < *best)) {
            best = &word;
        }
    }

    if (best == nullptr) return std::nullopt;
    return *best;
}

auto FeatureExtractor::contains_word(std::string_view text) const noexcept -> bool {
    return std::ranges::any_of(dictionary_words_, [text](const std::string& word) {
        return word.length() >= words::MIN_WORD_LENGTH && text.contains(word);
    });
}

auto FeatureExtractor::has_predictable_substitution(const NormalizedForms& normalized) const noexcept -> bool {
    if (normalized.desubstituted == normalized.lowercase || !contains_word(normalized.desubstituted)) {
        return false;
    }

    // Only words revealed by the substitutions count; "password1" is not a substitution pattern
    return std::ranges::any_of(dictionary_words_, [&normalized](const std::string& word) {
        return word.length() >= words::MIN_WORD_LENGTH &&
               std::string_view{normalized.desubstituted}.contains(word) &&
               !std::string_view{normalized.lowercase}.contains(word);
    });
}

} // namespace breachguard
