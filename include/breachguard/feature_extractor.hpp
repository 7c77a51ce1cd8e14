// feature_extractor.hpp
#ifndef BREACHGUARD_FEATURE_EXTRACTOR_HPP
#define BREACHGUARD_FEATURE_EXTRACTOR_HPP

#include <optional>    // For std::optional
#include <string>      // For std::string
#include <string_view> // For std::string_view
#include <vector>      // For std::vector

#include "breachguard/types.hpp"

namespace breachguard {

/// Fixed factor names, in extraction order.
inline constexpr std::string_view FACTOR_LENGTH{"length"};
inline constexpr std::string_view FACTOR_DIVERSITY{"character_diversity"};
inline constexpr std::string_view FACTOR_SEQUENTIAL{"sequential_run"};
inline constexpr std::string_view FACTOR_REPEATED{"repeated_run"};
inline constexpr std::string_view FACTOR_SUBSTITUTION{"predictable_substitution"};
inline constexpr std::string_view FACTOR_DICTIONARY{"dictionary_word"};

/// Fixed factor weights.
inline constexpr double WEIGHT_LENGTH{0.45};
inline constexpr double WEIGHT_DIVERSITY{0.25};
inline constexpr double WEIGHT_SEQUENTIAL{0.20};
inline constexpr double WEIGHT_REPEATED{0.20};
inline constexpr double WEIGHT_SUBSTITUTION{0.15};
inline constexpr double WEIGHT_DICTIONARY{0.25};

/// Measured in code points.
inline constexpr std::size_t MIN_RECOMMENDED_LENGTH{12};
inline constexpr int MIN_CHARACTER_CLASSES{3};
inline constexpr std::size_t RUN_LENGTH{3};

/// @brief Counts the distinct classes among lowercase, uppercase, digit and symbol.
/// @complexity Time: O(N). Space: O(1).
[[nodiscard]] auto count_character_classes(std::string_view password) noexcept -> int;

/// @brief True if three consecutive characters advance by a constant step of -1, 0 or +1,
/// or spell three adjacent keys of a keyboard row in either direction (case-insensitive).
/// Characters are UTF-8 code points, not bytes.
[[nodiscard]] auto has_sequential_run(std::string_view password) -> bool;

/// @brief True if any code point repeats at least three times in a row.
[[nodiscard]] auto has_repeated_run(std::string_view password) -> bool;

/**
 * @brief Derives the fixed list of risk factors from a password and its normalized forms.
 * @intuition Each factor is a cheap, explainable signal; combined they approximate how early a
 * password falls to a dictionary-plus-rules guessing attack.
 * @approach Evaluates, in fixed order: length, character diversity, sequential runs, repeated
 * runs, predictable substitutions, and dictionary containment. The output order never changes
 * so that reason strings stay deterministic.
 * @complexity Time: O(N * D) where D is the number of bundled words. Space: O(D).
 */
class FeatureExtractor final {
private:
    TransparentStringSet dictionary_words_; ///< Bundled words and names, lowercase.

public:
    /// @brief Builds the extractor over the bundled word list.
    FeatureExtractor();

    /// @brief Builds the extractor over a caller-supplied word list (lowercased on insert).
    explicit FeatureExtractor(const std::vector<std::string>& words);

    [[nodiscard]] auto extract(std::string_view password, const NormalizedForms& normalized) const
        -> std::vector<RiskFactor>;

    /// @brief Longest bundled word contained in `text`, if any.
    [[nodiscard]] auto find_longest_word(std::string_view text) const -> std::optional<std::string>;

    /// @brief True if `text` contains any bundled word; cheaper than `find_longest_word`.
    [[nodiscard]] auto contains_word(std::string_view text) const noexcept -> bool;

private:
    [[nodiscard]] auto has_predictable_substitution(const NormalizedForms& normalized) const noexcept -> bool;
};

} // namespace breachguard

#endif // BREACHGUARD_FEATURE_EXTRACTOR_HPP
