// word_lists.hpp
#ifndef BREACHGUARD_WORD_LISTS_HPP
#define BREACHGUARD_WORD_LISTS_HPP

#include <span>        // For std::span
#include <string_view> // For std::string_view

namespace breachguard::words {

/// @brief Common dictionary words and names that show up in guessable passwords (lowercase).
[[nodiscard]] auto common_words() noexcept -> std::span<const std::string_view>;

/// @brief Neutral themed words used as suggestion base tokens (lowercase, no runs).
[[nodiscard]] auto themed_words() noexcept -> std::span<const std::string_view>;

/// @brief Keyboard rows scanned for adjacency runs, in both directions.
[[nodiscard]] auto keyboard_rows() noexcept -> std::span<const std::string_view>;

/// Only words at least this long count as dictionary hits.
inline constexpr std::size_t MIN_WORD_LENGTH{4};

} // namespace breachguard::words

#endif // BREACHGUARD_WORD_LISTS_HPP
