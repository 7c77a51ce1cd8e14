// normalizer.hpp
#ifndef BREACHGUARD_NORMALIZER_HPP
#define BREACHGUARD_NORMALIZER_HPP

#include <string>      // For std::string, std::u32string
#include <string_view> // For std::string_view

#include "breachguard/types.hpp"

namespace breachguard {

/// @brief Decodes UTF-8 into code points.
/// Bytes that do not start a well-formed sequence decode to their own value, one character each.
/// @complexity Time: O(N). Space: O(N).
[[nodiscard]] auto decode_utf8(std::string_view text) -> std::u32string;

/// @brief Returns the ASCII-lowercased copy of `text`; non-ASCII bytes are kept as-is.
[[nodiscard]] auto to_lower_ascii(std::string_view text) -> std::string;

/// @brief Reverses common leetspeak substitutions in an already lowercased string.
/// @approach Greedy longest-token match against a fixed table, scanning left to right in a
/// single pass. Replaced characters are never re-examined.
/// @complexity Time: O(N * T) where T is the longest token length. Space: O(N).
[[nodiscard]] auto desubstitute(std::string_view lowercase) -> std::string;

/// @brief Computes both comparison forms of a password.
/// Any input is legal, including the empty string.
[[nodiscard]] auto normalize(std::string_view password) -> NormalizedForms;

} // namespace breachguard

#endif // BREACHGUARD_NORMALIZER_HPP
