// digest.hpp
#ifndef BREACHGUARD_DIGEST_HPP
#define BREACHGUARD_DIGEST_HPP

#include <string>      // For std::string
#include <string_view> // For std::string_view

namespace breachguard {

inline constexpr std::size_t SHA1_HEX_LENGTH{40};

/// @brief SHA-1 of `data` as 40 uppercase hexadecimal characters (OpenSSL EVP).
/// @note The result is secret material when `data` is a password; never log or transmit it.
[[nodiscard]] auto sha1_hex(std::string_view data) -> std::string;

} // namespace breachguard

#endif // BREACHGUARD_DIGEST_HPP
