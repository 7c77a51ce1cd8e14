// digest.cpp
#include "breachguard/digest.hpp"

#include <array>     // For std::array
#include <iterator>  // For std::back_inserter
#include <stdexcept> // For std::runtime_error

#include <fmt/format.h>
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace breachguard {

auto sha1_hex(std::string_view data) -> std::string {
    std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
    unsigned int digest_length{0};

    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_length, EVP_sha1(), nullptr) != 1 ||
        digest_length != digest.size()) [[unlikely]] {
        throw std::runtime_error("EVP_Digest(SHA-1) failed");
    }

    std::string hex;
    hex.reserve(SHA1_HEX_LENGTH);
    for (const auto byte : digest) {
        fmt::format_to(std::back_inserter(hex), "{:02X}", byte);
    }
    return hex;
}

} // namespace breachguard
