// secure_random.hpp
#ifndef BREACHGUARD_SECURE_RANDOM_HPP
#define BREACHGUARD_SECURE_RANDOM_HPP

#include <cstdint>     // For std::uint32_t
#include <limits>      // For std::numeric_limits
#include <string_view> // For std::string_view

namespace breachguard {

/// @brief UniformRandomBitGenerator backed by OpenSSL's CSPRNG (`RAND_bytes`).
/// @note Throws `std::runtime_error` if the CSPRNG cannot produce output.
class SecureRandom final {
public:
    using result_type = std::uint32_t;

    [[nodiscard]] static constexpr auto min() noexcept -> result_type { return 0; }
    [[nodiscard]] static constexpr auto max() noexcept -> result_type {
        return std::numeric_limits<result_type>::max();
    }

    auto operator()() -> result_type;

    /// @brief Uniform index in [0, bound); `bound` must be positive.
    [[nodiscard]] auto below(std::size_t bound) -> std::size_t;

    /// @brief Uniformly chosen character of a non-empty alphabet.
    [[nodiscard]] auto pick(std::string_view alphabet) -> char {
        return alphabet[below(alphabet.size())];
    }
};

} // namespace breachguard

#endif // BREACHGUARD_SECURE_RANDOM_HPP
