// range_fetcher.hpp
#ifndef BREACHGUARD_RANGE_FETCHER_HPP
#define BREACHGUARD_RANGE_FETCHER_HPP

#include <chrono>      // For std::chrono::milliseconds
#include <expected>    // For std::expected
#include <stop_token>  // For std::stop_token
#include <string>      // For std::string
#include <string_view> // For std::string_view

namespace breachguard {

inline constexpr std::size_t RANGE_PREFIX_LENGTH{5};

/// @brief Transport seam of the k-anonymity lookup: "fetch range for prefix".
/// Implementations only ever see the 5-character hash prefix.
class RangeFetcher {
public:
    virtual ~RangeFetcher() = default;

    /// @brief Returns the raw `SUFFIX:COUNT` body for `prefix`, or a description of the failure.
    /// Must give up once `timeout` elapses or `stop` is requested.
    [[nodiscard]] virtual auto fetch_range(std::string_view prefix, std::chrono::milliseconds timeout,
                                           std::stop_token stop) -> std::expected<std::string, std::string> = 0;
};

} // namespace breachguard

#endif // BREACHGUARD_RANGE_FETCHER_HPP
