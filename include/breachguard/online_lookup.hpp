// online_lookup.hpp
#ifndef BREACHGUARD_ONLINE_LOOKUP_HPP
#define BREACHGUARD_ONLINE_LOOKUP_HPP

#include <chrono>      // For std::chrono::milliseconds
#include <cstdint>     // For std::uint64_t
#include <expected>    // For std::expected
#include <memory>      // For std::shared_ptr
#include <optional>    // For std::optional
#include <stop_token>  // For std::stop_token
#include <string>      // For std::string
#include <string_view> // For std::string_view

#include "breachguard/range_fetcher.hpp"

namespace breachguard {

/// @brief Outcome of one k-anonymity lookup.
/// `checked == false` means the service gave no usable answer; `hit` is then always false.
struct OnlineLookupResult final {
    bool checked{false};
    bool hit{false};
    std::optional<std::uint64_t> count;
};

/// @brief Scans a `SUFFIX:COUNT` range body for `suffix` (case-insensitive).
/// @return The matching count (0 when no line matches, or when only a padding line with count 0
/// matches), or an error if any line is malformed.
/// @complexity Time: O(B) for a body of B bytes. Space: O(1).
[[nodiscard]] auto find_suffix_count(std::string_view body, std::string_view suffix)
    -> std::expected<std::uint64_t, std::string>;

/**
 * @brief Privacy-preserving breach lookup against a range endpoint.
 * @intuition The service learns only a 5-character hash prefix shared by hundreds of unrelated
 * passwords, so it cannot tell which one was queried.
 * @approach SHA-1 the password locally, send the prefix through the `RangeFetcher`, match the
 * 35-character suffix locally. Every failure degrades to `checked == false`.
 */
class OnlineBreachLookup final {
private:
    std::shared_ptr<RangeFetcher> fetcher_;

public:
    explicit OnlineBreachLookup(std::shared_ptr<RangeFetcher> fetcher);

    /// @brief Never throws for network or protocol failures; blocks at most about `timeout`.
    [[nodiscard]] auto lookup_online(std::string_view password, std::chrono::milliseconds timeout,
                                     std::stop_token stop = {}) const -> OnlineLookupResult;
};

} // namespace breachguard

#endif // BREACHGUARD_ONLINE_LOOKUP_HPP
