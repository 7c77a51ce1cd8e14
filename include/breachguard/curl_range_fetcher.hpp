// curl_range_fetcher.hpp
#ifndef BREACHGUARD_CURL_RANGE_FETCHER_HPP
#define BREACHGUARD_CURL_RANGE_FETCHER_HPP

#include <string> // For std::string

#include "breachguard/range_fetcher.hpp"

namespace breachguard {

/**
 * @brief Production `RangeFetcher` issuing `GET {endpoint}/{prefix}` with libcurl.
 * @approach One easy handle per request; total transfer time bounded by `CURLOPT_TIMEOUT_MS`,
 * TLS peer verification left on, cancellation polled from the transfer progress callback.
 * Non-2xx responses are failures, as is a non-positive timeout.
 */
class CurlRangeFetcher final : public RangeFetcher {
private:
    std::string endpoint_;
    std::string user_agent_;
    bool add_padding_;

public:
    CurlRangeFetcher(std::string endpoint, std::string user_agent, bool add_padding);

    [[nodiscard]] auto fetch_range(std::string_view prefix, std::chrono::milliseconds timeout,
                                   std::stop_token stop) -> std::expected<std::string, std::string> override;
};

} // namespace breachguard

#endif // BREACHGUARD_CURL_RANGE_FETCHER_HPP
