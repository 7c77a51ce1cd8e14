// curl_range_fetcher.cpp
#include "breachguard/curl_range_fetcher.hpp"

#include <memory>  // For std::unique_ptr
#include <mutex>   // For std::call_once
#include <utility> // For std::move

#include <curl/curl.h>
#include <fmt/format.h>

#include "breachguard/log.hpp"

namespace breachguard {

namespace {

/// Range bodies are ~30-40 KiB; anything far larger is not a range response.
constexpr std::size_t MAX_BODY_BYTES{4 * 1024 * 1024};

struct TransferState {
    std::string body;
    std::stop_token stop;
};

using EasyHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

auto ensure_curl_initialized() -> bool {
    static std::once_flag once;
    static CURLcode init_result{CURLE_OK};
    std::call_once(once, [] { init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
    return init_result == CURLE_OK;
}

auto write_callback(char* data, std::size_t size, std::size_t nmemb, void* userdata) -> std::size_t {
    auto* state{static_cast<TransferState*>(userdata)};
    const auto bytes{size * nmemb};

    if (state->body.size() + bytes > MAX_BODY_BYTES) [[unlikely]] {
        return 0; // Aborts the transfer with CURLE_WRITE_ERROR
    }
    state->body.append(data, bytes);
    return bytes;
}

auto progress_callback(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) -> int {
    const auto* state{static_cast<const TransferState*>(userdata)};
    return state->stop.stop_requested() ? 1 : 0;
}

} // namespace

CurlRangeFetcher::CurlRangeFetcher(std::string endpoint, std::string user_agent, bool add_padding)
    : endpoint_{std::move(endpoint)}, user_agent_{std::move(user_agent)}, add_padding_{add_padding} {
    while (endpoint_.ends_with('/')) {
        endpoint_.pop_back();
    }
}

auto CurlRangeFetcher::fetch_range(std::string_view prefix, std::chrono::milliseconds timeout,
                                   std::stop_token stop) -> std::expected<std::string, std::string> {
    if (prefix.length() != RANGE_PREFIX_LENGTH) [[unlikely]] {
        return std::unexpected(fmt::format("Range prefix must be {} characters", RANGE_PREFIX_LENGTH));
    }
    // libcurl treats a zero timeout as no timeout at all
    if (timeout <= std::chrono::milliseconds::zero()) {
        return std::unexpected(fmt::format("Range timeout must be positive, got {}ms", timeout.count()));
    }
    if (stop.stop_requested()) {
        return std::unexpected("Range request cancelled");
    }
    if (!ensure_curl_initialized()) {
        return std::unexpected("libcurl global initialization failed");
    }

    EasyHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        return std::unexpected("curl_easy_init failed");
    }

    HeaderList headers{nullptr, &curl_slist_free_all};
    if (add_padding_) {
        headers.reset(curl_slist_append(nullptr, "Add-Padding: true"));
    }

    TransferState state{.body = {}, .stop = std::move(stop)};
    const auto url{fmt::format("{}/{}", endpoint_, prefix)};

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, &progress_callback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &state);
    if (headers) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    }

    log_debug("Requesting breach range for prefix {}", prefix);

    if (const CURLcode res{curl_easy_perform(curl.get())}; res != CURLE_OK) {
        return std::unexpected(fmt::format("Range request failed: {}", curl_easy_strerror(res)));
    }

    long status{0};
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        return std::unexpected(fmt::format("Range request returned HTTP {}", status));
    }

    return std::move(state.body);
}

} // namespace breachguard
