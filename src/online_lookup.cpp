// online_lookup.cpp
#include "breachguard/online_lookup.hpp"

#include <algorithm>    // For std::ranges::all_of, std::ranges::equal
#include <cctype>       // For std::isxdigit, std::toupper
#include <charconv>     // For std::from_chars
#include <stdexcept>    // For std::runtime_error
#include <system_error> // For std::errc
#include <utility>      // For std::move

#include <fmt/format.h>

#include "breachguard/digest.hpp"
#include "breachguard/log.hpp"

namespace breachguard {

namespace {

inline constexpr std::size_t SUFFIX_LENGTH{SHA1_HEX_LENGTH - RANGE_PREFIX_LENGTH};

[[nodiscard]] auto equals_ignore_case(std::string_view lhs, std::string_view rhs) noexcept -> bool {
    return std::ranges::equal(lhs, rhs, [](char a, char b) {
        return std::toupper(static_cast<unsigned char>(a)) == std::toupper(static_cast<unsigned char>(b));
    });
}

[[nodiscard]] auto trim_blanks(std::string_view text) noexcept -> std::string_view {
    const auto first{text.find_first_not_of(" \t")};
    if (first == std::string_view::npos) return {};
    return text.substr(first, text.find_last_not_of(" \t") - first + 1);
}

[[nodiscard]] auto is_hex(std::string_view text) noexcept -> bool {
    return std::ranges::all_of(text, [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

} // namespace

auto find_suffix_count(std::string_view body, std::string_view suffix)
    -> std::expected<std::uint64_t, std::string> {
    std::uint64_t found{0};
    std::size_t line_number{0};

    while (!body.empty()) {
        const auto newline{body.find('\n')};
        auto line{body.substr(0, newline)};
        body = (newline == std::string_view::npos) ? std::string_view{} : body.substr(newline + 1);
        ++line_number;

        if (line.ends_with('\r')) line.remove_suffix(1);
        if (line.empty()) continue;

        const auto colon{line.find(':')};
        if (colon == std::string_view::npos) {
            return std::unexpected(fmt::format("Range line {} has no ':' separator", line_number));
        }

        const auto line_suffix{trim_blanks(line.substr(0, colon))};
        const auto count_text{trim_blanks(line.substr(colon + 1))};
        if (line_suffix.length() != SUFFIX_LENGTH || !is_hex(line_suffix)) {
            return std::unexpected(fmt::format("Range line {} has an invalid hash suffix", line_number));
        }

        std::uint64_t count{0};
        const auto [ptr, ec] = std::from_chars(count_text.data(), count_text.data() + count_text.size(), count);
        if (ec != std::errc{} || ptr != count_text.data() + count_text.size() || count_text.empty()) {
            return std::unexpected(fmt::format("Range line {} has an invalid count", line_number));
        }

        // Keep scanning after a match so that a malformed tail still fails the whole body
        if (equals_ignore_case(line_suffix, suffix)) {
            found = count;
        }
    }

    return found;
}

OnlineBreachLookup::OnlineBreachLookup(std::shared_ptr<RangeFetcher> fetcher)
    : fetcher_{std::move(fetcher)} {}

auto OnlineBreachLookup::lookup_online(std::string_view password, std::chrono::milliseconds timeout,
                                       std::stop_token stop) const -> OnlineLookupResult {
    if (!fetcher_) {
        log_warn("Online breach lookup has no range fetcher configured");
        return {};
    }
    if (timeout <= std::chrono::milliseconds::zero()) {
        log_warn("Online breach lookup skipped: timeout must be positive, got {}ms", timeout.count());
        return {};
    }

    std::string digest;
    try {
        digest = sha1_hex(password);
    } catch (const std::runtime_error& e) {
        log_warn("Online breach lookup skipped: {}", e.what());
        return {};
    }

    const auto prefix{std::string_view{digest}.substr(0, RANGE_PREFIX_LENGTH)};
    const auto suffix{std::string_view{digest}.substr(RANGE_PREFIX_LENGTH)};

    const auto body{fetcher_->fetch_range(prefix, timeout, std::move(stop))};
    if (!body) {
        log_warn("Online breach lookup unavailable: {}", body.error());
        return {};
    }

    const auto count{find_suffix_count(*body, suffix)};
    if (!count) {
        log_warn("Online breach lookup returned a malformed body: {}", count.error());
        return {};
    }

    return OnlineLookupResult{
        .checked = true,
        .hit = *count > 0,
        .count = *count,
    };
}

} // namespace breachguard
