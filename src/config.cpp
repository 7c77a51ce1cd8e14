// config.cpp
#include "breachguard/config.hpp"

#include <charconv>     // For std::from_chars
#include <cstdlib>      // For std::getenv
#include <string_view>  // For std::string_view
#include <system_error> // For std::errc

#include <fmt/format.h>

#ifndef BREACHGUARD_DATA_DIR
#define BREACHGUARD_DATA_DIR "data"
#endif

namespace breachguard {

namespace {

template <typename Integer>
[[nodiscard]] auto parse_bounded(std::string_view name, std::string_view text, Integer low, Integer high)
    -> std::expected<Integer, std::string> {
    Integer value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::unexpected(fmt::format("{}: '{}' is not an integer", name, text));
    }
    if (value < low || value > high) {
        return std::unexpected(fmt::format("{}: {} is outside [{}, {}]", name, value, low, high));
    }
    return value;
}

[[nodiscard]] auto split_paths(std::string_view list) -> std::vector<std::filesystem::path> {
    std::vector<std::filesystem::path> paths;
    while (!list.empty()) {
        const auto colon{list.find(':')};
        const auto item{list.substr(0, colon)};
        if (!item.empty()) {
            paths.emplace_back(item);
        }
        list = (colon == std::string_view::npos) ? std::string_view{} : list.substr(colon + 1);
    }
    return paths;
}

} // namespace

auto default_data_dir() -> std::filesystem::path {
    return std::filesystem::path{BREACHGUARD_DATA_DIR};
}

auto default_corpus_paths() -> std::vector<std::filesystem::path> {
    const auto dir{default_data_dir()};
    return {dir / "breached_passwords.txt", dir / "rockyou.txt"};
}

auto load_config(const EnvironmentReader& read_env) -> std::expected<EngineConfig, std::string> {
    EngineConfig config;

    if (const auto corpus{read_env("BREACHGUARD_CORPUS")}) {
        config.corpus_paths = split_paths(*corpus);
    }

    if (const auto endpoint{read_env("BREACHGUARD_RANGE_ENDPOINT")}) {
        if (!endpoint->starts_with("https://") && !endpoint->starts_with("http://")) {
            return std::unexpected(fmt::format("BREACHGUARD_RANGE_ENDPOINT: '{}' is not an http(s) URL", *endpoint));
        }
        config.range_endpoint = *endpoint;
    }

    if (const auto timeout{read_env("BREACHGUARD_TIMEOUT_MS")}) {
        const auto ms{parse_bounded<long>("BREACHGUARD_TIMEOUT_MS", *timeout, 1, 60000)};
        if (!ms) return std::unexpected(ms.error());
        config.lookup_timeout = std::chrono::milliseconds{*ms};
    }

    if (const auto count{read_env("BREACHGUARD_SUGGESTIONS")}) {
        const auto parsed{parse_bounded<std::size_t>("BREACHGUARD_SUGGESTIONS", *count, 1, 16)};
        if (!parsed) return std::unexpected(parsed.error());
        config.suggestion_count = *parsed;
    }

    if (const auto padding{read_env("BREACHGUARD_ADD_PADDING")}) {
        if (*padding != "0" && *padding != "1") {
            return std::unexpected(fmt::format("BREACHGUARD_ADD_PADDING: expected 0 or 1, got '{}'", *padding));
        }
        config.add_padding = (*padding == "1");
    }

    if (const auto level_name{read_env("BREACHGUARD_LOG_LEVEL")}) {
        const auto level{parse_log_level(*level_name)};
        if (!level) {
            return std::unexpected(fmt::format("BREACHGUARD_LOG_LEVEL: unknown level '{}'", *level_name));
        }
        config.log_level = *level;
    }

    return config;
}

auto load_config_from_env() -> std::expected<EngineConfig, std::string> {
    return load_config([](const char* name) -> std::optional<std::string> {
        if (const char* value = std::getenv(name)) {
            return std::string{value};
        }
        return std::nullopt;
    });
}

} // namespace breachguard
