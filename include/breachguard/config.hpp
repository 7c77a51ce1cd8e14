// config.hpp
#ifndef BREACHGUARD_CONFIG_HPP
#define BREACHGUARD_CONFIG_HPP

#include <chrono>     // For std::chrono::milliseconds
#include <expected>   // For std::expected
#include <filesystem> // For std::filesystem::path
#include <functional> // For std::function
#include <optional>   // For std::optional
#include <string>     // For std::string
#include <vector>     // For std::vector

#include "breachguard/log.hpp"

namespace breachguard {

/// @brief Directory holding the bundled corpus files, fixed at build time.
/// Absolute unless the build left `BREACHGUARD_DATA_DIR` undefined.
[[nodiscard]] auto default_data_dir() -> std::filesystem::path;

/// `breached_passwords.txt` and `rockyou.txt` under `default_data_dir()`.
[[nodiscard]] auto default_corpus_paths() -> std::vector<std::filesystem::path>;

/// @brief Engine settings; defaults match the public breach-intelligence range service.
struct EngineConfig final {
    std::vector<std::filesystem::path> corpus_paths{default_corpus_paths()};
    std::string range_endpoint{"https://api.pwnedpasswords.com/range"};
    std::string user_agent{"breachguard-password-analyzer"};
    std::chrono::milliseconds lookup_timeout{5000};
    std::size_t suggestion_count{3};
    int suggestion_attempts{32};
    bool add_padding{true};
    LogLevel log_level{LogLevel::WARN};
};

/// Reads one environment variable; `std::nullopt` when unset.
using EnvironmentReader = std::function<std::optional<std::string>(const char*)>;

/// @brief Applies `BREACHGUARD_*` overrides on top of the defaults.
/// @return The configuration, or a message naming the offending variable.
[[nodiscard]] auto load_config(const EnvironmentReader& read_env) -> std::expected<EngineConfig, std::string>;

/// @brief `load_config` over the process environment.
[[nodiscard]] auto load_config_from_env() -> std::expected<EngineConfig, std::string>;

} // namespace breachguard

#endif // BREACHGUARD_CONFIG_HPP
