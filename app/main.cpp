// main.cpp
// breachguard: prints the JSON risk verdict for one password.
#include <chrono>      // For std::chrono::milliseconds
#include <charconv>    // For std::from_chars
#include <cstdio>      // For stdout, stderr
#include <iostream>    // For std::cin, std::getline
#include <optional>    // For std::optional
#include <span>        // For std::span
#include <string>      // For std::string
#include <string_view> // For std::string_view
#include <system_error> // For std::errc
#include <utility>     // For std::move

#include <termios.h>
#include <unistd.h>

#include <fmt/format.h>

#include "breachguard/analyzer.hpp"
#include "breachguard/config.hpp"
#include "breachguard/log.hpp"

namespace {

constexpr int EXIT_USAGE{2};

void print_usage() {
    fmt::print(stderr,
               "Usage: breachguard [--online] [--timeout-ms N] [--password PASSWORD]\n"
               "  --online         Check the password against the k-anonymity range service\n"
               "  --timeout-ms N   Bound the online lookup to N milliseconds\n"
               "  --password P     Password to analyze (discouraged on shared systems)\n"
               "Without --password the password is read from the terminal without echo.\n");
}

/// Reads one line from stdin, disabling terminal echo while doing so.
auto prompt_password() -> std::optional<std::string> {
    const bool interactive{::isatty(STDIN_FILENO) == 1};
    termios saved{};
    bool echo_disabled{false};

    if (interactive) {
        fmt::print(stderr, "Enter password to analyze: ");
        if (::tcgetattr(STDIN_FILENO, &saved) == 0) {
            termios silent{saved};
            silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            echo_disabled = ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent) == 0;
        }
        if (!echo_disabled) {
            breachguard::log_warn("Could not disable terminal echo");
        }
    }

    std::string password;
    const bool ok{static_cast<bool>(std::getline(std::cin, password))};

    if (echo_disabled && ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved) != 0) {
        breachguard::log_warn("Could not restore terminal echo");
    }
    if (interactive) {
        fmt::print(stderr, "\n");
    }

    if (!ok) return std::nullopt;
    return password;
}

} // namespace

auto main(int argc, char** argv) -> int {
    using namespace breachguard;

    auto config{load_config_from_env()};
    if (!config) {
        fmt::print(stderr, "Invalid configuration: {}\n", config.error());
        return EXIT_USAGE;
    }
    set_log_level(config->log_level);

    AnalysisRequest request;
    const std::span args{argv + 1, static_cast<std::size_t>(argc > 0 ? argc - 1 : 0)};

    for (std::size_t i{0}; i < args.size(); ++i) {
        const std::string_view arg{args[i]};

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg == "--online") {
            request.enable_online = true;
        } else if ((arg == "--password" || arg == "--timeout-ms") && i + 1 < args.size()) {
            const std::string_view value{args[++i]};
            if (arg == "--password") {
                request.password = std::string{value};
                continue;
            }

            long ms{0};
            const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), ms);
            if (ec != std::errc{} || ptr != value.data() + value.size() || ms <= 0) {
                fmt::print(stderr, "Invalid --timeout-ms value '{}'\n", value);
                return EXIT_USAGE;
            }
            request.timeout = std::chrono::milliseconds{ms};
        } else {
            fmt::print(stderr, "Unknown or incomplete argument '{}'\n", arg);
            print_usage();
            return EXIT_USAGE;
        }
    }

    if (!request.password) {
        request.password = prompt_password();
    }

    const PasswordRiskAnalyzer analyzer{*std::move(config)};
    const auto result{analyzer.analyze(request)};
    if (!result) {
        fmt::print(stderr, "{}\n", result.error());
        return EXIT_USAGE;
    }

    fmt::print("{}\n", result->to_json());
    return 0;
}
