// types.hpp
#ifndef BREACHGUARD_TYPES_HPP
#define BREACHGUARD_TYPES_HPP

#include <array>         // For std::array
#include <chrono>        // For std::chrono::milliseconds
#include <cstdint>       // For std::uint8_t, std::uint64_t
#include <functional>    // For std::hash, std::equal_to
#include <optional>      // For std::optional
#include <string>        // For std::string
#include <string_view>   // For std::string_view
#include <unordered_set> // For std::unordered_set
#include <utility>       // For std::to_underlying
#include <vector>        // For std::vector

namespace breachguard {

/// @brief Discrete risk levels reported to callers.
enum class RiskLabel : std::uint8_t {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2
};

/// @brief Returns the lowercase wire name of a risk label ("low", "medium", "high").
[[nodiscard]] constexpr auto label_name(RiskLabel label) noexcept -> std::string_view {
    constexpr std::array names{"low", "medium", "high"};
    return names[static_cast<std::size_t>(std::to_underlying(label))];
}

/// @brief Custom transparent hasher for heterogeneous string lookups in unordered containers.
/// @intuition Allows `std::unordered_set<std::string>` to be queried with `std::string_view`
/// without materializing a temporary `std::string` per lookup.
struct TransparentStringHasher {
    using is_transparent = void;

    [[nodiscard]] auto operator()(std::string_view sv) const noexcept -> std::size_t {
        return std::hash<std::string_view>{}(sv);
    }

    [[nodiscard]] auto operator()(const std::string& s) const noexcept -> std::size_t {
        return std::hash<std::string_view>{}(s);
    }

    [[nodiscard]] auto operator()(const char* s) const noexcept -> std::size_t {
        return std::hash<std::string_view>{}(std::string_view{s});
    }
};

/// @brief Alias for an unordered set that supports transparent lookups.
using TransparentStringSet = std::unordered_set<std::string, TransparentStringHasher, std::equal_to<>>;

/// @brief Comparison forms of one password, computed once per analysis.
struct NormalizedForms final {
    std::string lowercase;     ///< ASCII-lowercased password.
    std::string desubstituted; ///< Lowercase form with leetspeak substitutions reversed.
};

/// @brief Direction in which a triggered factor moves the risk score.
enum class FactorPolarity : std::uint8_t {
    RISK = 0,    ///< Triggering adds the weight.
    STRENGTH = 1 ///< Triggering subtracts the weight; not triggering adds it.
};

/// @brief One named, weighted heuristic signal.
struct RiskFactor final {
    std::string name;
    double weight{0.0};
    bool triggered{false};
    FactorPolarity polarity{FactorPolarity::RISK};
    std::string detail; ///< Deterministic human-readable explanation.

    /// @brief Signed contribution of this factor to the raw accumulator.
    [[nodiscard]] constexpr auto contribution() const noexcept -> double {
        if (polarity == FactorPolarity::STRENGTH) {
            return triggered ? -weight : weight;
        }
        return triggered ? weight : 0.0;
    }
};

/// @brief Merged offline and online breach flags.
/// @note `online_checked == false` means "unknown", never "not breached".
struct BreachResult final {
    bool offline_hit{false};
    bool online_requested{false};
    bool online_checked{false};
    bool online_hit{false};
    std::optional<std::uint64_t> online_count;

    [[nodiscard]] constexpr auto any_hit() const noexcept -> bool {
        return offline_hit || online_hit;
    }
};

/// @brief Complete outcome of one analysis call.
struct AnalysisResult final {
    std::string password;
    double risk_score{0.0};
    RiskLabel label{RiskLabel::LOW};
    std::vector<std::string> reasons;
    std::vector<std::string> suggestions;
    BreachResult breach;

    [[nodiscard]] auto label_name() const noexcept -> std::string_view {
        return breachguard::label_name(label);
    }

    /// @brief Serializes the result as the flat JSON object consumed by tooling.
    /// @details Fields: password, risk_score, label, reasons, suggestions, breached_offline,
    /// breached_online (null when the lookup was not requested or failed) and hibp_count
    /// (present only on an online hit).
    [[nodiscard]] auto to_json() const -> std::string;
};

/// @brief Structured analysis request as received from a caller.
struct AnalysisRequest final {
    std::optional<std::string> password;
    bool enable_online{false};
    std::optional<std::chrono::milliseconds> timeout;
};

/// @brief Escapes a string for inclusion in a JSON string literal (without the quotes).
[[nodiscard]] auto json_escape(std::string_view text) -> std::string;

} // namespace breachguard

#endif // BREACHGUARD_TYPES_HPP
