// types.cpp
#include "breachguard/types.hpp"

#include <ranges> // For std::views::transform

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace breachguard {

auto json_escape(std::string_view text) -> std::string {
    std::string escaped;
    escaped.reserve(text.size() + 2);

    for (const char c : text) {
        switch (c) {
            case '"': escaped += R"(\")"; break;
            case '\\': escaped += R"(\\)"; break;
            case '\b': escaped += R"(\b)"; break;
            case '\f': escaped += R"(\f)"; break;
            case '\n': escaped += R"(\n)"; break;
            case '\r': escaped += R"(\r)"; break;
            case '\t': escaped += R"(\t)"; break;
            default: {
                if (static_cast<unsigned char>(c) < 0x20) {
                    escaped += fmt::format("\\u{:04x}", static_cast<unsigned int>(static_cast<unsigned char>(c)));
                } else {
                    escaped += c;
                }
            } break;
        }
    }

    return escaped;
}

auto AnalysisResult::to_json() const -> std::string {
    auto format_array = [](const std::vector<std::string>& arr) {
        std::vector<std::string> quoted;
        quoted.reserve(arr.size());
        for (const auto& item : arr | std::views::transform(json_escape)) {
            quoted.push_back(fmt::format(R"("{}")", item));
        }
        return fmt::format("{}", fmt::join(quoted, ", "));
    };

    const std::string breached_online{breach.online_checked ? (breach.online_hit ? "true" : "false") : "null"};
    const std::string hibp_count{(breach.online_hit && breach.online_count)
        ? fmt::format(",\n    \"hibp_count\": {}", *breach.online_count)
        : std::string{}};

    return fmt::format(R"({{
    "password": "{}",
    "risk_score": {:.2f},
    "label": "{}",
    "reasons": [{}],
    "suggestions": [{}],
    "breached_offline": {},
    "breached_online": {}{}
}})",
        json_escape(password), risk_score, label_name(), format_array(reasons), format_array(suggestions),
        breach.offline_hit ? "true" : "false", breached_online, hibp_count);
}

} // namespace breachguard
