// normalizer.cpp
#include "breachguard/normalizer.hpp"

#include <array>   // For std::array
#include <cctype>  // For std::tolower
#include <cstddef> // For std::size_t
#include <ranges>  // For std::views::transform
#include <utility> // For std::pair

namespace breachguard {

namespace {

/// Leetspeak tokens, longest first so that the first match at a position is the greedy one.
constexpr std::array<std::pair<std::string_view, char>, 22> SUBSTITUTIONS{{
    {R"(|-|)", 'h'},
    {R"(|\|)", 'n'},
    {R"(|<)", 'k'},
    {R"(())", 'o'},
    {R"(\/)", 'v'},
    {"@", 'a'},
    {"4", 'a'},
    {"8", 'b'},
    {"(", 'c'},
    {"3", 'e'},
    {"6", 'g'},
    {"9", 'g'},
    {"#", 'h'},
    {"!", 'i'},
    {"1", 'l'},
    {"|", 'l'},
    {"0", 'o'},
    {"$", 's'},
    {"5", 's'},
    {"7", 't'},
    {"+", 't'},
    {"2", 'z'},
}};

} // namespace

auto decode_utf8(std::string_view text) -> std::u32string {
    std::u32string decoded;
    decoded.reserve(text.size());

    std::size_t i{0};
    while (i < text.size()) {
        const auto lead{static_cast<unsigned char>(text[i])};

        std::size_t extra{0};
        char32_t value{lead};
        char32_t minimum{0};
        if (lead >= 0xF0 && lead <= 0xF4) {
            extra = 3;
            value = lead & 0x07;
            minimum = 0x10000;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            extra = 2;
            value = lead & 0x0F;
            minimum = 0x800;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            extra = 1;
            value = lead & 0x1F;
            minimum = 0x80;
        }

        bool valid{extra > 0 && i + extra < text.size()};
        for (std::size_t k{1}; valid && k <= extra; ++k) {
            const auto next{static_cast<unsigned char>(text[i + k])};
            if ((next & 0xC0) != 0x80) {
                valid = false;
            } else {
                value = (value << 6) | (next & 0x3F);
            }
        }
        valid = valid && value >= minimum && value <= 0x10FFFF && (value < 0xD800 || value > 0xDFFF);

        if (valid) {
            decoded.push_back(value);
            i += extra + 1;
        } else {
            // ASCII, or a stray byte counted on its own
            decoded.push_back(static_cast<char32_t>(lead));
            ++i;
        }
    }

    return decoded;
}

auto to_lower_ascii(std::string_view text) -> std::string {
    std::string lowered;
    lowered.reserve(text.size());
    for (const char c : text | std::views::transform([](char ch) {
             return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
         })) {
        lowered.push_back(c);
    }
    return lowered;
}

auto desubstitute(std::string_view lowercase) -> std::string {
    std::string result;
    result.reserve(lowercase.size());

    std::size_t i{0};
    while (i < lowercase.size()) {
        const auto rest{lowercase.substr(i)};
        bool replaced{false};

        for (const auto& [token, plain] : SUBSTITUTIONS) {
            if (rest.starts_with(token)) {
                result.push_back(plain);
                i += token.size();
                replaced = true;
                break;
            }
        }

        if (!replaced) {
            result.push_back(lowercase[i]);
            ++i;
        }
    }

    return result;
}

auto normalize(std::string_view password) -> NormalizedForms {
    NormalizedForms forms;
    forms.lowercase = to_lower_ascii(password);
    forms.desubstituted = desubstitute(forms.lowercase);
    return forms;
}

} // namespace breachguard
