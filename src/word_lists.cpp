// word_lists.cpp
#include "breachguard/word_lists.hpp"

#include <array> // For std::array

namespace breachguard::words {

namespace {

constexpr std::array COMMON_WORDS = std::to_array<std::string_view>({
    // Frequent password words
    "password", "passwd", "admin", "welcome", "monkey", "dragon", "master", "freedom",
    "whatever", "secret", "summer", "winter", "flower", "shadow", "champion", "princess",
    "orange", "starwars", "computer", "love", "hello", "angel", "sunshine", "football",
    "baseball", "soccer", "hockey", "lovely", "letmein", "trustno", "iloveyou", "qwerty",
    "login", "access", "superman", "batman", "pokemon", "cheese", "chocolate", "cookie",
    "killer", "hunter", "ranger", "tigger", "butterfly", "purple", "silver", "golden",
    "diamond", "mustang", "ferrari", "harley", "matrix", "ninja", "pirate", "cowboy",
    "guitar", "music", "money", "happy", "lucky", "magic", "dolphin", "spider", "eagle",
    "phoenix", "thunder", "internet", "google", "apple", "banana", "cherry", "peanut",
    "blue", "black", "green", "yellow", "friend", "family", "mother", "father", "baby",
    "sweet", "heart", "star", "moon", "king", "queen", "boss", "user", "test", "guest",
    "root", "default", "changeme", "company", "office", "school", "spring", "autumn",
    // Common first names
    "michael", "jennifer", "jessica", "michelle", "maggie", "charlie", "jordan", "thomas",
    "daniel", "andrew", "robert", "joshua", "matthew", "ashley", "amanda", "nicole",
    "anthony", "william", "george", "david", "james", "john", "sarah", "emma", "olivia",
    "sophie", "lucas", "oliver", "jack", "harry", "anna", "maria", "alex", "chris", "peter",
});

// Neutral words for suggestions; none of them contains a three-character run.
constexpr std::array THEMED_WORDS = std::to_array<std::string_view>({
    "orbit", "cobalt", "harbor", "falcon", "ember", "sage", "vivid", "lantern", "meadow",
    "glacier", "comet", "willow", "tundra", "basalt", "saffron", "quiver", "marble", "canyon",
    "juniper", "nimbus", "pebble", "ripple", "zephyr", "granite",
});

constexpr std::array KEYBOARD_ROWS = std::to_array<std::string_view>({
    "qwertyuiop",
    "asdfghjkl",
    "zxcvbnm",
    "1234567890",
});

} // namespace

auto common_words() noexcept -> std::span<const std::string_view> {
    return COMMON_WORDS;
}

auto themed_words() noexcept -> std::span<const std::string_view> {
    return THEMED_WORDS;
}

auto keyboard_rows() noexcept -> std::span<const std::string_view> {
    return KEYBOARD_ROWS;
}

} // namespace breachguard::words
