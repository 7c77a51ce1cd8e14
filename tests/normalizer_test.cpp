// normalizer_test.cpp
#include "breachguard/normalizer.hpp"

#include <array>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

namespace breachguard {
namespace {

TEST(NormalizerTest, LowercasesAsciiOnly) {
    EXPECT_EQ(to_lower_ascii("MyP@ssW0RD"), "myp@ssw0rd");
    EXPECT_EQ(to_lower_ascii("\xC3\x89t\xC3\xA9"), "\xC3\x89t\xC3\xA9");
}

TEST(NormalizerTest, ReversesCommonSubstitutions) {
    const auto forms{normalize("MyP@ssw0rd")};
    EXPECT_EQ(forms.lowercase, "myp@ssw0rd");
    EXPECT_EQ(forms.desubstituted, "mypassword");

    EXPECT_EQ(desubstitute("$3cr37"), "secret");
    EXPECT_EQ(desubstitute("dr4g0n"), "dragon");
    EXPECT_EQ(desubstitute("l3tm3!n"), "letmein");
}

// Multi-character tokens win over their single-character prefixes.
TEST(NormalizerTest, PrefersLongestTokenLeftToRight) {
    EXPECT_EQ(desubstitute("|-|ello"), "hello");
    EXPECT_EQ(desubstitute("c()()|<ie"), "cookie");
    EXPECT_EQ(desubstitute("|\\|inja"), "ninja");
    EXPECT_EQ(desubstitute("|-"), "l-");
    EXPECT_EQ(desubstitute("("), "c");
}

TEST(NormalizerTest, SinglePassDoesNotRescanOutput) {
    // "1" becomes "l"; the produced letter is never fed back into the table.
    EXPECT_EQ(desubstitute("11"), "ll");
    EXPECT_EQ(desubstitute("abc"), "abc");
}

TEST(NormalizerTest, DecodesUtf8CodePoints) {
    EXPECT_TRUE(decode_utf8("a\u00e9\u20ac\U0001F600") == U"a\u00e9\u20ac\U0001F600");
    EXPECT_TRUE(decode_utf8("").empty());
}

TEST(NormalizerTest, StrayBytesCountOnce) {
    // Truncated sequence, lone continuation byte, overlong encoding of '/'
    EXPECT_TRUE(decode_utf8(std::string_view{"\xC3", 1}) == std::u32string(1, U'\xC3'));
    EXPECT_TRUE(decode_utf8(std::string_view{"\x80" "a", 2}) == (std::u32string{U'\x80', U'a'}));
    EXPECT_EQ(decode_utf8(std::string_view{"\xC0\xAF", 2}).size(), 2u);
}

TEST(NormalizerTest, EmptyInputIsLegal) {
    const auto forms{normalize("")};
    EXPECT_TRUE(forms.lowercase.empty());
    EXPECT_TRUE(forms.desubstituted.empty());
}

TEST(NormalizerTest, LowercaseFormIsIdempotent) {
    constexpr std::array<std::string_view, 6> samples{
        "", "MyP@ssw0rd", "Tr0ub4dor&3xyz!Q", "aaaa1111", "|-|ELLO W0RLD", "\tMiXeD CaSe\n"};

    for (const auto sample : samples) {
        const auto once{normalize(sample)};
        const auto twice{normalize(once.lowercase)};
        EXPECT_EQ(twice.lowercase, once.lowercase) << sample;
        EXPECT_EQ(twice.desubstituted, once.desubstituted) << sample;
    }
}

} // namespace
} // namespace breachguard
