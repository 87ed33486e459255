#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "util/utf8.hpp"

namespace utf8 = taktkb::utf8;

TEST(Utf8Test, LengthCountsCodePoints) {
    EXPECT_EQ(utf8::length(""), 0u);
    EXPECT_EQ(utf8::length("abc"), 3u);
    EXPECT_EQ(utf8::length("Straße"), 6u);
    EXPECT_EQ(utf8::length("€"), 1u);
    EXPECT_EQ(utf8::length("\xF0\x9F\x98\x80"), 1u);
}

TEST(Utf8Test, DecodeEncodeRoundTripForValidText) {
    const std::string text = "Müller-Straße 12 € \xF0\x9F\x98\x80";
    EXPECT_EQ(utf8::encode(utf8::decode(text)), text);
}

TEST(Utf8Test, MalformedBytesBecomeReplacementCharacters) {
    const std::vector<char32_t> expected = {'a', utf8::kReplacementChar, 'b',
                                            utf8::kReplacementChar};
    EXPECT_EQ(utf8::decode("a\xFF" "b\xC3"), expected);
    // Overlong encoding of '/'.
    EXPECT_EQ(utf8::decode("\xC0\xAF").front(), utf8::kReplacementChar);
}

TEST(Utf8Test, TrimHandlesUnicodeSpaces) {
    EXPECT_EQ(utf8::trim("  text \n"), "text");
    EXPECT_EQ(utf8::trim("\xC2\xA0Hallo\xE2\x80\x83"), "Hallo");
    EXPECT_EQ(utf8::trim(" \t\r\n "), "");
    EXPECT_EQ(utf8::trim("a b"), "a b");
}
