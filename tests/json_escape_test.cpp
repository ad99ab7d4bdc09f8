#include <array>
#include <string>

#include <gtest/gtest.h>

#include "spanwire/codec/json_escape.hpp"

namespace {
    // Escapes through the non-allocating path and checks the size contract.
    std::string escape_checked(const std::string& in) {
        const auto size = static_cast<spanwire::codec::u32>(spanwire::codec::json_escaped_size_in_bytes(in));
        std::string out(size + 4, '#');
        spanwire::codec::Buffer b({reinterpret_cast<spanwire::codec::u8*>(out.data()), size});
        spanwire::codec::json_escape(in, b);
        EXPECT_FALSE(b.overflowed()) << in;
        EXPECT_EQ(b.pos(), size) << in;
        EXPECT_EQ(out.substr(size), "####");
        out.resize(b.pos());
        return out;
    }
} // namespace

TEST(JsonEscape, PlainTextIsUnchanged) {
    EXPECT_EQ(spanwire::codec::json_escaped_size_in_bytes("get /api"), 8u);
    EXPECT_EQ(escape_checked("get /api"), "get /api");
    EXPECT_EQ(escape_checked(""), "");
}

TEST(JsonEscape, QuoteAndBackslash) {
    EXPECT_EQ(escape_checked("say \"hi\""), "say \\\"hi\\\"");
    EXPECT_EQ(escape_checked("C:\\tmp"), "C:\\\\tmp");
}

TEST(JsonEscape, ShortFormControlCharacters) {
    EXPECT_EQ(escape_checked("\b\f\n\r\t"), "\\b\\f\\n\\r\\t");
    EXPECT_EQ(spanwire::codec::json_escaped_size_in_bytes("a\nb"), 4u);
}

TEST(JsonEscape, OtherControlCharactersUseUnicodeEscapes) {
    EXPECT_EQ(escape_checked(std::string(1, '\x01')), "\\u" "0001");
    EXPECT_EQ(escape_checked(std::string(1, '\x1f')), "\\u" "001f");
    EXPECT_EQ(escape_checked(std::string("a\0b", 3)), "a\\u" "0000b");
    EXPECT_EQ(spanwire::codec::json_escaped_size_in_bytes(std::string(1, '\x0b')), 6u);
}

TEST(JsonEscape, MultiByteUtf8PassesThrough) {
    const std::string e_acute = "caf\xc3\xa9";
    const std::string emoji = "\xf0\x9f\x98\x80";
    EXPECT_EQ(spanwire::codec::json_escaped_size_in_bytes(e_acute), 5u);
    EXPECT_EQ(escape_checked(e_acute), e_acute);
    EXPECT_EQ(spanwire::codec::json_escaped_size_in_bytes(emoji), 4u);
    EXPECT_EQ(escape_checked(emoji), emoji);
}

TEST(JsonEscape, LineAndParagraphSeparatorsAreEscaped) {
    const std::string line_sep_escape = std::string("\\u") + "2028";
    const std::string para_sep_escape = std::string("\\u") + "2029";

    EXPECT_EQ(escape_checked("a\xe2\x80\xa8" "b"), "a" + line_sep_escape + "b");
    EXPECT_EQ(escape_checked("\xe2\x80\xa9"), para_sep_escape);
    // Same lead bytes, different code point (U+2026, ellipsis).
    EXPECT_EQ(escape_checked("\xe2\x80\xa6"), "\xe2\x80\xa6");
}

TEST(JsonEscape, MalformedUtf8KeepsSizeAndWriteInAgreement) {
    const std::array<std::string, 5> inputs = {{
        std::string("\xe2\x80", 2),          // truncated separator
        std::string("x\xe2", 2),             // lone lead byte at the end
        std::string("\xff\xfe\"\x80"),       // invalid bytes mixed with a quote
        std::string("\xc3"),
        std::string("\xe2\xe2\x80\xa8\x80"), // separator preceded by a stray lead
    }};
    for (const std::string& in : inputs) {
        (void)escape_checked(in);
    }
    EXPECT_EQ(escape_checked(std::string("\xe2\x80", 2)), std::string("\xe2\x80", 2));
}

TEST(JsonEscape, OwningVariantMatchesBufferVariant) {
    const std::string in = "tab\there \"quoted\" \\ \xc3\xa9\x01";
    EXPECT_EQ(spanwire::codec::json_escape(in), escape_checked(in));
    EXPECT_EQ(spanwire::codec::json_escape(in).size(), spanwire::codec::json_escaped_size_in_bytes(in));
}

TEST(JsonEscape, ShortRegionIsNeverExceeded) {
    std::string out(8, '#');
    spanwire::codec::Buffer b({reinterpret_cast<spanwire::codec::u8*>(out.data()), 3});
    spanwire::codec::json_escape("ab\"cd", b);
    EXPECT_TRUE(b.overflowed());
    EXPECT_LE(b.pos(), 3u);
    EXPECT_EQ(out.substr(3), "#####");
}
