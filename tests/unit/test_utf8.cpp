#include <string>
#include <gtest/gtest.h>
#include "core/text/utf8.hpp"

namespace {

using warden::core::text::incomplete_tail_length;
using warden::core::text::is_valid_utf8;
using warden::core::text::sanitize_utf8;

TEST(Utf8Test, AcceptsAsciiAndMultiByteText) {
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("caf\xC3\xA9"));
    EXPECT_TRUE(is_valid_utf8("\xE4\xB8\xAD\xE6\x96\x87"));
    EXPECT_TRUE(is_valid_utf8("\xF0\x9F\x98\x80"));
}

TEST(Utf8Test, RejectsMalformedSequences) {
    EXPECT_FALSE(is_valid_utf8("\xFF"));
    EXPECT_FALSE(is_valid_utf8("\xC0\xAF"));          // overlong '/'
    EXPECT_FALSE(is_valid_utf8("\xED\xA0\x80"));      // surrogate
    EXPECT_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));  // past U+10FFFF
    EXPECT_FALSE(is_valid_utf8("abc\xE4\xB8"));       // cut short
}

TEST(Utf8Test, IncompleteTailLength) {
    EXPECT_EQ(incomplete_tail_length(""), 0u);
    EXPECT_EQ(incomplete_tail_length("abc"), 0u);
    EXPECT_EQ(incomplete_tail_length("caf\xC3\xA9"), 0u);
    EXPECT_EQ(incomplete_tail_length("caf\xC3"), 1u);
    EXPECT_EQ(incomplete_tail_length("x\xE4\xB8"), 2u);
    EXPECT_EQ(incomplete_tail_length("x\xF0\x9F\x98"), 3u);
}

TEST(Utf8Test, SanitizeReplacesInvalidBytes) {
    EXPECT_EQ(sanitize_utf8("ok"), "ok");
    EXPECT_EQ(sanitize_utf8("a\xFF" "b"), "a\xEF\xBF\xBD" "b");
    EXPECT_TRUE(is_valid_utf8(sanitize_utf8("\xC3\x28\xE4\xB8")));
}

}  // namespace
