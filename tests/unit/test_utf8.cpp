#include <gtest/gtest.h>

#include <string>

#include "util/utf8.hpp"

namespace {

TEST(Utf8Test, AcceptsWellFormedText) {
  EXPECT_TRUE(utf8::IsValid(""));
  EXPECT_TRUE(utf8::IsValid("+RCLUSTER Version v1.10"));
  EXPECT_TRUE(utf8::IsValid("caf\xc3\xa9"));         // é
  EXPECT_TRUE(utf8::IsValid("\xe2\x82\xac"));        // €
  EXPECT_TRUE(utf8::IsValid("\xf0\x9f\x98\x80"));    // U+1F600
  EXPECT_TRUE(utf8::IsValid("\xf4\x8f\xbf\xbf"));    // U+10FFFF
  EXPECT_TRUE(utf8::IsValid(std::string("a\0b", 3))); // NUL is valid
}

TEST(Utf8Test, RejectsMalformedText) {
  EXPECT_FALSE(utf8::IsValid("\xff"));
  EXPECT_FALSE(utf8::IsValid("\x80"));             // lone continuation
  EXPECT_FALSE(utf8::IsValid("\xe2\x82"));         // truncated
  EXPECT_FALSE(utf8::IsValid("\xc0\xaf"));         // overlong
  EXPECT_FALSE(utf8::IsValid("\xe0\x80\xaf"));     // overlong
  EXPECT_FALSE(utf8::IsValid("\xed\xa0\x80"));     // surrogate
  EXPECT_FALSE(utf8::IsValid("\xf4\x90\x80\x80")); // above U+10FFFF
  EXPECT_FALSE(utf8::IsValid("ok\xc3("));          // bad continuation
}

} // namespace
