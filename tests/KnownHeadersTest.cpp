#include <wireheaders/KnownHeaders.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace wireheaders;

TEST(KnownHeadersTest, FindsCanonicalConstant) {
  const std::string text = "Content-Type";
  EXPECT_EQ(KnownHeaders::find(text), &KnownHeaders::ContentType);
}

TEST(KnownHeadersTest, LookupIgnoresCase) {
  EXPECT_EQ(KnownHeaders::find("content-encoding"), &KnownHeaders::ContentEncoding);
  EXPECT_EQ(KnownHeaders::find("TRANSFER-ENCODING"), &KnownHeaders::TransferEncoding);
  EXPECT_EQ(*KnownHeaders::find("set-cookie"), "Set-Cookie");
}

TEST(KnownHeadersTest, LookupUsesWindowOnly) {
  const std::string line = "Connection: close";
  const std::string* name = nullptr;
  EXPECT_TRUE(KnownHeaders::tryGetHeaderName(line.data(), 0, 10, name));
  EXPECT_EQ(name, &KnownHeaders::Connection);
}

TEST(KnownHeadersTest, UnknownNamesAreNotMatched) {
  const std::string* name = &KnownHeaders::Age;
  EXPECT_FALSE(KnownHeaders::tryGetHeaderName("X-Custom", 0, 8, name));
  EXPECT_EQ(name, nullptr);

  // Prefixes and extensions of known names are different headers.
  EXPECT_EQ(KnownHeaders::find("Content"), nullptr);
  EXPECT_EQ(KnownHeaders::find("Content-Types"), nullptr);
  EXPECT_EQ(KnownHeaders::find(""), nullptr);
}
