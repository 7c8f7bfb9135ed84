#include <wireheaders/HeaderReader.hpp>
#include <wireheaders/KnownHeaders.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace wireheaders;

static std::vector<std::pair<std::string, std::string>> readAll(HeaderReader& reader) {
  std::vector<std::pair<std::string, std::string>> headers;
  std::string name;
  std::string value;
  while (reader.readHeader(name, value)) {
    headers.emplace_back(name, value);
  }
  return headers;
}

// ---------------------------------------------------------------------------
// Well-formed blocks
// ---------------------------------------------------------------------------
TEST(HeaderReaderTest, ReadsPairsInOrderWithTrimmedValues) {
  HeaderReader reader("Content-Type:  text/html \r\nX-Request-ID:\tabc\r\nVary: Accept\r\n");
  auto headers = readAll(reader);

  ASSERT_EQ(headers.size(), 3u);
  EXPECT_EQ(headers[0], std::make_pair(std::string("Content-Type"), std::string("text/html")));
  EXPECT_EQ(headers[1], std::make_pair(std::string("X-Request-ID"), std::string("abc")));
  EXPECT_EQ(headers[2], std::make_pair(std::string("Vary"), std::string("Accept")));
}

TEST(HeaderReaderTest, SplitsOnFirstColonOnly) {
  HeaderReader reader("Location: http://example.com:8080/path\r\n");
  std::string name;
  std::string value;
  ASSERT_TRUE(reader.readHeader(name, value));
  EXPECT_EQ(name, "Location");
  EXPECT_EQ(value, "http://example.com:8080/path");
}

TEST(HeaderReaderTest, EmptyValueIsAllowed) {
  HeaderReader reader("X-Empty:   \r\n");
  std::string name;
  std::string value = "stale";
  ASSERT_TRUE(reader.readHeader(name, value));
  EXPECT_EQ(name, "X-Empty");
  EXPECT_EQ(value, "");
}

// ---------------------------------------------------------------------------
// Lenient recovery
// ---------------------------------------------------------------------------
TEST(HeaderReaderTest, SkipsBlankAndColonlessLines) {
  HeaderReader reader("X-Foo: 1\r\n\r\nbadline\r\nY-Bar: 2\r\n");
  auto headers = readAll(reader);

  ASSERT_EQ(headers.size(), 2u);
  EXPECT_EQ(headers[0], std::make_pair(std::string("X-Foo"), std::string("1")));
  EXPECT_EQ(headers[1], std::make_pair(std::string("Y-Bar"), std::string("2")));
}

TEST(HeaderReaderTest, FinalLineWithoutCrlfIsReadOnce) {
  HeaderReader reader("A: 1\r\nB: 2");
  auto headers = readAll(reader);

  ASSERT_EQ(headers.size(), 2u);
  EXPECT_EQ(headers[1].second, "2");

  std::string name;
  std::string value;
  EXPECT_FALSE(reader.readHeader(name, value));
  EXPECT_TRUE(name.empty());
}

TEST(HeaderReaderTest, LoneCarriageReturnIsNotALineBreak) {
  HeaderReader reader("A: 1\r2\r\n");
  std::string name;
  std::string value;
  ASSERT_TRUE(reader.readHeader(name, value));
  EXPECT_EQ(value, "1\r2");
  EXPECT_FALSE(reader.readHeader(name, value));
}

TEST(HeaderReaderTest, ReadLineCountsLines) {
  HeaderReader reader("a\r\n\r\nb");
  EXPECT_TRUE(reader.readLine());
  EXPECT_TRUE(reader.readLine());
  EXPECT_TRUE(reader.readLine());
  EXPECT_FALSE(reader.readLine());
  EXPECT_FALSE(reader.readLine());
}

TEST(HeaderReaderTest, EmptyBufferYieldsNothing) {
  HeaderReader reader("");
  std::string name;
  std::string value;
  EXPECT_FALSE(reader.readHeader(name, value));

  HeaderReader nullReader(nullptr, 0, 0);
  EXPECT_FALSE(nullReader.readHeader(name, value));
}

TEST(HeaderReaderTest, NullBufferWithLengthIsRejected) {
  EXPECT_THROW(HeaderReader(nullptr, 0, 4), std::invalid_argument);
}

TEST(HeaderReaderTest, ReadsOnlyTheGivenWindow) {
  const std::string buffer = "HTTP/1.1 200 OK\r\nA: 1\r\nB: 2\r\n\r\nbody: no";
  const size_t start = buffer.find("A:");
  const size_t length = buffer.find("\r\n\r\n") + 2 - start;

  HeaderReader reader(buffer.data(), start, length);
  auto headers = readAll(reader);

  ASSERT_EQ(headers.size(), 2u);
  EXPECT_EQ(headers[0].first, "A");
  EXPECT_EQ(headers[1].first, "B");
}

// ---------------------------------------------------------------------------
// Interning
// ---------------------------------------------------------------------------
TEST(HeaderReaderTest, KnownNamesUseCanonicalSpelling) {
  HeaderReader reader("content-type: a\r\nContent-Type: b\r\nX-Custom: c\r\n");
  auto headers = readAll(reader);

  ASSERT_EQ(headers.size(), 3u);
  EXPECT_EQ(headers[0].first, KnownHeaders::ContentType);
  EXPECT_EQ(headers[1].first, KnownHeaders::ContentType);
  EXPECT_EQ(headers[0].first, headers[1].first);
  EXPECT_EQ(headers[2].first, "X-Custom");
}

TEST(HeaderReaderTest, ContentEncodingValuesAreShared) {
  HeaderReader reader("Content-Encoding: GZIP\r\nContent-Encoding: Deflate\r\nContent-Encoding: br\r\nX-Enc: GZIP\r\n");
  auto headers = readAll(reader);

  ASSERT_EQ(headers.size(), 4u);
  EXPECT_EQ(headers[0].second, HeaderReader::Gzip);
  EXPECT_EQ(headers[1].second, HeaderReader::Deflate);
  EXPECT_EQ(headers[2].second, "br");
  // Only Content-Encoding takes the shortcut.
  EXPECT_EQ(headers[3].second, "GZIP");
}
