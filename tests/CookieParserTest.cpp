#include <wireheaders/CookieParser.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace wireheaders;

typedef std::vector<std::string> CookieList;

TEST(CookieParserTest, SplitsOnTopLevelCommas) {
  EXPECT_EQ(Cookies::getCookiesFromHeader("a=1, b=2"), CookieList({ "a=1", "b=2" }));
}

TEST(CookieParserTest, SingleCookieWithAttributes) {
  EXPECT_EQ(Cookies::getCookiesFromHeader("sid=abc; Path=/; HttpOnly; Secure"),
            CookieList({ "sid=abc; Path=/; HttpOnly; Secure" }));
}

TEST(CookieParserTest, ExpiresDateCommaDoesNotSplit) {
  EXPECT_EQ(Cookies::getCookiesFromHeader("id=1; Expires=Wed, 09 Jun 2021 10:18:14 GMT, id2=2"),
            CookieList({ "id=1; Expires=Wed, 09 Jun 2021 10:18:14 GMT", "id2=2" }));
}

TEST(CookieParserTest, ExpiresMatchIgnoresCaseAndFullWeekdayNames) {
  EXPECT_EQ(Cookies::getCookiesFromHeader("a=1; expires=Sunday, 06-Nov-94 08:49:37 GMT; path=/,b=2; EXPIRES=thu, 01 Jan 1970 00:00:00 GMT"),
            CookieList({ "a=1; expires=Sunday, 06-Nov-94 08:49:37 GMT; path=/", "b=2; EXPIRES=thu, 01 Jan 1970 00:00:00 GMT" }));
}

TEST(CookieParserTest, ExpiresWithoutWeekdaySplits) {
  // Not weekday shaped, the comma is a separator.
  EXPECT_EQ(Cookies::getCookiesFromHeader("a=1; Expires=tomorrow, b=2"),
            CookieList({ "a=1; Expires=tomorrow", "b=2" }));
  EXPECT_EQ(Cookies::getCookiesFromHeader("a=1; Max-Age=Wed, b=2"),
            CookieList({ "a=1; Max-Age=Wed", "b=2" }));
}

TEST(CookieParserTest, QuotedCommasDoNotSplit) {
  EXPECT_EQ(Cookies::getCookiesFromHeader("a=\"x,y\", b=2"),
            CookieList({ "a=\"x,y\"", "b=2" }));
}

TEST(CookieParserTest, EmptyDefinitionsAreSkipped) {
  EXPECT_EQ(Cookies::getCookiesFromHeader(" , a=1,, ,b=2 ,"), CookieList({ "a=1", "b=2" }));
  EXPECT_TRUE(Cookies::getCookiesFromHeader("").empty());
  EXPECT_TRUE(Cookies::getCookiesFromHeader(" ,, ").empty());
}

TEST(CookieParserTest, MalformedCookieKeepsEarlierResults) {
  EXPECT_EQ(Cookies::getCookiesFromHeader("a=1, =bad, c=3"), CookieList({ "a=1" }));
  EXPECT_EQ(Cookies::getCookiesFromHeader("a=1, b=\"open, c=3"), CookieList({ "a=1" }));
}

TEST(CookieParserTest, ParserIsLazyAndStopsAfterError) {
  CookieParser parser("a=1, =bad, c=3");
  std::string cookie;

  ASSERT_EQ(parser.next(cookie), HeaderResult::SUCCESS);
  EXPECT_EQ(cookie, "a=1");
  EXPECT_EQ(parser.next(cookie), HeaderResult::COOKIE_EMPTY_NAME);
  EXPECT_EQ(parser.next(cookie), HeaderResult::COOKIE_EMPTY_NAME);
  EXPECT_EQ(cookie, "a=1");
}

TEST(CookieParserTest, ParserReportsEnd) {
  CookieParser parser("a=1");
  std::string cookie;
  ASSERT_EQ(parser.next(cookie), HeaderResult::SUCCESS);
  EXPECT_EQ(parser.next(cookie), HeaderResult::COOKIE_END);
  EXPECT_EQ(parser.next(cookie), HeaderResult::COOKIE_END);
}
