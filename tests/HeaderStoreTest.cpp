#include <wireheaders/HeaderStore.hpp>
#include <wireheaders/HeaderValue.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace wireheaders;

// ---------------------------------------------------------------------------
// Single value / list representation
// ---------------------------------------------------------------------------
TEST(HeaderStoreTest, SecondValuePromotesToList) {
  HeaderStore store;
  store.addParsedValue("X-Foo", RawValue::create("v1"));

  const HeaderEntry* entry = store.getParsedValues("X-Foo");
  ASSERT_NE(entry, nullptr);
  EXPECT_FALSE(entry->isList());
  EXPECT_EQ(entry->single()->toString(), "v1");

  store.addParsedValue("x-foo", RawValue::create("v2"));
  entry = store.getParsedValues("X-Foo");
  ASSERT_TRUE(entry->isList());
  EXPECT_EQ(entry->single(), nullptr);
  ASSERT_EQ(entry->list().size(), 2u);
  EXPECT_EQ(entry->list()[1]->toString(), "v2");
}

TEST(HeaderStoreTest, RemovingFromPairDemotesToSingle) {
  HeaderStore store;
  store.addParsedValue("X-Foo", RawValue::create("v1"));
  store.addParsedValue("X-Foo", RawValue::create("v2"));

  EXPECT_TRUE(store.removeParsedValue("X-Foo", RawValue("v1")));
  const HeaderEntry* entry = store.getParsedValues("X-Foo");
  ASSERT_NE(entry, nullptr);
  EXPECT_FALSE(entry->isList());
  EXPECT_TRUE(entry->list().empty());
  EXPECT_EQ(entry->single()->toString(), "v2");

  EXPECT_TRUE(store.removeParsedValue("X-Foo", RawValue("v2")));
  EXPECT_FALSE(store.contains("X-Foo"));
  EXPECT_EQ(store.getParsedValues("X-Foo"), nullptr);
}

TEST(HeaderStoreTest, RemoveParsedValueOfMissingValue) {
  HeaderStore store;
  EXPECT_FALSE(store.removeParsedValue("X-Foo", RawValue("v1")));

  store.addParsedValue("X-Foo", RawValue::create("v1"));
  EXPECT_FALSE(store.removeParsedValue("X-Foo", RawValue("v2")));
  EXPECT_TRUE(store.contains("X-Foo"));
}

TEST(HeaderStoreTest, RemoveFromLongerListKeepsList) {
  HeaderStore store;
  store.add("Connection", "a, b, c");
  EXPECT_TRUE(store.removeParsedValue("Connection", TokenValue("B")));

  const HeaderEntry* entry = store.getParsedValues("Connection");
  ASSERT_TRUE(entry->isList());
  EXPECT_EQ(store.getHeaderString("Connection"), "a, c");
}

// ---------------------------------------------------------------------------
// add / tryAdd
// ---------------------------------------------------------------------------
TEST(HeaderStoreTest, AddParsesWithHeaderGrammar) {
  HeaderStore store;
  store.add("Transfer-Encoding", "gzip, chunked");
  store.add("Transfer-Encoding", "custom");

  const HeaderEntry* entry = store.getParsedValues("transfer-encoding");
  ASSERT_NE(entry, nullptr);
  EXPECT_EQ(entry->count(), 3u);
  EXPECT_EQ(store.getHeaderString("Transfer-Encoding"), "gzip, chunked, custom");
  EXPECT_TRUE(store.containsParsedValue("Transfer-Encoding", TokenValue("CHUNKED")));
}

TEST(HeaderStoreTest, StrictAddThrowsAndLeavesStoreUnchanged) {
  HeaderStore store;
  store.add("Content-Length", "10");

  EXPECT_THROW(store.add("Content-Length", "ten"), std::invalid_argument);
  EXPECT_THROW(store.add("Connection", "close, bad value"), std::invalid_argument);
  EXPECT_THROW(store.add("Bad Name", "x"), std::invalid_argument);

  EXPECT_EQ(store.getHeaderString("Content-Length"), "10");
  EXPECT_FALSE(store.contains("Connection"));
  EXPECT_EQ(store.size(), 1u);
}

TEST(HeaderStoreTest, TryAddReportsFailure) {
  HeaderStore store;
  EXPECT_TRUE(store.tryAdd("Connection", "close"));
  EXPECT_FALSE(store.tryAdd("Connection", "keep-alive, \"oops"));
  EXPECT_FALSE(store.tryAdd("", "x"));
  EXPECT_FALSE(store.tryAdd("Content-Length", "1, 2"));

  EXPECT_EQ(store.getHeaderString("Connection"), "close");
  EXPECT_FALSE(store.contains("Content-Length"));
}

TEST(HeaderStoreTest, AddParsedValueRejectsNull) {
  HeaderStore store;
  EXPECT_THROW(store.addParsedValue("X-Foo", nullptr), std::invalid_argument);
  EXPECT_FALSE(store.contains("X-Foo"));
}

// ---------------------------------------------------------------------------
// Lookup and rendering
// ---------------------------------------------------------------------------
TEST(HeaderStoreTest, NamesAreCaseInsensitive) {
  HeaderStore store;
  store.add("X-Custom", "1");
  EXPECT_TRUE(store.contains("x-custom"));
  EXPECT_TRUE(store.contains("X-CUSTOM"));
  EXPECT_TRUE(store.remove("x-CUSTOM"));
  EXPECT_FALSE(store.contains("X-Custom"));
  EXPECT_FALSE(store.remove("X-Custom"));
}

TEST(HeaderStoreTest, EntryKeepsFirstSpelling) {
  HeaderStore store;
  store.add("x-custom", "1");
  store.add("X-Custom", "2");
  ASSERT_EQ(store.names().size(), 1u);
  EXPECT_EQ(store.names()[0], "x-custom");
}

TEST(HeaderStoreTest, HeaderStringExcludesOneValue) {
  HeaderStore store;
  store.add("Connection", "keep-alive, close, Upgrade");

  EXPECT_EQ(store.getHeaderString("Connection"), "keep-alive, close, Upgrade");
  EXPECT_EQ(store.getHeaderString("Connection", TokenValue("CLOSE")), "keep-alive, Upgrade");
  EXPECT_EQ(store.getHeaderString("Connection", TokenValue("missing")), "keep-alive, close, Upgrade");
  EXPECT_EQ(store.getHeaderString("Absent"), "");
}

TEST(HeaderStoreTest, HeaderStringOfSingleExcludedValueIsEmpty) {
  HeaderStore store;
  store.add("Connection", "close");
  EXPECT_EQ(store.getHeaderString("Connection", TokenValue("close")), "");
}

TEST(HeaderStoreTest, HeaderStringExcludesEveryEqualValue) {
  HeaderStore store;
  store.add("Connection", "close, keep-alive, CLOSE");

  EXPECT_EQ(store.getHeaderString("Connection"), "close, keep-alive, CLOSE");
  EXPECT_EQ(store.getHeaderString("Connection", TokenValue("close")), "keep-alive");

  store.add("Transfer-Encoding", "chunked, chunked");
  EXPECT_EQ(store.getHeaderString("Transfer-Encoding", TokenValue("chunked")), "");
}

TEST(HeaderStoreTest, ClearRemovesEverything) {
  HeaderStore store;
  store.add("A", "1");
  store.add("B", "2");
  EXPECT_EQ(store.size(), 2u);
  store.clear();
  EXPECT_EQ(store.size(), 0u);
  EXPECT_TRUE(store.names().empty());
}
