#include "portico/state-bag.hpp"

#include <gtest/gtest.h>

#include <string>

namespace portico {

TEST(StateBag, SetFindErase) {
  StateBag bag;
  EXPECT_TRUE(bag.empty());
  bag.set("answer", 42);
  bag.set("name", std::string("portico"));
  EXPECT_EQ(bag.size(), 2U);
  ASSERT_NE(bag.find<int>("answer"), nullptr);
  EXPECT_EQ(*bag.find<int>("answer"), 42);
  // wrong type
  EXPECT_EQ(bag.find<long>("answer"), nullptr);
  EXPECT_EQ(bag.find<int>("missing"), nullptr);
  EXPECT_TRUE(bag.contains("name"));
  EXPECT_TRUE(bag.erase("name"));
  EXPECT_FALSE(bag.erase("name"));
  EXPECT_FALSE(bag.contains("name"));
}

TEST(StateBag, CopiesAreIndependent) {
  StateBag bag;
  bag.set("counter", 1);
  StateBag copy = bag;
  *copy.find<int>("counter") = 2;
  copy.set("extra", true);
  EXPECT_EQ(*bag.find<int>("counter"), 1);
  EXPECT_FALSE(bag.contains("extra"));
}

TEST(StateBag, SetOverwrites) {
  StateBag bag;
  bag.set("key", 1);
  bag.set("key", std::string("now a string"));
  EXPECT_EQ(bag.find<int>("key"), nullptr);
  ASSERT_NE(bag.find<std::string>("key"), nullptr);
  EXPECT_EQ(*bag.find<std::string>("key"), "now a string");
}

}  // namespace portico
