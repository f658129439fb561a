#include "portico/raw-chars.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <string_view>
#include <utility>

namespace portico {

TEST(RawCharsTest, AppendAndView) {
  RawChars buf;
  EXPECT_TRUE(buf.empty());
  buf.append("hello");
  buf.push_back(' ');
  buf.append(std::string_view("world"));
  EXPECT_EQ(std::string_view(buf), "hello world");
  EXPECT_EQ(buf.size(), 11U);
  EXPECT_GE(buf.capacity(), buf.size());
}

TEST(RawCharsTest, EraseFront) {
  RawChars buf(std::string_view("GET / HTTP/1.1\r\n\r\nrest"));
  buf.erase_front(18);
  EXPECT_EQ(std::string_view(buf), "rest");
  buf.erase_front(buf.size());
  EXPECT_TRUE(buf.empty());
}

TEST(RawCharsTest, ReadLikeGrowth) {
  RawChars buf;
  buf.ensureAvailableCapacityExponential(16);
  ASSERT_GE(buf.availableCapacity(), 16U);
  std::memcpy(buf.data() + buf.size(), "0123456789", 10);
  buf.addSize(10);
  EXPECT_EQ(std::string_view(buf), "0123456789");
  buf.setSize(4);
  EXPECT_EQ(std::string_view(buf), "0123");
}

TEST(RawCharsTest, CopyMoveSwap) {
  RawChars lhs(std::string_view("abc"));
  RawChars copy(lhs);
  EXPECT_EQ(copy, lhs);

  RawChars moved(std::move(copy));
  EXPECT_EQ(std::string_view(moved), "abc");

  RawChars rhs(std::string_view("xyz"));
  swap(lhs, rhs);
  EXPECT_EQ(std::string_view(lhs), "xyz");
  EXPECT_EQ(std::string_view(rhs), "abc");

  rhs.assign("replaced");
  EXPECT_EQ(std::string_view(rhs), "replaced");
}

}  // namespace portico
