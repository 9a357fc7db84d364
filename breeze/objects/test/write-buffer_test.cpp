#include "breeze/write-buffer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace breeze {

namespace {

std::vector<std::string> Chunks(const WriteBuffer& buffer) { return {buffer.begin(), buffer.end()}; }

}  // namespace

TEST(WriteBuffer, DefaultIsEmpty) {
  WriteBuffer buffer;
  EXPECT_TRUE(buffer.empty());
  EXPECT_EQ(buffer.totalBytes(), 0U);
  EXPECT_EQ(buffer.nbChunks(), 0U);
}

TEST(WriteBuffer, AppendAndAppendLeft) {
  WriteBuffer buffer;
  buffer.append("wind");
  buffer.append("!");
  buffer.appendLeft("hello ");
  EXPECT_EQ(buffer.totalBytes(), 11U);
  EXPECT_EQ(Chunks(buffer), (std::vector<std::string>{"hello ", "wind", "!"}));
  EXPECT_EQ(buffer.front(), "hello ");
}

TEST(WriteBuffer, EmptyChunksAreIgnored) {
  WriteBuffer buffer;
  buffer.append("");
  buffer.appendLeft("");
  EXPECT_TRUE(buffer.empty());
  buffer.append("a");
  buffer.append("");
  EXPECT_EQ(buffer.nbChunks(), 1U);
}

TEST(WriteBuffer, GatherAll) {
  WriteBuffer buffer;
  buffer.append("ab");
  buffer.append("cd");
  buffer.append("ef");
  buffer.gather(buffer.totalBytes());
  EXPECT_EQ(buffer.nbChunks(), 1U);
  EXPECT_EQ(buffer.front(), "abcdef");
  EXPECT_EQ(buffer.totalBytes(), 6U);
}

TEST(WriteBuffer, GatherSplitsChunk) {
  WriteBuffer buffer;
  buffer.append("ab");
  buffer.append("cdef");
  buffer.append("gh");
  buffer.gather(4);
  EXPECT_EQ(Chunks(buffer), (std::vector<std::string>{"abcd", "ef", "gh"}));
  EXPECT_EQ(buffer.totalBytes(), 8U);
}

TEST(WriteBuffer, GatherIsClamped) {
  WriteBuffer buffer;
  buffer.append("ab");
  buffer.append("cd");
  buffer.gather(1000);
  EXPECT_EQ(Chunks(buffer), (std::vector<std::string>{"abcd"}));

  WriteBuffer empty;
  empty.gather(10);
  EXPECT_TRUE(empty.empty());
}

TEST(WriteBuffer, GatherWithinFirstChunk) {
  WriteBuffer buffer;
  buffer.append("abcd");
  buffer.append("ef");
  buffer.gather(2);
  EXPECT_EQ(Chunks(buffer), (std::vector<std::string>{"ab", "cd", "ef"}));
  buffer.gather(0);
  EXPECT_EQ(buffer.nbChunks(), 3U);
}

TEST(WriteBuffer, PopLeft) {
  WriteBuffer buffer;
  buffer.append("head");
  buffer.append("body");
  EXPECT_EQ(buffer.popLeft(), "head");
  EXPECT_EQ(buffer.totalBytes(), 4U);
  EXPECT_EQ(buffer.popLeft(), "body");
  EXPECT_TRUE(buffer.empty());
  EXPECT_EQ(buffer.totalBytes(), 0U);
}

TEST(WriteBuffer, Clear) {
  WriteBuffer buffer;
  buffer.append("some");
  buffer.append("data");
  buffer.clear();
  EXPECT_TRUE(buffer.empty());
  EXPECT_EQ(buffer.totalBytes(), 0U);
}

}  // namespace breeze
