#include "gtest/gtest.h"

#include <iterator>
#include <string>

#include "common/Exceptions.hpp"
#include "io/PeekableInputStream.hpp"
#include "io/tests/StringInputStream.hpp"

using seqio::io::PeekableInputStream;
using seqio::io::makeInput;

namespace {

std::string readAll(std::istream& is)
{
  return std::string(std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>());
}

}  // namespace

TEST(PeekableInputStream, PassThrough)
{
  PeekableInputStream peekable(makeInput(">r1\nACGT\n", "test.fa"));
  ASSERT_EQ("test.fa", peekable.name());
  ASSERT_EQ(">r1\nACGT\n", readAll(peekable.stream()));
}

TEST(PeekableInputStream, PushedLineComesFirst)
{
  PeekableInputStream peekable(makeInput("# comment\n>r1\nACGT\n"));
  std::string         line;
  ASSERT_TRUE(peekable.readLine(line));
  ASSERT_EQ("# comment", line);
  ASSERT_TRUE(peekable.readLine(line));
  ASSERT_EQ(">r1", line);
  peekable.pushBack(line);
  ASSERT_EQ(">r1\nACGT\n", readAll(peekable.stream()));
}

TEST(PeekableInputStream, PushBackKeepsExistingNewline)
{
  PeekableInputStream peekable(makeInput("rest"));
  peekable.pushBack("first\n");
  ASSERT_EQ("first\nrest", readAll(peekable.stream()));
}

TEST(PeekableInputStream, ReadLineAtEnd)
{
  PeekableInputStream peekable(makeInput(""));
  std::string         line;
  ASSERT_FALSE(peekable.readLine(line));
  ASSERT_EQ("", readAll(peekable.stream()));
}

TEST(PeekableInputStream, NoPeekingOnceStreamed)
{
  PeekableInputStream peekable(makeInput("a\nb\n"));
  std::string         line;
  ASSERT_TRUE(std::getline(peekable.stream(), line));
  ASSERT_THROW(peekable.readLine(line), seqio::common::PreConditionException);
  ASSERT_THROW(peekable.pushBack("a"), seqio::common::PreConditionException);
}

TEST(PeekableInputStream, SecondReadLineAfterPushBack)
{
  PeekableInputStream peekable(makeInput("a\nb\n"));
  std::string         line;
  ASSERT_TRUE(peekable.readLine(line));
  peekable.pushBack(line);
  ASSERT_THROW(peekable.readLine(line), seqio::common::PreConditionException);
}

TEST(PeekableInputStream, CloseIsForwarded)
{
  PeekableInputStream peekable(makeInput("a\n"));
  ASSERT_FALSE(peekable.closed());
  peekable.close();
  ASSERT_TRUE(peekable.closed());
}
