#include "gtest/gtest.h"

#include <cstring>
#include <string>

#include "sequences/QualityTable.hpp"

using seqio::sequences::QualityTable;

namespace {

bool decode(const char* token, char& result)
{
  return QualityTable::instance().decode(token, token + std::strlen(token), result);
}

}  // namespace

TEST(QualityTable, Offset)
{
  const QualityTable& table = QualityTable::instance();
  ASSERT_EQ('!', table[0]);
  ASSERT_EQ('I', table[40]);
  ASSERT_EQ(char(33 - 5), table[QualityTable::MIN_VALUE]);
  ASSERT_EQ(char(255), table[QualityTable::MAX_VALUE]);
}

TEST(QualityTable, Decode)
{
  char q = 0;
  ASSERT_TRUE(decode("0", q));
  ASSERT_EQ('!', q);
  ASSERT_TRUE(decode("40", q));
  ASSERT_EQ('I', q);
  ASSERT_TRUE(decode("-5", q));
  ASSERT_EQ(char(28), q);
  ASSERT_TRUE(decode("222", q));
}

TEST(QualityTable, RejectsInvalidTokens)
{
  char q = 'x';
  ASSERT_FALSE(decode("", q));
  ASSERT_FALSE(decode("-", q));
  ASSERT_FALSE(decode("-0", q));
  ASSERT_FALSE(decode("-6", q));
  ASSERT_FALSE(decode("223", q));
  ASSERT_FALSE(decode("1000", q));
  ASSERT_FALSE(decode("07", q));
  ASSERT_FALSE(decode("4a", q));
  ASSERT_FALSE(decode("+4", q));
  ASSERT_EQ('x', q);
}
