#include "gtest/gtest.h"

#include <sstream>
#include <string>

#include "bam/Tokenizer.hpp"
#include "bam/tests/BamBuilder.hpp"
#include "common/Exceptions.hpp"

using seqio::bam::BamBuilder;
using seqio::bam::Tokenizer;

namespace {

std::string name(const Tokenizer::Token& token)
{
  const auto range = token.getName();
  return std::string(range.first, range.second);
}

}  // namespace

TEST(BamTokenizer, Records)
{
  std::istringstream is(
      BamBuilder().record("r1", 0x41, "ACGTN", "IIII#").record("r2", 0x81, "GG", "").uncompressed());
  Tokenizer t(is);

  ASSERT_TRUE(t.token().empty());
  ASSERT_TRUE(t.next());
  ASSERT_EQ("r1", name(t.token()));
  ASSERT_EQ(0x41, t.token().flag());
  ASSERT_EQ(5u, t.token().readLength());
  ASSERT_TRUE(t.token().hasQscores());
  std::string decoded;
  t.token().decodeBases(decoded);
  ASSERT_EQ("ACGTN", decoded);
  t.token().decodeQscores(decoded);
  ASSERT_EQ("IIII#", decoded);

  ASSERT_TRUE(t.next());
  ASSERT_EQ("r2", name(t.token()));
  ASSERT_FALSE(t.token().hasQscores());
  t.token().decodeBases(decoded);
  ASSERT_EQ("GG", decoded);

  ASSERT_FALSE(t.next());
  ASSERT_TRUE(t.token().empty());
}

TEST(BamTokenizer, SkipsSecondaryAndSupplementary)
{
  std::istringstream is(BamBuilder()
                            .record("s", 0x100, "A", "I")
                            .record("p", 0, "C", "I")
                            .record("x", 0x800, "G", "I")
                            .uncompressed());
  Tokenizer t(is);
  ASSERT_TRUE(t.next());
  ASSERT_EQ("p", name(t.token()));
  ASSERT_FALSE(t.next());
}

TEST(BamTokenizer, GrowsBuffer)
{
  const std::string  bases(1000, 'A');
  std::istringstream is(BamBuilder()
                            .record("long", 0, bases, std::string(bases.size(), 'I'))
                            .record("r2", 0, "A", "I")
                            .uncompressed());
  Tokenizer t(is, 16);
  ASSERT_TRUE(t.next());
  ASSERT_EQ(1000u, t.token().readLength());
  ASSERT_TRUE(t.next());
  ASSERT_EQ("r2", name(t.token()));
  ASSERT_FALSE(t.next());
}

TEST(BamTokenizer, TruncatedRecord)
{
  const std::string  record = BamBuilder().record("r1", 0, "ACGT", "IIII").uncompressed();
  std::istringstream is(record.substr(0, record.size() - 3));
  Tokenizer          t(is);
  ASSERT_THROW(t.next(), seqio::common::FormatException);
}

TEST(BamTokenizer, CorruptRecordSize)
{
  std::string record = BamBuilder().record("r1", 0, "ACGT", "IIII").uncompressed();
  // claim a longer sequence than the record holds
  record[20] = char(100);
  std::istringstream is(record);
  Tokenizer          t(is);
  ASSERT_THROW(t.next(), seqio::common::FormatException);
}
