#include "gtest/gtest.h"

#include <string>

#include "common/Exceptions.hpp"
#include "io/tests/StringInputStream.hpp"
#include "sam/SamRecordSource.hpp"

using seqio::io::makeInput;
using seqio::sam::AlignmentRecord;
using seqio::sam::SamRecordSource;

TEST(SamRecordSource, Records)
{
  SamRecordSource source(makeInput(
      "@HD\tVN:1.6\n"
      "@SQ\tSN:chr1\tLN:100\n"
      "r1\t99\tchr1\t1\t60\t4M\t=\t10\t13\tACGT\tIIII\tNM:i:0\n"
      "\n"
      "r1\t147\tchr1\t10\t60\t4M\t=\t1\t-13\tTTGG\t*\r\n"
      "r2\t4\t*\t0\t0\t*\t*\t0\t0\t*\t*\n",
      "reads.sam"));
  ASSERT_EQ("reads.sam", source.name());

  AlignmentRecord record;
  ASSERT_TRUE(source.next(record));
  ASSERT_EQ("r1", record.queryName);
  ASSERT_EQ("ACGT", record.querySequence);
  ASSERT_EQ("IIII", *record.queryQualities);
  ASSERT_EQ(99u, record.flag);
  ASSERT_TRUE(record.isRead1());
  ASSERT_FALSE(record.isRead2());

  ASSERT_TRUE(source.next(record));
  ASSERT_EQ("TTGG", record.querySequence);
  ASSERT_FALSE(record.queryQualities);
  ASSERT_TRUE(record.isRead2());

  ASSERT_TRUE(source.next(record));
  ASSERT_EQ("r2", record.queryName);
  ASSERT_EQ("", record.querySequence);
  ASSERT_FALSE(record.queryQualities);

  ASSERT_FALSE(source.next(record));
}

TEST(SamRecordSource, SkipsSecondaryAndSupplementary)
{
  SamRecordSource source(makeInput(
      "r1\t256\tchr1\t5\t0\t4M\t*\t0\t0\tACGT\tIIII\n"
      "r1\t2048\tchr1\t5\t0\t4M\t*\t0\t0\tACGT\tIIII\n"
      "r1\t0\tchr1\t1\t60\t4M\t*\t0\t0\tACGT\tIIII\n"));
  AlignmentRecord record;
  ASSERT_TRUE(source.next(record));
  ASSERT_EQ(0u, record.flag);
  ASSERT_FALSE(source.next(record));
}

TEST(SamRecordSource, TooFewColumns)
{
  SamRecordSource source(makeInput("r1\t0\tchr1\t1\n"));
  AlignmentRecord record;
  ASSERT_THROW(source.next(record), seqio::common::FormatException);
}

TEST(SamRecordSource, InvalidFlag)
{
  SamRecordSource source(makeInput("r1\tx\t*\t0\t0\t*\t*\t0\t0\tA\tI\n"));
  AlignmentRecord record;
  ASSERT_THROW(source.next(record), seqio::common::FormatException);

  SamRecordSource tooLarge(makeInput("r1\t65536\t*\t0\t0\t*\t*\t0\t0\tA\tI\n"));
  ASSERT_THROW(tooLarge.next(record), seqio::common::FormatException);
}
