#include "gtest/gtest.h"

#include <string>

#include "bam/BamRecordSource.hpp"
#include "bam/tests/BamBuilder.hpp"
#include "common/Exceptions.hpp"
#include "io/tests/StringInputStream.hpp"

using seqio::bam::BamBuilder;
using seqio::bam::BamRecordSource;
using seqio::io::makeInput;
using seqio::sam::AlignmentRecord;

TEST(BamRecordSource, Records)
{
  const std::string bam = BamBuilder()
                              .header("@HD\tVN:1.6\tSO:queryname\n", "chr1", 1000)
                              .record("r1", 0x41, "ACG", "III")
                              .record("r1", 0x181, "TTTT", "##$$")
                              .record("r1", 0x81, "TT", "")
                              .compressed();
  BamRecordSource source(makeInput(bam, "reads.bam"));
  ASSERT_EQ("reads.bam", source.name());

  AlignmentRecord record;
  ASSERT_TRUE(source.next(record));
  ASSERT_EQ("r1", record.queryName);
  ASSERT_TRUE(record.isRead1());
  ASSERT_EQ("ACG", record.querySequence);
  ASSERT_EQ("III", *record.queryQualities);

  // the secondary alignment is skipped
  ASSERT_TRUE(source.next(record));
  ASSERT_TRUE(record.isRead2());
  ASSERT_EQ("TT", record.querySequence);
  ASSERT_FALSE(record.queryQualities);

  ASSERT_FALSE(source.next(record));
  source.close();
}

TEST(BamRecordSource, EmptyHeader)
{
  const std::string bam = BamBuilder().raw(std::string("BAM\1\0\0\0\0\0\0\0\0", 12)).compressed();
  BamRecordSource   source(makeInput(bam));
  AlignmentRecord   record;
  ASSERT_FALSE(source.next(record));
}

TEST(BamRecordSource, BadMagic)
{
  const std::string bam = BamBuilder().raw("SAM\1").compressed();
  ASSERT_THROW({ BamRecordSource source(makeInput(bam)); }, seqio::common::FormatException);
}

TEST(BamRecordSource, TruncatedHeader)
{
  const std::string bam = BamBuilder().raw(std::string("BAM\1\xff\0\0\0@HD", 11)).compressed();
  ASSERT_THROW({ BamRecordSource source(makeInput(bam)); }, seqio::common::FormatException);
}
