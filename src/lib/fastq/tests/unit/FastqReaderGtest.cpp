#include "gtest/gtest.h"

#include <string>

#include "common/Exceptions.hpp"
#include "fastq/FastqReader.hpp"
#include "io/tests/StringInputStream.hpp"

using seqio::fastq::FastqInvalidFormat;
using seqio::fastq::FastqReader;
using seqio::io::makeInput;
using seqio::sequences::Sequence;

TEST(FastqReader, Records)
{
  FastqReader reader(makeInput("@r1 desc\nACGT\n+\nIIII\n@r2\nGG\n+r2\n#$\n"));
  Sequence    s;
  ASSERT_TRUE(reader.deliversQualities());
  ASSERT_TRUE(reader.next(s));
  ASSERT_EQ("r1 desc", s.getName());
  ASSERT_EQ("ACGT", s.getSequence());
  ASSERT_EQ("IIII", *s.getQualities());
  ASSERT_EQ("", s.getName2());
  ASSERT_TRUE(reader.next(s));
  ASSERT_EQ("r2", s.getName());
  ASSERT_EQ("r2", s.getName2());
  ASSERT_EQ("#$", *s.getQualities());
  ASSERT_FALSE(reader.next(s));
}

TEST(FastqReader, WindowsNewlinesAndMissingLastNewline)
{
  FastqReader reader(makeInput("@r1\r\nAC\r\n+\r\nII\r\n@r2\r\nG\r\n+\r\n#"));
  Sequence    s;
  ASSERT_TRUE(reader.next(s));
  ASSERT_EQ("r1", s.getName());
  ASSERT_EQ("AC", s.getSequence());
  ASSERT_EQ("II", *s.getQualities());
  ASSERT_TRUE(reader.next(s));
  ASSERT_EQ("G", s.getSequence());
  ASSERT_EQ("#", *s.getQualities());
  ASSERT_FALSE(reader.next(s));
}

TEST(FastqReader, ZeroLengthRead)
{
  FastqReader reader(makeInput("@empty\n\n+\n\n@r2\nA\n+\nI\n"));
  Sequence    s;
  ASSERT_TRUE(reader.next(s));
  ASSERT_EQ("empty", s.getName());
  ASSERT_EQ(0u, s.getLength());
  ASSERT_EQ("", *s.getQualities());
  ASSERT_TRUE(reader.next(s));
  ASSERT_EQ("r2", s.getName());
}

TEST(FastqReader, Name2Mismatch)
{
  FastqReader reader(makeInput("@r1\nACGT\n+r2\nIIII\n"));
  Sequence    s;
  ASSERT_THROW(reader.next(s), FastqInvalidFormat);
}

TEST(FastqReader, QualityLengthMismatch)
{
  FastqReader reader(makeInput("@r1\nACGT\n+\nIII\n"));
  Sequence    s;
  ASSERT_THROW(reader.next(s), seqio::common::FormatException);
}

TEST(FastqReader, Truncated)
{
  FastqReader reader(makeInput("@r1\nACGT\n+\nIIII\n@r2\nAC\n"));
  Sequence    s;
  ASSERT_TRUE(reader.next(s));
  try {
    reader.next(s);
    FAIL();
  } catch (const FastqInvalidFormat& e) {
    ASSERT_EQ("Corrupt fastq: FASTQ file ended prematurely after 1 complete records", e.getMessage());
  }
}

TEST(FastqReader, NotFastq)
{
  FastqReader reader(makeInput(">r1\nACGT\n"));
  Sequence    s;
  ASSERT_THROW(reader.next(s), seqio::common::FormatException);
}

TEST(FastqReader, Colorspace)
{
  FastqReader reader(
      makeInput("@r1\nA0123\n+\nIIII\n@r2\nN0123\n+\nIIII\n"), seqio::sequences::makeColorspaceSequence);
  Sequence    s;
  ASSERT_TRUE(reader.next(s));
  ASSERT_EQ('A', s.getPrimer());
  ASSERT_EQ("0123", s.getSequence());
  ASSERT_EQ("IIII", *s.getQualities());
  ASSERT_THROW(reader.next(s), seqio::common::FormatException);
}

TEST(FastqReader, SraColorspace)
{
  FastqReader reader(makeInput("@r1\nA0123\n+\n!IIII\n"), seqio::sequences::makeSraColorspaceSequence);
  Sequence    s;
  ASSERT_TRUE(reader.next(s));
  ASSERT_EQ("0123", s.getSequence());
  ASSERT_EQ("IIII", *s.getQualities());
}
