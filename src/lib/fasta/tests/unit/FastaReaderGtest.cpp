#include "gtest/gtest.h"

#include <string>

#include "common/Exceptions.hpp"
#include "fasta/FastaReader.hpp"
#include "io/tests/StringInputStream.hpp"

using seqio::fasta::FastaReader;
using seqio::io::makeInput;
using seqio::sequences::Sequence;

TEST(FastaReader, MultiLineRecords)
{
  FastaReader reader(makeInput(">r1 first read\nACGT\nTTGG\n\n>r2\n  CC  \n>r3\n"));
  Sequence    s;
  ASSERT_FALSE(reader.deliversQualities());
  ASSERT_TRUE(reader.next(s));
  ASSERT_EQ("r1 first read", s.getName());
  ASSERT_EQ("ACGTTTGG", s.getSequence());
  ASSERT_FALSE(s.hasQualities());
  ASSERT_TRUE(reader.next(s));
  ASSERT_EQ("r2", s.getName());
  ASSERT_EQ("CC", s.getSequence());
  ASSERT_TRUE(reader.next(s));
  ASSERT_EQ("r3", s.getName());
  ASSERT_EQ("", s.getSequence());
  ASSERT_FALSE(reader.next(s));
  ASSERT_FALSE(reader.next(s));
}

TEST(FastaReader, CommentsAndWindowsNewlines)
{
  FastaReader reader(makeInput("# title\r\n>r1\r\nAC\r\n# inner\r\nGT\r\n"));
  Sequence    s;
  ASSERT_TRUE(reader.next(s));
  ASSERT_EQ("r1", s.getName());
  ASSERT_EQ("ACGT", s.getSequence());
  ASSERT_FALSE(reader.next(s));
}

TEST(FastaReader, KeepLinebreaks)
{
  FastaReader reader(makeInput(">q\n40 40\n30\n"), true);
  Sequence    s;
  ASSERT_TRUE(reader.next(s));
  ASSERT_EQ("40 40\n30", s.getSequence());
}

TEST(FastaReader, MissingHeader)
{
  FastaReader reader(makeInput("\nACGT\n>r1\nA\n"));
  Sequence    s;
  try {
    reader.next(s);
    FAIL();
  } catch (const seqio::common::FormatException& e) {
    ASSERT_EQ("At line 2: Expected '>' at beginning of FASTA record, but got 'ACGT'.", e.getMessage());
  }
}

TEST(FastaReader, Empty)
{
  FastaReader reader(makeInput(""));
  Sequence    s;
  ASSERT_FALSE(reader.next(s));
}

TEST(FastaReader, Colorspace)
{
  FastaReader reader(makeInput(">r1\nT0123\n>r2\nX01\n"), false, seqio::sequences::makeColorspaceSequence);
  Sequence    s;
  ASSERT_TRUE(reader.next(s));
  ASSERT_EQ('T', s.getPrimer());
  ASSERT_EQ("0123", s.getSequence());
  ASSERT_THROW(reader.next(s), seqio::common::FormatException);
}

TEST(FastaReader, Close)
{
  std::unique_ptr<seqio::io::InputStream> input = makeInput(">r1\nA\n");
  seqio::io::InputStream&                 raw   = *input;
  FastaReader                             reader(std::move(input));
  ASSERT_FALSE(reader.closed());
  reader.close();
  ASSERT_TRUE(reader.closed());
  ASSERT_TRUE(raw.closed());
  reader.close();
  Sequence s;
  ASSERT_THROW(reader.next(s), seqio::common::PreConditionException);
}
