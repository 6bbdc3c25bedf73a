#include "gtest/gtest.h"

#include <iterator>
#include <sstream>
#include <string>

#include "common/Exceptions.hpp"
#include "io/FileFormat.hpp"
#include "io/PeekableInputStream.hpp"
#include "io/tests/StringInputStream.hpp"

using seqio::io::FileFormat;
using seqio::io::guessFormatFromName;
using seqio::io::splitExtCompressed;

TEST(FileFormat, Names)
{
  ASSERT_EQ(std::string("sra-fastq"), seqio::io::toString(FileFormat::SRA_FASTQ));
  ASSERT_EQ(FileFormat::BAM, *seqio::io::parseFileFormat("BAM"));
  ASSERT_EQ(FileFormat::SRA_FASTQ, *seqio::io::parseFileFormat("sra-fastq"));
  ASSERT_FALSE(seqio::io::parseFileFormat("fa"));

  std::ostringstream os;
  os << FileFormat::FASTQ;
  ASSERT_EQ("fastq", os.str());
}

TEST(FileFormat, SplitExtCompressed)
{
  auto split = splitExtCompressed("dir/reads.fastq.gz");
  ASSERT_EQ("dir/reads", split.stem);
  ASSERT_EQ(".fastq", split.extension);
  ASSERT_EQ(".gz", split.compression);

  split = splitExtCompressed("reads.fa");
  ASSERT_EQ("reads", split.stem);
  ASSERT_EQ(".fa", split.extension);
  ASSERT_EQ("", split.compression);

  split = splitExtCompressed("dir.d/reads");
  ASSERT_EQ("dir.d/reads", split.stem);
  ASSERT_EQ("", split.extension);

  split = splitExtCompressed(".hidden.bz2");
  ASSERT_EQ(".hidden", split.stem);
  ASSERT_EQ("", split.extension);
  ASSERT_EQ(".bz2", split.compression);
}

TEST(FileFormat, GuessFromName)
{
  ASSERT_EQ(FileFormat::FASTA, *guessFormatFromName("a.fasta"));
  ASSERT_EQ(FileFormat::FASTA, *guessFormatFromName("a.FA.gz"));
  ASSERT_EQ(FileFormat::FASTA, *guessFormatFromName("a.fna.xz"));
  ASSERT_EQ(FileFormat::FASTA, *guessFormatFromName("a.csfasta"));
  ASSERT_EQ(FileFormat::FASTA, *guessFormatFromName("a.csfa"));
  ASSERT_EQ(FileFormat::FASTQ, *guessFormatFromName("a.fq"));
  ASSERT_EQ(FileFormat::FASTQ, *guessFormatFromName("a.fastq.bz2"));
  ASSERT_EQ(FileFormat::FASTQ, *guessFormatFromName("s_1_sequence.txt"));
  ASSERT_EQ(FileFormat::SAM, *guessFormatFromName("a.sam"));
  ASSERT_EQ(FileFormat::BAM, *guessFormatFromName("a.bam"));
  ASSERT_FALSE(guessFormatFromName("a.txt"));
  ASSERT_FALSE(guessFormatFromName("a.xyz"));
  ASSERT_FALSE(guessFormatFromName("reads"));
}

TEST(FileFormat, GuessFromNameRaises)
{
  try {
    guessFormatFromName("out.xyz", true);
    FAIL();
  } catch (const seqio::common::UnknownFileTypeException& e) {
    ASSERT_EQ(
        "Could not determine whether file 'out.xyz' is FASTA or FASTQ: file name extension '.xyz' not recognized",
        e.getMessage());
  }
}

TEST(FileFormat, SniffFasta)
{
  seqio::io::PeekableInputStream input(seqio::io::makeInput("\n# comment\n>r1\nACGT\n"));
  ASSERT_EQ(FileFormat::FASTA, *seqio::io::sniffFormat(input));
  std::string line;
  ASSERT_TRUE(std::getline(input.stream(), line));
  ASSERT_EQ(">r1", line);
}

TEST(FileFormat, SniffFastq)
{
  seqio::io::PeekableInputStream input(seqio::io::makeInput("@r1\nACGT\n+\nIIII\n"));
  ASSERT_EQ(FileFormat::FASTQ, *seqio::io::sniffFormat(input));
  ASSERT_EQ(
      "@r1\nACGT\n+\nIIII\n",
      std::string(std::istreambuf_iterator<char>(input.stream()), std::istreambuf_iterator<char>()));
}

TEST(FileFormat, SniffUnknown)
{
  seqio::io::PeekableInputStream garbage(seqio::io::makeInput("ACGT\n"));
  ASSERT_FALSE(seqio::io::sniffFormat(garbage));
  seqio::io::PeekableInputStream empty(seqio::io::makeInput("# only comments\n\n"));
  ASSERT_FALSE(seqio::io::sniffFormat(empty));
}

TEST(FileFormat, SniffMarkerInFirstColumn)
{
  seqio::io::PeekableInputStream indented(seqio::io::makeInput(" \t\n  >r1\nACGT\n"));
  ASSERT_FALSE(seqio::io::sniffFormat(indented));
  std::string line;
  ASSERT_TRUE(std::getline(indented.stream(), line));
  ASSERT_EQ("  >r1", line);
}
