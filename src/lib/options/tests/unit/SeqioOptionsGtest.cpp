#include "gtest/gtest.h"

#include <string>
#include <vector>

#include "options/SeqioOptions.hpp"

using seqio::options::SeqioOptions;

namespace {

SeqioOptions::Action parse(SeqioOptions& options, std::vector<const char*> args)
{
  args.insert(args.begin(), "seqio-convert");
  return options.parse(args.size(), args.data());
}

}  // namespace

TEST(SeqioOptions, Defaults)
{
  SeqioOptions options;
  ASSERT_EQ(SeqioOptions::RUN, parse(options, {"-1", "reads.fq"}));
  ASSERT_EQ("reads.fq", options.inputFile1_);
  ASSERT_EQ("", options.inputFile2_);
  ASSERT_EQ("-", options.outputFile1_);
  ASSERT_FALSE(options.colorspace_);
  ASSERT_FALSE(options.interleaved_);
  ASSERT_EQ(0, options.singleInputRead_);
  ASSERT_EQ(0u, options.lineLength_);
  ASSERT_FALSE(options.pairedInput());
  ASSERT_FALSE(options.pairedOutput());
}

TEST(SeqioOptions, PairedFiles)
{
  SeqioOptions options;
  ASSERT_EQ(
      SeqioOptions::RUN,
      parse(
          options,
          {"--input1", "r1.fq", "--input2", "r2.fq", "-o", "o1.fa", "-p", "o2.fa", "--line-length", "60",
           "--colorspace"}));
  ASSERT_EQ("r2.fq", options.inputFile2_);
  ASSERT_EQ("o2.fa", options.outputFile2_);
  ASSERT_EQ(60u, options.lineLength_);
  ASSERT_TRUE(options.colorspace_);
  ASSERT_TRUE(options.pairedInput());
  ASSERT_TRUE(options.pairedOutput());
}

TEST(SeqioOptions, InterleavedSingleMate)
{
  SeqioOptions options;
  ASSERT_EQ(
      SeqioOptions::RUN,
      parse(options, {"-1", "reads.bam", "--interleaved", "--single-input-read", "2", "-f", "bam"}));
  ASSERT_TRUE(options.interleaved_);
  ASSERT_EQ(2, options.singleInputRead_);
  ASSERT_EQ("bam", options.inputFormat_);
}

TEST(SeqioOptions, Help)
{
  SeqioOptions options;
  ASSERT_EQ(SeqioOptions::HELP, parse(options, {"--help"}));
  ASSERT_NE(std::string::npos, options.usage().find("--single-input-read"));
}

TEST(SeqioOptions, Invalid)
{
  {
    SeqioOptions options;
    ASSERT_EQ(SeqioOptions::ABORT, parse(options, {}));
  }
  {
    SeqioOptions options;
    ASSERT_EQ(SeqioOptions::ABORT, parse(options, {"-1", "a.fq", "-2", "b.fq", "--interleaved"}));
  }
  {
    SeqioOptions options;
    ASSERT_EQ(SeqioOptions::ABORT, parse(options, {"-1", "a.fa", "-2", "b.fa", "-q", "a.qual", "-p", "x"}));
  }
  {
    SeqioOptions options;
    ASSERT_EQ(SeqioOptions::ABORT, parse(options, {"-1", "a.fq", "--interleaved", "--single-input-read", "3"}));
  }
  {
    SeqioOptions options;
    ASSERT_EQ(SeqioOptions::ABORT, parse(options, {"-1", "a.fq", "-f", "fq"}));
  }
  {
    // paired output from single-end input
    SeqioOptions options;
    ASSERT_EQ(SeqioOptions::ABORT, parse(options, {"-1", "a.fq", "-p", "b.fq"}));
  }
  {
    // paired input needs somewhere to write read 2
    SeqioOptions options;
    ASSERT_EQ(SeqioOptions::ABORT, parse(options, {"-1", "a.fq", "-2", "b.fq"}));
  }
  {
    SeqioOptions options;
    ASSERT_EQ(
        SeqioOptions::ABORT, parse(options, {"-1", "a.fq", "--interleaved", "-p", "b.fq", "--interleaved-output"}));
  }
}

TEST(SeqioOptions, CompressedOutput)
{
  {
    SeqioOptions options;
    ASSERT_EQ(SeqioOptions::ABORT, parse(options, {"-1", "a.fq", "-o", "out.fq.gz"}));
  }
  {
    SeqioOptions options;
    ASSERT_EQ(
        SeqioOptions::ABORT, parse(options, {"-1", "a_1.fq", "-2", "a_2.fq", "-o", "1.fq", "-p", "2.fq.bz2"}));
  }
  {
    SeqioOptions options;
    ASSERT_EQ(SeqioOptions::RUN, parse(options, {"-1", "a.fq.xz", "-o", "out.fq"}));
  }
}
