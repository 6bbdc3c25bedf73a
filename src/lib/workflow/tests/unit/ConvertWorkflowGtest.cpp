#include "gtest/gtest.h"

#include <sstream>
#include <string>

#include "common/Exceptions.hpp"
#include "io/tests/StringInputStream.hpp"
#include "workflow/ConvertWorkflow.hpp"

using namespace seqio;
using io::makeInput;

namespace {

const std::string FASTQ("@r1\nACGT\n+\nIIII\n@r2\nGG\n+\n##\n@r3\nT\n+\n$\n");

io::OpenedReader open(const std::string& content, bool interleaved = false)
{
  io::ReaderOptions options;
  options.input1      = makeInput(content);
  options.interleaved = interleaved;
  return io::openReader(std::move(options));
}

}  // namespace

TEST(ConvertWorkflow, SingleEnd)
{
  io::OpenedReader   reader    = open(FASTQ);
  const auto         formatter = format::createSeqFormatter("out.fq");
  std::ostringstream os;

  // a batch size smaller than the record count forces intermediate writes
  ASSERT_EQ(3u, workflow::convertRecords(reader, *formatter, {{"out.fq", &os}}, 2));
  ASSERT_EQ(FASTQ, os.str());
  ASSERT_TRUE(reader.single().closed());
}

TEST(ConvertWorkflow, InterleavedToPairedFasta)
{
  io::OpenedReader      reader = open(">a/1\nAC\n>a/2\nGT\n>b/1\nA\n>b/2\nC\n", true);
  format::FormatOptions options;
  options.qualities = reader.deliversQualities();
  const auto         formatter = format::createSeqFormatter("1.fa", std::string("2.fa"), false, options);
  std::ostringstream os1;
  std::ostringstream os2;

  ASSERT_EQ(2u, workflow::convertRecords(reader, *formatter, {{"1.fa", &os1}, {"2.fa", &os2}}));
  ASSERT_EQ(">a/1\nAC\n>b/1\nA\n", os1.str());
  ASSERT_EQ(">a/2\nGT\n>b/2\nC\n", os2.str());
  ASSERT_EQ(3u, formatter->writtenBp().first);
}

TEST(ConvertWorkflow, ArityMismatch)
{
  io::OpenedReader   reader    = open(FASTQ);
  const auto         formatter = format::createSeqFormatter("1.fq", std::string("2.fq"));
  std::ostringstream os;
  ASSERT_THROW(
      workflow::convertRecords(reader, *formatter, {{"1.fq", &os}, {"2.fq", &os}}),
      common::PreConditionException);
}

TEST(ConvertWorkflow, MissingOutput)
{
  io::OpenedReader   reader    = open(FASTQ);
  const auto         formatter = format::createSeqFormatter("out.fq");
  std::ostringstream os;
  ASSERT_THROW(workflow::convertRecords(reader, *formatter, {{"other.fq", &os}}), common::PreConditionException);
}

TEST(ConvertWorkflow, PairingErrorStopsConversion)
{
  io::OpenedReader      reader = open("@a/1\nA\n+\nI\n@a/2\nC\n+\nI\n@b/1\nG\n+\nI\n", true);
  format::FormatOptions options;
  options.qualities = reader.deliversQualities();
  const auto         formatter = format::createSeqFormatter("-", boost::none, true, options);
  std::ostringstream os;
  ASSERT_THROW(workflow::convertRecords(reader, *formatter, {{"-", &os}}, 1), common::PairingException);
  // the complete pair has been written before the error
  ASSERT_EQ("@a/1\nA\n+\nI\n@a/2\nC\n+\nI\n", os.str());
}
