/**
 ** DRAGEN Open Source Software
 ** Copyright (c) 2019-2020 Illumina, Inc.
 ** All rights reserved.
 **
 ** This software is provided under the terms and conditions of the
 ** GNU GENERAL PUBLIC LICENSE Version 3
 **
 ** You should have received a copy of the GNU GENERAL PUBLIC LICENSE Version 3
 ** along with this program. If not, see
 ** <https://github.com/illumina/licenses/>.
 **
 **/

#include <string>

#include <boost/filesystem.hpp>
#include <boost/format.hpp>

#include "common/Exceptions.hpp"
#include "io/FileFormat.hpp"
#include "io/InputStream.hpp"
#include "options/SeqioOptions.hpp"

namespace seqio {
namespace options {

namespace bpo = boost::program_options;
using boost::format;
using common::InvalidOptionException;

SeqioOptions::SeqioOptions()
{
  namedOptions_.add_options()(
      "input1,1", bpo::value<std::string>(&inputFile1_), "Input file, '-' for stdin (may be compressed)")(
      "input2,2", bpo::value<std::string>(&inputFile2_), "Second input file with paired-end reads")(
      "quality-file,q",
      bpo::value<std::string>(&qualityFile_),
      "QUAL file with the quality values of the FASTA records in input1")(
      "format,f",
      bpo::value<std::string>(&inputFormat_),
      "Input format: fasta, fastq, sra-fastq, sam or bam. Detected from the name or content if not given")(
      "colorspace",
      bpo::value<bool>(&colorspace_)->default_value(colorspace_)->implicit_value(true),
      "Reads are in colorspace")(
      "interleaved",
      bpo::value<bool>(&interleaved_)->default_value(interleaved_)->implicit_value(true),
      "Interleaved paired-end reads in input1, or paired-end reads in a name-sorted SAM/BAM")(
      "single-input-read",
      bpo::value<int>(&singleInputRead_)->default_value(singleInputRead_),
      "With interleaved or SAM/BAM input, keep only this mate (1 or 2). 0 keeps both")(
      "output1,o",
      bpo::value<std::string>(&outputFile1_)->default_value(outputFile1_),
      "Output file, '-' for stdout")(
      "output2,p", bpo::value<std::string>(&outputFile2_), "Second output file for paired-end reads")(
      "output-format",
      bpo::value<std::string>(&outputFormat_),
      "Output format: fasta or fastq. Derived from the output file name if not given")(
      "interleaved-output",
      bpo::value<bool>(&interleavedOutput_)->default_value(interleavedOutput_)->implicit_value(true),
      "Write both mates of each pair into output1")(
      "line-length",
      bpo::value<std::size_t>(&lineLength_)->default_value(lineLength_),
      "Line length of FASTA output, 0 for no wrapping")(
      "verbose,v",
      bpo::value<bool>(&verbose_)->default_value(verbose_)->implicit_value(true),
      "Log format detection and progress to stderr");
}

void SeqioOptions::postProcess(bpo::variables_map& vm)
{
  if (vm.count("help") || version_) {
    return;
  }

  if (inputFile1_.empty()) {
    BOOST_THROW_EXCEPTION(InvalidOptionException("input1 is required"));
  }
  if (STDIN_FILE_NAME != inputFile1_ && boost::filesystem::is_directory(inputFile1_)) {
    BOOST_THROW_EXCEPTION(InvalidOptionException("input1 must point to a file, not a directory"));
  }
  if (!inputFile2_.empty() && boost::filesystem::is_directory(inputFile2_)) {
    BOOST_THROW_EXCEPTION(InvalidOptionException("input2 must point to a file, not a directory"));
  }

  if (interleaved_ && !(inputFile2_.empty() && qualityFile_.empty())) {
    BOOST_THROW_EXCEPTION(
        InvalidOptionException("When --interleaved is set, --input2 and --quality-file must not be given"));
  }
  if (!inputFile2_.empty() && !qualityFile_.empty()) {
    BOOST_THROW_EXCEPTION(InvalidOptionException("Setting both --input2 and --quality-file is not supported"));
  }
  if (0 != singleInputRead_ && 1 != singleInputRead_ && 2 != singleInputRead_) {
    BOOST_THROW_EXCEPTION(InvalidOptionException(
        (format("--single-input-read must be 0, 1 or 2, got %d") % singleInputRead_).str()));
  }
  if (singleInputRead_ && !inputFile2_.empty()) {
    BOOST_THROW_EXCEPTION(InvalidOptionException("--single-input-read cannot be used with --input2"));
  }
  if (!inputFormat_.empty() && !io::parseFileFormat(inputFormat_)) {
    BOOST_THROW_EXCEPTION(InvalidOptionException(
        (format("Input format '%s' is unknown (expected 'sra-fastq' (only for colorspace), 'fasta', 'fastq', "
                "'sam', or 'bam').") %
         inputFormat_)
            .str()));
  }

  for (const std::string& output : {outputFile1_, outputFile2_}) {
    if (io::isCompressed(output)) {
      BOOST_THROW_EXCEPTION(InvalidOptionException(
          (format("Output %s: compressed output is not supported, write plain text and compress it afterwards") %
           output)
              .str()));
    }
  }
  if (!outputFile2_.empty() && interleavedOutput_) {
    BOOST_THROW_EXCEPTION(
        InvalidOptionException("--output2 and --interleaved-output cannot be used together"));
  }
  if (pairedOutput() && (!pairedInput() || singleInputRead_)) {
    BOOST_THROW_EXCEPTION(InvalidOptionException("Paired output requires paired input with both mates"));
  }
  if (pairedInput() && !singleInputRead_ && !pairedOutput()) {
    BOOST_THROW_EXCEPTION(InvalidOptionException(
        "Paired input requires --output2 or --interleaved-output, or --single-input-read to keep one mate"));
  }
}

}  // namespace options
}  // namespace seqio
