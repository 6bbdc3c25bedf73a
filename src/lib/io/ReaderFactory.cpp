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

#include <boost/format.hpp>

#include "bam/BamRecordSource.hpp"
#include "common/Debug.hpp"
#include "common/Exceptions.hpp"
#include "common/SystemCompatibility.hpp"
#include "fasta/FastaQualReader.hpp"
#include "fasta/FastaReader.hpp"
#include "fastq/FastqReader.hpp"
#include "io/FileFormat.hpp"
#include "io/PeekableInputStream.hpp"
#include "io/ReaderFactory.hpp"
#include "paired/PairedReaders.hpp"
#include "sam/AlignmentReaders.hpp"
#include "sam/SamRecordSource.hpp"

namespace seqio {
namespace io {

namespace {

void throwUnknownFormat(const std::string& attempted)
{
  BOOST_THROW_EXCEPTION(common::UnknownFileTypeException(
      (boost::format("File format '%s' is unknown (expected 'sra-fastq' (only for colorspace), 'fasta', "
                     "'fastq', 'sam', or 'bam').") %
       attempted)
          .str()));
}

void validate(const ReaderOptions& options)
{
  if (!options.input1) {
    BOOST_THROW_EXCEPTION(common::InvalidOptionException("An input is required"));
  }
  if (options.interleaved && (options.input2 || options.qualities)) {
    BOOST_THROW_EXCEPTION(
        common::InvalidOptionException("When interleaved is set, input2 and the quality file must not be given"));
  }
  if (options.input2 && options.qualities) {
    BOOST_THROW_EXCEPTION(
        common::InvalidOptionException("Setting both input2 and the quality file is not supported"));
  }
  if (0 != options.singleInputRead && 1 != options.singleInputRead && 2 != options.singleInputRead) {
    BOOST_THROW_EXCEPTION(common::InvalidOptionException(
        (boost::format("Single input read must be 1 or 2, got %d") % options.singleInputRead).str()));
  }
  if (options.singleInputRead && options.input2) {
    BOOST_THROW_EXCEPTION(common::InvalidOptionException("Single input read cannot be selected with input2"));
  }
}

std::unique_ptr<SequenceReader> makeRecordReader(
    std::unique_ptr<InputStream> input, FileFormat format, bool colorspace, const std::string& attempted)
{
  switch (format) {
  case FileFormat::FASTA:
    return std::unique_ptr<SequenceReader>(new fasta::FastaReader(
        std::move(input), false, colorspace ? sequences::makeColorspaceSequence : sequences::makePlainSequence));
  case FileFormat::FASTQ:
    return std::unique_ptr<SequenceReader>(new fastq::FastqReader(
        std::move(input), colorspace ? sequences::makeColorspaceSequence : sequences::makePlainSequence));
  case FileFormat::SRA_FASTQ:
    if (colorspace) {
      return std::unique_ptr<SequenceReader>(
          new fastq::FastqReader(std::move(input), sequences::makeSraColorspaceSequence));
    }
    break;
  default:
    break;
  }
  throwUnknownFormat(attempted);
  return std::unique_ptr<SequenceReader>();
}

OpenedReader makeAlignmentReader(std::unique_ptr<InputStream> input, FileFormat format, const ReaderOptions& options)
{
  if (options.colorspace) {
    BOOST_THROW_EXCEPTION(
        common::InvalidOptionException("SAM/BAM format is not currently supported for colorspace reads"));
  }
  std::unique_ptr<sam::AlignmentRecordSource> source(
      FileFormat::SAM == format
          ? static_cast<sam::AlignmentRecordSource*>(new sam::SamRecordSource(std::move(input)))
          : static_cast<sam::AlignmentRecordSource*>(new bam::BamRecordSource(std::move(input))));
  if (options.interleaved) {
    return OpenedReader(
        std::unique_ptr<PairedSequenceReader>(new sam::PairedEndAlignmentReader(std::move(source))));
  }
  const sam::SingleEndAlignmentReader::MateFilter filter =
      1 == options.singleInputRead
          ? sam::SingleEndAlignmentReader::READ1
          : 2 == options.singleInputRead ? sam::SingleEndAlignmentReader::READ2 : sam::SingleEndAlignmentReader::ALL;
  return OpenedReader(
      std::unique_ptr<SequenceReader>(new sam::SingleEndAlignmentReader(std::move(source), filter)));
}

}  // namespace

OpenedReader openReader(ReaderOptions options)
{
  validate(options);

  if (options.input2) {
    ReaderOptions options1;
    options1.input1     = std::move(options.input1);
    options1.colorspace = options.colorspace;
    options1.format     = options.format;
    ReaderOptions options2;
    options2.input1     = std::move(options.input2);
    options2.colorspace = options.colorspace;
    options2.format     = options.format;
    std::unique_ptr<SequenceReader> reader1 = openReader(std::move(options1)).releaseSingle();
    std::unique_ptr<SequenceReader> reader2 = openReader(std::move(options2)).releaseSingle();
    return OpenedReader(std::unique_ptr<PairedSequenceReader>(
        new paired::PairedFileReader(std::move(reader1), std::move(reader2))));
  }

  if (options.qualities) {
    return OpenedReader(std::unique_ptr<SequenceReader>(new fasta::FastaQualReader(
        std::move(options.input1),
        std::move(options.qualities),
        options.colorspace ? sequences::makeColorspaceSequence : sequences::makePlainSequence)));
  }

  std::unique_ptr<InputStream> input = std::move(options.input1);
  boost::optional<FileFormat>  format;
  std::string                  attempted = "undetermined";
  if (options.format) {
    attempted = *options.format;
    format    = parseFileFormat(*options.format);
    if (!format) {
      throwUnknownFormat(attempted);
    }
  } else if (STDIN_FILE_NAME != input->name()) {
    format = guessFormatFromName(input->name());
  }

  if (!format) {
    std::unique_ptr<PeekableInputStream> peekable(new PeekableInputStream(std::move(input)));
    format = sniffFormat(*peekable);
    input  = std::move(peekable);
    if (!format) {
      throwUnknownFormat(attempted);
    }
  }
  attempted = toString(*format);
  SEQIO_THREAD_CERR_DEV_TRACE("resolved format of " << input->name() << " to " << attempted);

  if (FileFormat::SAM == *format || FileFormat::BAM == *format) {
    return makeAlignmentReader(std::move(input), *format, options);
  }

  if (options.interleaved) {
    std::unique_ptr<PairedSequenceReader> reader(new paired::InterleavedReader(
        makeRecordReader(std::move(input), *format, options.colorspace, attempted)));
    if (options.singleInputRead) {
      return OpenedReader(std::unique_ptr<SequenceReader>(
          new paired::MateProjectionReader(std::move(reader), options.singleInputRead)));
    }
    return OpenedReader(std::move(reader));
  }

  return OpenedReader(makeRecordReader(std::move(input), *format, options.colorspace, attempted));
}

}  // namespace io
}  // namespace seqio
