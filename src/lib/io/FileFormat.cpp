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

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/format.hpp>

#include "common/Debug.hpp"
#include "common/Exceptions.hpp"
#include "io/FileFormat.hpp"
#include "io/PeekableInputStream.hpp"

namespace seqio {
namespace io {

const char* toString(FileFormat format)
{
  switch (format) {
  case FileFormat::FASTA:
    return "fasta";
  case FileFormat::FASTQ:
    return "fastq";
  case FileFormat::SRA_FASTQ:
    return "sra-fastq";
  case FileFormat::SAM:
    return "sam";
  case FileFormat::BAM:
    return "bam";
  }
  return "unknown";
}

boost::optional<FileFormat> parseFileFormat(const std::string& name)
{
  const std::string lower = boost::algorithm::to_lower_copy(name);
  for (const FileFormat format :
       {FileFormat::FASTA, FileFormat::FASTQ, FileFormat::SRA_FASTQ, FileFormat::SAM, FileFormat::BAM}) {
    if (lower == toString(format)) {
      return format;
    }
  }
  return boost::none;
}

namespace {

// extension of the last path component, "" if there is none. Leading dots of hidden files do not count.
std::size_t findExtension(const std::string& path)
{
  const std::size_t slash = path.find_last_of('/');
  const std::size_t base  = std::string::npos == slash ? 0 : slash + 1;
  const std::size_t dot   = path.find_last_of('.');
  if (std::string::npos == dot || base >= dot) {
    return std::string::npos;
  }
  if (path.find_first_not_of('.', base) > dot) {
    return std::string::npos;
  }
  return dot;
}

}  // namespace

SplitPath splitExtCompressed(const std::string& path)
{
  SplitPath ret;
  ret.stem = path;
  for (const char* suffix : {".gz", ".bz2", ".xz"}) {
    if (boost::algorithm::ends_with(path, suffix) && path.size() > std::char_traits<char>::length(suffix)) {
      ret.compression = suffix;
      ret.stem.resize(path.size() - ret.compression.size());
      break;
    }
  }
  const std::size_t dot = findExtension(ret.stem);
  if (std::string::npos != dot) {
    ret.extension = ret.stem.substr(dot);
    ret.stem.resize(dot);
  }
  return ret;
}

boost::optional<FileFormat> guessFormatFromName(const std::string& path, bool raiseOnFailure)
{
  const SplitPath   split     = splitExtCompressed(path);
  const std::string extension = boost::algorithm::to_lower_copy(split.extension);
  if (".fasta" == extension || ".fa" == extension || ".fna" == extension || ".csfasta" == extension ||
      ".csfa" == extension) {
    return FileFormat::FASTA;
  }
  if (".fastq" == extension || ".fq" == extension ||
      (".txt" == extension && boost::algorithm::ends_with(split.stem, "_sequence"))) {
    return FileFormat::FASTQ;
  }
  if (".sam" == extension) {
    return FileFormat::SAM;
  }
  if (".bam" == extension) {
    return FileFormat::BAM;
  }

  if (raiseOnFailure) {
    BOOST_THROW_EXCEPTION(common::UnknownFileTypeException(
        (boost::format("Could not determine whether file '%s' is FASTA or FASTQ: file name extension '%s' not "
                       "recognized") %
         path % split.extension)
            .str()));
  }
  return boost::none;
}

boost::optional<FileFormat> sniffFormat(PeekableInputStream& input)
{
  std::string line;
  while (input.readLine(line)) {
    // comments are needed for csfasta
    if (boost::algorithm::all(line, boost::algorithm::is_space()) || '#' == line.front()) {
      continue;
    }
    input.pushBack(line);
    // the marker must be the first byte, as the readers expect it there
    if ('>' == line.front()) {
      SEQIO_THREAD_CERR_DEV_TRACE("sniffed fasta in " << input.name());
      return FileFormat::FASTA;
    }
    if ('@' == line.front()) {
      SEQIO_THREAD_CERR_DEV_TRACE("sniffed fastq in " << input.name());
      return FileFormat::FASTQ;
    }
    return boost::none;
  }
  return boost::none;
}

}  // namespace io
}  // namespace seqio
