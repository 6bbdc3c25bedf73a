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
#include <boost/format.hpp>

#include "common/Debug.hpp"
#include "common/Exceptions.hpp"
#include "format/SequenceFormat.hpp"
#include "io/FileFormat.hpp"

namespace seqio {
namespace format {

namespace {

void appendResidues(std::string& out, const sequences::Sequence& read, bool colorspace)
{
  if (colorspace && read.isColorspace()) {
    out.push_back(read.getPrimer());
  }
  out.append(read.getSequence());
}

}  // namespace

std::string FastaFormat::format(const sequences::Sequence& read) const
{
  std::string residues;
  appendResidues(residues, read, colorspace_);

  std::string ret;
  ret.reserve(read.getName().size() + residues.size() + 3 + (lineLength_ ? residues.size() / lineLength_ : 0));
  ret.push_back('>');
  ret.append(read.getName());
  ret.push_back('\n');
  if (lineLength_) {
    for (std::size_t pos = 0; residues.size() > pos; pos += lineLength_) {
      if (pos) {
        ret.push_back('\n');
      }
      ret.append(residues, pos, lineLength_);
    }
  } else {
    ret.append(residues);
  }
  ret.push_back('\n');
  return ret;
}

std::string FastqFormat::format(const sequences::Sequence& read) const
{
  if (!read.hasQualities()) {
    BOOST_THROW_EXCEPTION(common::InvalidOptionException(
        (boost::format("Cannot write read '%s' as FASTQ since it has no quality values") %
         sequences::truncateString(read.getName()))
            .str()));
  }
  std::string ret;
  ret.reserve(read.getName().size() + read.getName2().size() + read.getLength() * 2 + 7);
  ret.push_back('@');
  ret.append(read.getName());
  ret.push_back('\n');
  appendResidues(ret, read, colorspace_);
  ret.append("\n+");
  ret.append(read.getName2());
  ret.push_back('\n');
  ret.append(*read.getQualities());
  ret.push_back('\n');
  return ret;
}

std::unique_ptr<SequenceFormat> getFormat(
    const std::string&                  path,
    const boost::optional<std::string>& fileFormat,
    bool                                colorspace,
    boost::optional<bool>               qualities,
    std::size_t                         lineLength)
{
  std::string format;
  if (fileFormat) {
    format = boost::algorithm::to_lower_copy(*fileFormat);
  } else {
    const boost::optional<io::FileFormat> guessed = io::guessFormatFromName(path, !qualities);
    if (guessed) {
      format = io::toString(*guessed);
    } else if (qualities) {
      // extension not recognized, but we know whether qualities will be written
      format = *qualities ? "fastq" : "fasta";
    } else {
      BOOST_THROW_EXCEPTION(common::UnknownFileTypeException("Could not determine file type."));
    }
  }
  SEQIO_THREAD_CERR_DEV_TRACE("output format of " << path << " is " << format);

  if ("fastq" == format && qualities && !*qualities) {
    BOOST_THROW_EXCEPTION(common::InvalidOptionException(
        "Output format cannot be FASTQ since no quality values are available."));
  }

  if ("fasta" == format) {
    return std::unique_ptr<SequenceFormat>(new FastaFormat(lineLength, colorspace));
  }
  if ("fastq" == format) {
    return std::unique_ptr<SequenceFormat>(new FastqFormat(colorspace));
  }
  BOOST_THROW_EXCEPTION(common::UnknownFileTypeException(
      (boost::format("File format '%s' is unknown (expected 'fasta' or 'fastq').") % format).str()));
}

}  // namespace format
}  // namespace seqio
