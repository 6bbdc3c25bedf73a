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

#include <cerrno>

#include <boost/algorithm/string/trim.hpp>
#include <boost/format.hpp>

#include "common/Exceptions.hpp"
#include "fasta/FastaReader.hpp"

namespace seqio {
namespace fasta {

FastaReader::FastaReader(
    std::unique_ptr<io::InputStream> input, bool keepLinebreaks, sequences::SequenceBuilder builder)
  : input_(std::move(input)), keepLinebreaks_(keepLinebreaks), builder_(builder)
{
}

bool FastaReader::read(sequences::Sequence& sequence)
{
  std::istream&                 input = input_->stream();
  sequences::Sequence::Residues residues;
  std::size_t                   lines = 0;
  while (std::getline(input, line_)) {
    ++lineNumber_;
    boost::algorithm::trim(line_);
    if (line_.empty()) {
      continue;
    }
    if ('>' == line_.front()) {
      if (haveName_) {
        sequences::Sequence::Name name(std::move(name_));
        name_ = line_.substr(1);
        sequence =
            builder_(std::move(name), std::move(residues), sequences::Sequence::Qualities(), std::string());
        return true;
      }
      name_     = line_.substr(1);
      haveName_ = true;
    } else if ('#' == line_.front()) {
      continue;
    } else if (haveName_) {
      if (keepLinebreaks_ && lines) {
        residues.push_back('\n');
      }
      residues.append(line_);
      ++lines;
    } else {
      BOOST_THROW_EXCEPTION(common::FormatException(
          (boost::format("At line %d: Expected '>' at beginning of FASTA record, but got '%s'.") % lineNumber_ %
           sequences::truncateString(line_))
              .str()));
    }
  }
  if (input.bad()) {
    BOOST_THROW_EXCEPTION(common::IoException(errno, "Failed to read FASTA from " + input_->name()));
  }

  if (haveName_) {
    haveName_ = false;
    sequence  = builder_(
        std::move(name_), std::move(residues), sequences::Sequence::Qualities(), std::string());
    name_.clear();
    return true;
  }
  return false;
}

}  // namespace fasta
}  // namespace seqio
