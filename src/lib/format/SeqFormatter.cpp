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

#include "common/Exceptions.hpp"
#include "format/SeqFormatter.hpp"

namespace seqio {
namespace format {

const sequences::Sequence& SeqFormatter::requireMate(const sequences::Sequence* read2)
{
  if (!read2) {
    BOOST_THROW_EXCEPTION(common::PreConditionException("Paired output requires both mates"));
  }
  return *read2;
}

void SingleEndFormatter::format(
    FormattedRecords& result, const sequences::Sequence& read1, const sequences::Sequence*)
{
  result[file1_].push_back(format_->format(read1));
  ++written_;
  read1Bp_ += read1.getLength();
}

void InterleavedFormatter::format(
    FormattedRecords& result, const sequences::Sequence& read1, const sequences::Sequence* read2)
{
  const sequences::Sequence& mate    = requireMate(read2);
  std::vector<std::string>&  records = result[file1_];
  records.push_back(format_->format(read1));
  records.push_back(format_->format(mate));
  countPair(read1, mate);
}

void PairedEndFormatter::format(
    FormattedRecords& result, const sequences::Sequence& read1, const sequences::Sequence* read2)
{
  const sequences::Sequence& mate = requireMate(read2);
  result[file1_].push_back(format_->format(read1));
  result[file2_].push_back(format_->format(mate));
  countPair(read1, mate);
}

std::unique_ptr<SeqFormatter> createSeqFormatter(
    const std::string&                  file1,
    const boost::optional<std::string>& file2,
    bool                                interleaved,
    const FormatOptions&                options)
{
  std::unique_ptr<SequenceFormat> format =
      getFormat(file1, options.fileFormat, options.colorspace, options.qualities, options.lineLength);
  if (file2) {
    return std::unique_ptr<SeqFormatter>(new PairedEndFormatter(std::move(format), file1, *file2));
  }
  if (interleaved) {
    return std::unique_ptr<SeqFormatter>(new InterleavedFormatter(std::move(format), file1));
  }
  return std::unique_ptr<SeqFormatter>(new SingleEndFormatter(std::move(format), file1));
}

}  // namespace format
}  // namespace seqio
