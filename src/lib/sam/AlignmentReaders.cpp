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

#include "common/Exceptions.hpp"
#include "sam/AlignmentReaders.hpp"

namespace seqio {
namespace sam {

sequences::Sequence toSequence(AlignmentRecord&& record)
{
  return sequences::Sequence(
      std::move(record.queryName), std::move(record.querySequence), std::move(record.queryQualities));
}

bool SingleEndAlignmentReader::read(sequences::Sequence& sequence)
{
  while (source_->next(record_)) {
    if ((READ1 == filter_ && !record_.isRead1()) || (READ2 == filter_ && !record_.isRead2())) {
      continue;
    }
    sequence = toSequence(std::move(record_));
    return true;
  }
  return false;
}

bool PairedEndAlignmentReader::read(sequences::ReadPair& pair)
{
  if (!source_->next(records_[0])) {
    return false;
  }
  if (!source_->next(records_[1])) {
    BOOST_THROW_EXCEPTION(common::PairingException(
        (boost::format("Paired-end SAM/BAM file %s ends with read %s that has no mate; make sure your file is "
                       "name-sorted and does not contain any secondary/supplementary alignments.") %
         source_->name() % records_[0].queryName)
            .str()));
  }
  if (records_[0].queryName != records_[1].queryName) {
    BOOST_THROW_EXCEPTION(common::PairingException(
        (boost::format("Consecutive reads %s, %s in paired-end SAM/BAM file do not have the same name; make "
                       "sure your file is name-sorted and does not contain any secondary/supplementary "
                       "alignments.") %
         records_[0].queryName % records_[1].queryName)
            .str()));
  }

  const bool inOrder = records_[0].isRead1() && records_[1].isRead2();
  const bool reverse = records_[0].isRead2() && records_[1].isRead1();
  if (!inOrder && !reverse) {
    BOOST_THROW_EXCEPTION(common::PairingException(
        (boost::format("Reads named %s in paired-end SAM/BAM file are not flagged as first and second mate "
                       "(flags %d and %d)") %
         records_[0].queryName % records_[0].flag % records_[1].flag)
            .str()));
  }
  const std::size_t first = inOrder ? 0 : 1;
  pair[0]                 = toSequence(std::move(records_[first]));
  pair[1]                 = toSequence(std::move(records_[1 - first]));
  return true;
}

}  // namespace sam
}  // namespace seqio
