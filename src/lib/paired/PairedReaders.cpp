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
#include "paired/PairedReaders.hpp"

namespace seqio {
namespace paired {

bool PairedFileReader::read(sequences::ReadPair& pair)
{
  if (!reader1_->next(pair[0])) {
    if (reader2_->next(pair[1])) {
      BOOST_THROW_EXCEPTION(common::PairingException(
          "Reads are improperly paired. There are more reads in file 2 than in file 1."));
    }
    return false;
  }
  if (!reader2_->next(pair[1])) {
    BOOST_THROW_EXCEPTION(common::PairingException(
        "Reads are improperly paired. There are more reads in file 1 than in file 2."));
  }
  if (!sequences::sequenceNamesMatch(pair[0], pair[1])) {
    BOOST_THROW_EXCEPTION(common::PairingException(
        (boost::format("Reads are improperly paired. Read name '%s' in file 1 does not match '%s' in file 2.") %
         pair[0].getName() % pair[1].getName())
            .str()));
  }
  return true;
}

bool InterleavedReader::read(sequences::ReadPair& pair)
{
  if (!reader_->next(pair[0])) {
    return false;
  }
  if (!reader_->next(pair[1])) {
    BOOST_THROW_EXCEPTION(
        common::PairingException("Interleaved input file incomplete: Last record has no partner."));
  }
  if (!sequences::sequenceNamesMatch(pair[0], pair[1])) {
    BOOST_THROW_EXCEPTION(common::PairingException(
        (boost::format("Reads are improperly paired. Name '%s' (first) does not match '%s' (second).") %
         pair[0].getName() % pair[1].getName())
            .str()));
  }
  return true;
}

namespace {

std::size_t mateIndex(int mate)
{
  if (1 != mate && 2 != mate) {
    BOOST_THROW_EXCEPTION(common::InvalidParameterException(
        (boost::format("Mate must be 1 or 2, got %d") % mate).str()));
  }
  return mate - 1;
}

}  // namespace

MateProjectionReader::MateProjectionReader(std::unique_ptr<io::PairedSequenceReader> reader, int mate)
  : reader_(std::move(reader)), index_(mateIndex(mate))
{
}

bool MateProjectionReader::read(sequences::Sequence& sequence)
{
  if (!reader_->next(pair_)) {
    return false;
  }
  sequence = std::move(pair_[index_]);
  return true;
}

}  // namespace paired
}  // namespace seqio
