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
#include "sequences/Sequence.hpp"

namespace seqio {
namespace sequences {

std::string truncateString(const std::string& s, std::size_t maxLength)
{
  if (s.size() <= maxLength) {
    return s;
  }
  return s.substr(0, maxLength < 3 ? 0 : maxLength - 3) + "...";
}

Sequence::Sequence(Name name, Residues sequence, Qualities qualities, Name name2)
  : name_(std::move(name)), sequence_(std::move(sequence)), qualities_(std::move(qualities)), name2_(std::move(name2))
{
  validateQualities();
}

Sequence::Sequence(Name name, Residues sequence, Qualities qualities, char primer, Name name2)
  : name_(std::move(name)),
    sequence_(std::move(sequence)),
    qualities_(std::move(qualities)),
    name2_(std::move(name2)),
    primer_(primer)
{
  validateQualities();
  validatePrimer();
}

void Sequence::validateQualities() const
{
  if (qualities_ && qualities_->size() != sequence_.size()) {
    if (primer_) {
      BOOST_THROW_EXCEPTION(common::FormatException(
          (boost::format("In read named '%s': length of colorspace quality sequence (%d) and length of read "
                         "(%d) do not match (primer is: '%c')") %
           truncateString(name_) % qualities_->size() % sequence_.size() % *primer_)
              .str()));
    }
    BOOST_THROW_EXCEPTION(common::FormatException(
        (boost::format("In read named '%s': length of quality sequence (%d) and length of read (%d) do not "
                       "match") %
         truncateString(name_) % qualities_->size() % sequence_.size())
            .str()));
  }
}

void Sequence::validatePrimer() const
{
  const char primer = *primer_;
  if ('A' != primer && 'C' != primer && 'G' != primer && 'T' != primer) {
    BOOST_THROW_EXCEPTION(common::FormatException(
        (boost::format("Primer base is '%s' in read '%s', but it should be one of A, C, G, T.") %
         (primer ? std::string(1, primer) : std::string()) % truncateString(name_))
            .str()));
  }
}

Sequence Sequence::subsequence(std::size_t begin, std::size_t length) const
{
  Sequence ret;
  ret.name_        = name_;
  ret.sequence_    = begin < sequence_.size() ? sequence_.substr(begin, length) : Residues();
  ret.qualities_   = qualities_ ? Qualities(begin < qualities_->size() ? qualities_->substr(begin, length)
                                                                      : std::string())
                                : Qualities();
  ret.name2_       = name2_;
  ret.primer_      = primer_;
  ret.annotations_ = annotations_;
  return ret;
}

std::ostream& operator<<(std::ostream& os, const Sequence& sequence)
{
  os << "Sequence(name='" << truncateString(sequence.name_) << "'";
  if (sequence.primer_) {
    os << ", primer='" << *sequence.primer_ << "'";
  }
  os << ", sequence='" << truncateString(sequence.sequence_) << "'";
  if (sequence.qualities_) {
    os << ", qualities='" << truncateString(*sequence.qualities_) << "'";
  }
  return os << ")";
}

Sequence makePlainSequence(
    Sequence::Name&& name, Sequence::Residues&& sequence, Sequence::Qualities&& qualities, Sequence::Name&& name2)
{
  return Sequence(std::move(name), std::move(sequence), std::move(qualities), std::move(name2));
}

Sequence makeColorspaceSequence(
    Sequence::Name&& name, Sequence::Residues&& sequence, Sequence::Qualities&& qualities, Sequence::Name&& name2)
{
  // the first character is the last nucleotide of the primer, the second one encodes the transition from
  // the primer to the first real base of the read
  const char primer = sequence.empty() ? '\0' : sequence.front();
  if (!sequence.empty()) {
    sequence.erase(sequence.begin());
  }
  return Sequence(std::move(name), std::move(sequence), std::move(qualities), primer, std::move(name2));
}

Sequence makeSraColorspaceSequence(
    Sequence::Name&& name, Sequence::Residues&& sequence, Sequence::Qualities&& qualities, Sequence::Name&& name2)
{
  if (qualities && !qualities->empty()) {
    qualities->erase(qualities->begin());
  }
  return makeColorspaceSequence(std::move(name), std::move(sequence), std::move(qualities), std::move(name2));
}

}  // namespace sequences
}  // namespace seqio
