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

#ifndef SEQUENCES_SEQUENCE_HPP
#define SEQUENCES_SEQUENCE_HPP

#include <iostream>
#include <map>
#include <string>

#include <boost/optional.hpp>

namespace seqio {
namespace sequences {

/**
 ** \brief shortens user data embedded into messages: strings longer than maxLength are cut to
 **        maxLength - 3 characters followed by "..."
 **/
std::string truncateString(const std::string& s, std::size_t maxLength = 20);

/**
 ** \brief One sequence record: header, residues, optional per-residue qualities, FASTQ secondary header.
 **
 ** Colorspace records carry the primer base split off the raw input sequence. The primer is not part of
 ** getSequence() and is not counted by getLength().
 **
 ** Annotations are opaque key/value pairs attached by downstream processing (trimming). They are
 ** carried along when records are sliced and never interpreted here.
 **/
class Sequence {
public:
  typedef std::string                        Name;
  typedef std::string                        Residues;
  typedef boost::optional<std::string>       Qualities;
  typedef std::map<std::string, std::string> Annotations;

  Sequence() {}

  /**
   * \throws FormatException if qualities are present and their length differs from the sequence length
   */
  Sequence(Name name, Residues sequence, Qualities qualities, Name name2 = Name());

  /**
   * \brief colorspace record with an explicit primer.
   * \throws FormatException if the primer is not one of A, C, G, T or on quality length mismatch
   */
  Sequence(Name name, Residues sequence, Qualities qualities, char primer, Name name2);

  const Name&        getName() const { return name_; }
  const Residues&    getSequence() const { return sequence_; }
  const Qualities&   getQualities() const { return qualities_; }
  bool               hasQualities() const { return bool(qualities_); }
  const Name&        getName2() const { return name2_; }
  bool               isColorspace() const { return bool(primer_); }
  char               getPrimer() const { return primer_ ? *primer_ : '\0'; }
  std::size_t        getLength() const { return sequence_.size(); }
  const Annotations& getAnnotations() const { return annotations_; }

  void setAnnotation(const std::string& key, const std::string& value) { annotations_[key] = value; }

  /**
   * \brief derived record covering [begin, begin + length) of the stored sequence and qualities.
   *        Keeps the name, secondary name, primer and annotations.
   */
  Sequence subsequence(std::size_t begin, std::size_t length = std::string::npos) const;

  bool operator==(const Sequence& that) const
  {
    return name_ == that.name_ && sequence_ == that.sequence_ && qualities_ == that.qualities_ &&
           name2_ == that.name2_ && primer_ == that.primer_ && annotations_ == that.annotations_;
  }
  bool operator!=(const Sequence& that) const { return !(*this == that); }

  friend std::ostream& operator<<(std::ostream& os, const Sequence& sequence);

private:
  void validateQualities() const;
  void validatePrimer() const;

  Name                  name_;
  Residues              sequence_;
  Qualities             qualities_;
  Name                  name2_;
  boost::optional<char> primer_;
  Annotations           annotations_;
};

/**
 * \brief Record constructor selected once per reader: plain, colorspace, SRA colorspace.
 *        Arguments are name, raw sequence as found in the file, qualities, secondary name.
 */
typedef Sequence (*SequenceBuilder)(
    Sequence::Name&& name, Sequence::Residues&& sequence, Sequence::Qualities&& qualities, Sequence::Name&& name2);

Sequence makePlainSequence(
    Sequence::Name&& name, Sequence::Residues&& sequence, Sequence::Qualities&& qualities, Sequence::Name&& name2);

/**
 * \brief splits the first character of the raw sequence off as the primer base
 */
Sequence makeColorspaceSequence(
    Sequence::Name&& name, Sequence::Residues&& sequence, Sequence::Qualities&& qualities, Sequence::Name&& name2);

/**
 * \brief same as makeColorspaceSequence, but the first quality value is dropped. SRA colorspace fastq
 *        carries one quality value for the primer base.
 */
Sequence makeSraColorspaceSequence(
    Sequence::Name&& name, Sequence::Residues&& sequence, Sequence::Qualities&& qualities, Sequence::Name&& name2);

}  // namespace sequences
}  // namespace seqio

#endif  // #ifndef SEQUENCES_SEQUENCE_HPP
