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

#ifndef SEQUENCES_READ_PAIR_HPP
#define SEQUENCES_READ_PAIR_HPP

#include <array>

#include "sequences/Sequence.hpp"

namespace seqio {
namespace sequences {

class ReadPair : public std::array<Sequence, 2> {
public:
  std::size_t getLength() const { return at(0).getLength() + at(1).getLength(); }

  friend std::ostream& operator<<(std::ostream& os, const ReadPair& pair)
  {
    return os << "ReadPair(" << pair[0] << "," << pair[1] << ")";
  }
};

/**
 ** \brief true if the two names identify mates of the same template.
 **
 ** Only the first whitespace-delimited word of each name is compared. When both words end in '1' or '2'
 ** the last character is dropped from both before the comparison, so "r/1" matches "r/2" and also "r.2"
 ** matches "r.1". fastq-dump writes identical names for both mates, which match as well.
 **/
bool sequenceNamesMatch(const std::string& name1, const std::string& name2);

inline bool sequenceNamesMatch(const Sequence& read1, const Sequence& read2)
{
  return sequenceNamesMatch(read1.getName(), read2.getName());
}

}  // namespace sequences
}  // namespace seqio

#endif  // #ifndef SEQUENCES_READ_PAIR_HPP
