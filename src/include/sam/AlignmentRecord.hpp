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

#ifndef SAM_ALIGNMENT_RECORD_HPP
#define SAM_ALIGNMENT_RECORD_HPP

#include <cstdint>
#include <iostream>
#include <string>

#include <boost/optional.hpp>

namespace seqio {
namespace sam {

enum Flag : uint16_t {
  MULTIPLE_SEGMENTS               = 0x1,
  ALL_PROPERLY_ALIGNED            = 0x2,
  UNMAPPED                        = 0x4,
  UNMAPPD_NEXT_SEGMENT            = 0x8,
  REVERSE_COMPLEMENT              = 0x10,
  REVERSE_COMPLEMENT_NEXT_SEGMENT = 0x20,
  FIRST_IN_TEMPLATE               = 0x40,
  LAST_IN_TEMPLATE                = 0x80,
  SECONDARY_ALIGNMENT             = 0x100,
  FAILED_FILTERS                  = 0x200,
  DUPLICATE                       = 0x400,
  SUPPLEMENTARY_ALIGNMENT         = 0x800
};

/**
 ** \brief The parts of a SAM/BAM record needed to recover the sequenced read.
 **
 ** Qualities are phred+33 characters. Records stored without qualities have none.
 **/
struct AlignmentRecord {
  std::string                  queryName;
  std::string                  querySequence;
  boost::optional<std::string> queryQualities;
  uint16_t                     flag = 0;

  bool isRead1() const { return flag & Flag::FIRST_IN_TEMPLATE; }
  bool isRead2() const { return flag & Flag::LAST_IN_TEMPLATE; }
  bool secondary() const { return flag & Flag::SECONDARY_ALIGNMENT; }
  bool supplementary() const { return flag & Flag::SUPPLEMENTARY_ALIGNMENT; }

  friend std::ostream& operator<<(std::ostream& os, const AlignmentRecord& record)
  {
    return os << "AlignmentRecord(" << record.queryName << "," << record.flag << ")";
  }
};

/**
 ** \brief Decoded alignment records in file order, secondary and supplementary alignments excluded.
 **/
class AlignmentRecordSource {
public:
  virtual ~AlignmentRecordSource() {}
  /// \return false at the end of the input
  virtual bool               next(AlignmentRecord& record) = 0;
  virtual void               close()                       = 0;
  virtual const std::string& name() const                  = 0;
};

}  // namespace sam
}  // namespace seqio

#endif  // #ifndef SAM_ALIGNMENT_RECORD_HPP
