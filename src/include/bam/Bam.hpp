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

#pragma once

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>

#include "sam/AlignmentRecord.hpp"

namespace seqio {
namespace bam {

/**
 * \brief Fixed part of a bam alignment record as laid out on disk, followed by the read name
 */
struct BamRecordHeader {
  uint32_t block_size;
  int32_t  refID;
  int32_t  pos;
  uint8_t  l_read_name;
  uint8_t  mapq;
  uint16_t bin;
  uint16_t n_cigar_op;
  uint16_t flag;
  uint32_t l_seq;
  int32_t  next_refID;
  int32_t  next_pos;
  int32_t  tlen;
  char     read_name[];
};

/**
 * \brief qualities of records stored without them are filled with this value
 */
static const unsigned char MISSING_QSCORE = 0xff;

class BamRecordAccessor {
  const BamRecordHeader* h_;

public:
  BamRecordAccessor(const char* bh = 0) : h_((const BamRecordHeader*)bh) {}

  bool empty() const { return !h_; }
  void envelop(const char* bh) { h_ = (const BamRecordHeader*)bh; }

  std::size_t size() const { return sizeof(h_->block_size) + h_->block_size; }

  const char* current() const { return (const char*)h_; }
  const char* next() const { return (const char*)h_ + size(); }

  uint16_t          flag() const { return h_->flag; }
  bool              secondary() const { return h_->flag & sam::Flag::SECONDARY_ALIGNMENT; }
  bool              suplementary() const { return h_->flag & sam::Flag::SUPPLEMENTARY_ALIGNMENT; }
  bool              reverse() const { return h_->flag & sam::Flag::REVERSE_COMPLEMENT; }
  bool              paired() const { return h_->flag & sam::Flag::MULTIPLE_SEGMENTS; }
  bool              first() const { return h_->flag & sam::Flag::FIRST_IN_TEMPLATE; }
  bool              last() const { return h_->flag & sam::Flag::LAST_IN_TEMPLATE; }
  const std::size_t readLength() const { return h_->l_seq; }

  const char* nameBegin() const { return h_->read_name; }
  const char* nameEnd() const { return nameBegin() + h_->l_read_name; }
  // name without the 0 terminator
  std::pair<const char*, const char*> getName() const
  {
    const char* end = nameEnd();
    if (nameBegin() != end && !*(end - 1)) {
      --end;
    }
    return std::make_pair(nameBegin(), end);
  }

  const char* cigarBegin() const { return nameEnd(); }
  const char* cigarEnd() const { return cigarBegin() + h_->n_cigar_op * 4; }

  const unsigned char* basesBegin() const { return (const unsigned char*)cigarEnd(); }
  const unsigned char* basesEnd() const { return basesBegin() + (h_->l_seq + 1) / 2; }
  const std::pair<const unsigned char*, const unsigned char*> getBases() const
  {
    return std::make_pair(basesBegin(), basesEnd());
  }

  const unsigned char* qscoresBegin() const { return basesEnd(); }
  const unsigned char* qscoresEnd() const { return qscoresBegin() + h_->l_seq; }
  const std::pair<const unsigned char*, const unsigned char*> getQscores() const
  {
    return std::make_pair(qscoresBegin(), qscoresEnd());
  }
  bool hasQscores() const { return h_->l_seq && MISSING_QSCORE != *qscoresBegin(); }

  /**
   * \brief decodes the 4-bit base codes
   */
  void decodeBases(std::string& bases) const
  {
    static const char CODES[] = "=ACMGRSVTWYHKDBN";
    bases.clear();
    for (auto it = basesBegin(); basesEnd() != it; ++it) {
      bases.push_back(CODES[*it >> 4]);
      bases.push_back(CODES[*it & 0x0f]);
    }
    bases.resize(readLength());
  }

  /**
   * \brief phred values to phred+33 characters
   */
  void decodeQscores(std::string& qscores) const
  {
    qscores.clear();
    for (auto it = qscoresBegin(); qscoresEnd() != it; ++it) {
      qscores.push_back(char(*it + 33));
    }
  }

  friend std::ostream& operator<<(std::ostream& os, const BamRecordAccessor& bra)
  {
    const auto name = bra.getName();
    return os << "BamRecordAccessor(" << bra.size() << "s " << std::string(name.first, name.second) << ")";
  }
};

}  // namespace bam
}  // namespace seqio
