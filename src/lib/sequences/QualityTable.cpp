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

#include "sequences/QualityTable.hpp"

namespace seqio {
namespace sequences {

const QualityTable& QualityTable::instance()
{
  static const QualityTable table;
  return table;
}

QualityTable::QualityTable()
{
  for (int value = MIN_VALUE; MAX_VALUE >= value; ++value) {
    table_[value - MIN_VALUE] = static_cast<char>(OFFSET + value);
  }
}

bool QualityTable::decode(const char* begin, const char* end, char& result) const
{
  const bool negative = begin != end && '-' == *begin;
  if (negative) {
    ++begin;
  }
  // at most three digits, no leading zeros except for "0" itself
  if (begin == end || end - begin > 3 || ('0' == *begin && end - begin > 1)) {
    return false;
  }
  int value = 0;
  for (const char* it = begin; end != it; ++it) {
    if ('0' > *it || '9' < *it) {
      return false;
    }
    value = value * 10 + (*it - '0');
  }
  if (negative) {
    if (0 == value) {
      return false;
    }
    value = -value;
  }
  if (MIN_VALUE > value || MAX_VALUE < value) {
    return false;
  }
  result = (*this)[value];
  return true;
}

}  // namespace sequences
}  // namespace seqio
