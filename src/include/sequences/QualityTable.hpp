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

#ifndef SEQUENCES_QUALITY_TABLE_HPP
#define SEQUENCES_QUALITY_TABLE_HPP

#include <array>
#include <string>

namespace seqio {
namespace sequences {

/**
 ** \brief Decodes numeric QUAL file tokens into phred+33 characters.
 **
 ** Only the canonical decimal spelling of values in [MIN_VALUE, MAX_VALUE] is accepted: no sign other than
 ** a leading '-' for negative values, no leading zeros, no "-0".
 **/
class QualityTable {
public:
  static const int MIN_VALUE = -5;
  static const int MAX_VALUE = 222;
  static const int OFFSET    = 33;

  /// single immutable instance shared by all readers
  static const QualityTable& instance();

  /**
   * \brief decodes one token
   * \return false if the token is not a recognized quality value
   */
  bool decode(const char* begin, const char* end, char& result) const;

  char operator[](int value) const { return table_[value - MIN_VALUE]; }

private:
  QualityTable();

  std::array<char, MAX_VALUE - MIN_VALUE + 1> table_;
};

}  // namespace sequences
}  // namespace seqio

#endif  // #ifndef SEQUENCES_QUALITY_TABLE_HPP
