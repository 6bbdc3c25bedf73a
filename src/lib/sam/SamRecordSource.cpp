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

#include <cerrno>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

#include "common/Exceptions.hpp"
#include "sam/SamRecordSource.hpp"
#include "sequences/Sequence.hpp"

namespace seqio {
namespace sam {

namespace {
enum Column { QNAME = 0, FLAG = 1, SEQ = 9, QUAL = 10, MANDATORY_COLUMNS = 11 };
}  // namespace

bool SamRecordSource::next(AlignmentRecord& record)
{
  std::istream& input = input_->stream();
  while (std::getline(input, line_)) {
    ++lineNumber_;
    if (!line_.empty() && '\r' == line_.back()) {
      line_.pop_back();
    }
    if (line_.empty() || '@' == line_.front()) {
      continue;
    }

    boost::algorithm::split(fields_, line_, boost::algorithm::is_any_of("\t"));
    if (MANDATORY_COLUMNS > fields_.size()) {
      BOOST_THROW_EXCEPTION(common::FormatException(
          (boost::format("At line %d of %s: expected at least %d tab separated SAM columns, found %d") %
           lineNumber_ % name() % MANDATORY_COLUMNS % fields_.size())
              .str()));
    }

    unsigned flag = 0;
    try {
      flag = boost::lexical_cast<unsigned>(fields_[FLAG]);
    } catch (const boost::bad_lexical_cast&) {
      flag = 0x10000;
    }
    if (0xffff < flag) {
      BOOST_THROW_EXCEPTION(common::FormatException(
          (boost::format("At line %d of %s: invalid SAM flag '%s'") % lineNumber_ % name() %
           sequences::truncateString(fields_[FLAG]))
              .str()));
    }

    record.flag = static_cast<uint16_t>(flag);
    if (record.secondary() || record.supplementary()) {
      continue;
    }
    record.queryName.swap(fields_[QNAME]);
    record.querySequence.clear();
    if ("*" != fields_[SEQ]) {
      record.querySequence.swap(fields_[SEQ]);
    }
    if ("*" == fields_[QUAL]) {
      record.queryQualities = boost::none;
    } else {
      record.queryQualities = std::move(fields_[QUAL]);
    }
    return true;
  }

  if (input.bad()) {
    BOOST_THROW_EXCEPTION(common::IoException(errno, "Failed to read SAM from " + name()));
  }
  return false;
}

}  // namespace sam
}  // namespace seqio
