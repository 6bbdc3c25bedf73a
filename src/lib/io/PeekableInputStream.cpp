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

#include <algorithm>
#include <cerrno>

#include "common/Exceptions.hpp"
#include "io/PeekableInputStream.hpp"

namespace seqio {
namespace io {

PeekableInputStream::PeekableInputStream(std::unique_ptr<InputStream> input)
  : input_(std::move(input)), stream_(PrependedLineSource(this))
{
  stream_.exceptions(std::ios_base::badbit);
}

void PeekableInputStream::checkNotStarted(const char* operation) const
{
  if (started_) {
    BOOST_THROW_EXCEPTION(common::PreConditionException(
        std::string(operation) + " is not allowed once reading from " + name() + " has begun"));
  }
}

bool PeekableInputStream::readLine(std::string& line)
{
  checkNotStarted("readLine");
  if (!pushedLine_.empty()) {
    BOOST_THROW_EXCEPTION(common::PreConditionException(
        std::string("readLine is not allowed after a line has been pushed back on ") + name()));
  }
  std::istream& input = input_->stream();
  if (!std::getline(input, line)) {
    if (input.bad()) {
      BOOST_THROW_EXCEPTION(common::IoException(errno, std::string("Failed to read from ") + name()));
    }
    return false;
  }
  return true;
}

void PeekableInputStream::pushBack(std::string line)
{
  checkNotStarted("pushBack");
  if (line.empty() || '\n' != line.back()) {
    line.push_back('\n');
  }
  pushedLine_   = std::move(line);
  pushedOffset_ = 0;
}

std::streamsize PeekableInputStream::read(char* s, std::streamsize n)
{
  started_ = true;
  if (pushedLine_.size() > pushedOffset_) {
    const std::size_t count = std::min<std::size_t>(n, pushedLine_.size() - pushedOffset_);
    std::copy(pushedLine_.begin() + pushedOffset_, pushedLine_.begin() + pushedOffset_ + count, s);
    pushedOffset_ += count;
    return count;
  }

  std::istream& input = input_->stream();
  input.read(s, n);
  if (input.bad()) {
    BOOST_THROW_EXCEPTION(common::IoException(errno, std::string("Failed to read from ") + name()));
  }
  const std::streamsize count = input.gcount();
  return count ? count : -1;
}

}  // namespace io
}  // namespace seqio
