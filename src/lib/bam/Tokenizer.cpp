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
#include <cstring>

#include "bam/Tokenizer.hpp"
#include "common/Debug.hpp"
#include "common/Exceptions.hpp"

namespace seqio {
namespace bam {

bool Tokenizer::complete() const
{
  const std::size_t bufferLeft = buffer_.size() - offset_;
  if (sizeof(BamRecordHeader) > bufferLeft) {
    return false;
  }
  uint32_t blockSize = 0;
  std::memcpy(&blockSize, buffer_.data() + offset_, sizeof(blockSize));
  return sizeof(blockSize) + blockSize <= bufferLeft;
}

void Tokenizer::load()
{
  const std::size_t pending = buffer_.size() - offset_;
  if (offset_) {
    std::move(buffer_.begin() + offset_, buffer_.end(), buffer_.begin());
  }
  buffer_.resize(pending);
  offset_ = 0;
  if (buffer_.capacity() == pending) {
    SEQIO_THREAD_CERR_DEV_TRACE("growing bam buffer beyond " << buffer_.capacity());
    buffer_.reserve(std::max<std::size_t>(sizeof(BamRecordHeader), buffer_.capacity() * 2));
  }

  const std::size_t available = buffer_.capacity() - pending;
  buffer_.resize(buffer_.capacity());
  input_.read(&buffer_[pending], available);
  if (input_.bad()) {
    BOOST_THROW_EXCEPTION(common::IoException(errno, "Failed to read bam data"));
  }
  buffer_.resize(pending + input_.gcount());
}

bool Tokenizer::next()
{
  while (true) {
    while (!complete()) {
      if (input_.eof()) {
        if (buffer_.size() != offset_) {
          BOOST_THROW_EXCEPTION(common::FormatException(
              std::string("Invalid bam record at the end of the stream: ")
              << (buffer_.size() - offset_) << " bytes left over"));
        }
        currentToken_.envelop(0);
        return false;
      }
      load();
    }

    currentToken_.envelop(buffer_.data() + offset_);
    const std::size_t payload = (currentToken_.readLength() + 1) / 2 + currentToken_.readLength();
    if (sizeof(BamRecordHeader) > currentToken_.size() ||
        currentToken_.cigarEnd() + payload > currentToken_.next()) {
      BOOST_THROW_EXCEPTION(common::FormatException(
          std::string("Corrupt bam record of size ") << currentToken_.size() << " with read length "
                                                       << currentToken_.readLength()));
    }

    offset_ += currentToken_.size();
    if (currentToken_.secondary() || currentToken_.suplementary()) {
      // skip the rubbish
      continue;
    }
    return true;
  }
}

}  // namespace bam
}  // namespace seqio
