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

#include "common/Debug.hpp"
#include "common/Exceptions.hpp"
#include "fastq/Tokenizer.hpp"

namespace seqio {
namespace fastq {

void Tokenizer::load()
{
  const std::size_t pending = std::distance(bufferIterator_, buffer_.end());
  if (buffer_.begin() != bufferIterator_) {
    std::move(bufferIterator_, buffer_.end(), buffer_.begin());
  }
  buffer_.resize(pending);
  if (buffer_.capacity() == pending) {
    SEQIO_THREAD_CERR_DEV_TRACE("growing fastq buffer beyond " << buffer_.capacity());
    buffer_.reserve(std::max<std::size_t>(1, buffer_.capacity() * 2));
  }

  const std::size_t available = buffer_.capacity() - pending;
  buffer_.resize(buffer_.capacity());
  input_.read(&buffer_[pending], available);
  if (input_.bad()) {
    BOOST_THROW_EXCEPTION(common::IoException(errno, "Failed to read fastq data"));
  }
  buffer_.resize(pending + input_.gcount());

  if (mixedNewline_) {
    std::replace(buffer_.begin() + pending, buffer_.end(), '\r', '\n');
  }
  if (input_.eof() && !buffer_.empty() && '\n' != buffer_.back()) {
    buffer_.push_back('\n');
  }
  bufferIterator_ = buffer_.begin();
}

bool Tokenizer::next()
{
  // reset token before having a chance to throw an exception to avoid invalid iterators
  bool complete = currentToken_.reset(bufferIterator_, buffer_.end());
  while (!complete && !input_.eof()) {
    load();
    complete = currentToken_.reset(bufferIterator_, buffer_.end());
  }

  if (!complete) {
    if (!currentToken_.empty()) {
      throw FastqInvalidFormat(
          std::string("FASTQ file ended prematurely after ") << recordCount_ << " complete records");
    }
    return false;
  }

  bufferIterator_ = currentToken_.end();
  ++recordCount_;
  return true;
}

}  // namespace fastq
}  // namespace seqio
