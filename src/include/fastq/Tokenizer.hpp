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
 ** \file fastq/Tokenizer.hpp
 **
 ** Component to read FASTQ files.
 **
 ** \author Roman Petrovski
 **/

#pragma once

#include <iostream>
#include <string>
#include <vector>

#include "fastq/Token.hpp"

namespace seqio {
namespace fastq {

/**
 ** \brief Splits a stream into FASTQ records, loading it block by block into an internal buffer.
 **
 ** The buffer doubles whenever a single record does not fit. A last line without the terminating
 ** newline is accepted.
 **/
class Tokenizer {
  typedef std::vector<char> BufferType;

public:
  typedef BasicToken<BufferType::iterator> Token;
  static const std::size_t                 DEFAULT_BUFFER_SIZE = 1024 * 1024;

private:
  const bool               mixedNewline_ = false;
  std::istream&            input_;
  BufferType               buffer_;
  BufferType::iterator     bufferIterator_;
  Token                    currentToken_;
  std::size_t              recordCount_ = 0;

public:
  Tokenizer(
      std::istream&     input,
      const std::size_t bufferSize   = DEFAULT_BUFFER_SIZE,
      const bool        mixedNewline = false)
    : mixedNewline_(mixedNewline), input_(input)
  {
    buffer_.reserve(bufferSize);
    bufferIterator_ = buffer_.begin();
  }
  const Token& token() const { return currentToken_; }

  /// number of complete records delivered so far
  std::size_t recordCount() const { return recordCount_; }

  /**
   * \return false when the stream is exhausted
   * \throws FastqInvalidFormat on malformed or truncated records
   */
  bool next();

private:
  void load();
};

}  // namespace fastq
}  // namespace seqio
