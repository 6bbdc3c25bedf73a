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
 ** \file bam/Tokenizer.hpp
 **
 ** Component to read uncompressed bam record stream.
 **
 ** \author Roman Petrovski
 **/

#pragma once

#include <algorithm>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "bam/Bam.hpp"

namespace seqio {
namespace bam {

/**
 ** \brief Splits the decompressed record section of a bam file into records. Secondary and supplementary
 **        alignments are skipped.
 **
 ** The buffer doubles whenever a single record does not fit.
 **/
class Tokenizer {
  typedef std::vector<char> BufferType;

public:
  typedef BamRecordAccessor Token;
  static const std::size_t  DEFAULT_BUFFER_SIZE = 1024 * 1024;

private:
  std::istream& input_;
  BufferType    buffer_;
  // start of the first record not delivered yet
  std::size_t   offset_ = 0;
  Token         currentToken_;

public:
  Tokenizer(std::istream& input, const std::size_t bufferSize = DEFAULT_BUFFER_SIZE) : input_(input)
  {
    buffer_.reserve(bufferSize);
  }
  const Token& token() const { return currentToken_; }

  /**
   * \throws FormatException for records that are truncated or inconsistent with their block size
   */
  bool next();

private:
  bool complete() const;
  void load();
};

}  // namespace bam
}  // namespace seqio
