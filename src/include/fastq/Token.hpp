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
 ** \file fastq/Token.hpp
 **
 ** Component to read FASTQ files.
 **
 ** \author Roman Petrovski
 **/

#pragma once

#include <algorithm>
#include <iostream>
#include <string>

#include "common/Exceptions.hpp"

namespace seqio {
namespace fastq {

/**
 ** \brief Exception thrown when fastq violation is encountered.
 **
 **/
class FastqInvalidFormat : public common::FormatException {
public:
  FastqInvalidFormat(const std::string& message) : common::FormatException("Corrupt fastq: " + message) {}
};

/**
 ** \brief Ranges of the four lines of one FASTQ record within a buffer.
 **
 ** Empty lines between records are skipped. The sequence and quality lengths are not compared here,
 ** colorspace records legitimately have one residue more than qualities.
 **/
template <typename IT>
class BasicToken {
private:
  bool valid_;
  IT   headerBegin_;
  IT   headerEnd_;
  IT   baseCallsBegin_;
  IT   baseCallsEnd_;
  IT   name2Begin_;
  IT   name2End_;
  IT   qScoresBegin_;
  IT   qScoresEnd_;
  IT   end_;

public:
  BasicToken() : valid_(false) {}

  bool        valid() const { return valid_; }
  IT          end() const { return end_; }
  bool        empty() const { return end_ == headerBegin_; }
  std::size_t readLength() const { return valid_ ? std::distance(baseCallsBegin_, baseCallsEnd_) : 0; }

  // @return true if complete record has been read
  bool reset(IT begin, IT end)
  {
    valid_ = false;

    headerBegin_ = findNotNewLine(begin, end);
    end_         = end;
    if (end == headerBegin_) {
      return false;
    }
    if ('@' != *headerBegin_) {
      throw FastqInvalidFormat(
          std::string("record is expected to start with '@', but found '") + *headerBegin_ + "'");
    }
    headerEnd_      = findNewLine(headerBegin_, end);
    baseCallsBegin_ = findNotNewLine(headerEnd_, end);
    if (end == baseCallsBegin_) {
      return false;
    }

    // special case for zero-length reads: the empty sequence line has been skipped together with the
    // newline of the header
    const bool zeroLengthRead = '+' == *baseCallsBegin_;
    if (zeroLengthRead) {
      baseCallsEnd_ = baseCallsBegin_;
      name2Begin_   = baseCallsBegin_ + 1;
      name2End_     = findNewLine(name2Begin_, end);
      if (end == name2End_) {
        return false;
      }
      qScoresBegin_ = name2End_;
      qScoresEnd_   = name2End_;
      end_          = name2End_;
      valid_        = true;
      return true;
    }

    baseCallsEnd_ = findNewLine(baseCallsBegin_, end);
    name2Begin_   = findNotNewLine(baseCallsEnd_, end);
    if (end == name2Begin_) {
      return false;
    }
    if ('+' != *name2Begin_) {
      throw FastqInvalidFormat(
          "'+' is missing in fastq record " + std::string(headerBegin_ + 1, headerEnd_));
    }
    ++name2Begin_;
    name2End_     = findNewLine(name2Begin_, end);
    qScoresBegin_ = findNotNewLine(name2End_, end);
    qScoresEnd_   = findNewLine(qScoresBegin_, end);
    if (end == qScoresEnd_) {
      // ended too soon, stay invalid
      return false;
    }
    end_   = qScoresEnd_;
    valid_ = true;
    return true;
  }

  // skip @ at the start of the header
  std::pair<IT, IT> getName() const { return std::make_pair(headerBegin_ + 1, headerEnd_); }
  std::pair<IT, IT> getBases() const { return std::make_pair(baseCallsBegin_, baseCallsEnd_); }
  std::pair<IT, IT> getName2() const { return std::make_pair(name2Begin_, name2End_); }
  std::pair<IT, IT> getQscores() const { return std::make_pair(qScoresBegin_, qScoresEnd_); }

private:
  template <typename IteratorT>
  static IteratorT findNotNewLine(IteratorT itBegin, IteratorT itEnd)
  {
    // this usually ends after first comparison or so
    while (itEnd != itBegin && '\n' == *itBegin) {
      ++itBegin;
    }
    return itBegin;
  }

  template <typename IteratorT>
  static IteratorT findNewLine(IteratorT itBegin, IteratorT itEnd)
  {
    return std::find(itBegin, itEnd, '\n');
  }

  friend std::ostream& operator<<(std::ostream& os, const BasicToken& token)
  {
    if (!token.valid()) {
      return os << "BasicToken():" << (token.empty() ? "empty" : "invalid");
    }
    return os << "BasicToken(" << std::string(token.headerBegin_, token.headerEnd_) << " "
              << std::string(token.baseCallsBegin_, token.baseCallsEnd_) << " "
              << std::string(token.qScoresBegin_, token.qScoresEnd_) << "):valid";
  }
};

}  // namespace fastq
}  // namespace seqio
