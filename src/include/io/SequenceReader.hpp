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

#ifndef IO_SEQUENCE_READER_HPP
#define IO_SEQUENCE_READER_HPP

#include "common/Exceptions.hpp"
#include "sequences/ReadPair.hpp"
#include "sequences/Sequence.hpp"

namespace seqio {
namespace io {

/**
 ** \brief Lazy, finite, non-restartable source of records.
 **
 ** next() fills the record and returns true, or returns false once the input is exhausted. close()
 ** releases the underlying inputs, can be called after partial consumption and is idempotent.
 ** Calling next() on a closed reader throws PreConditionException.
 **/
template <typename RecordT>
class RecordReader {
public:
  typedef RecordT Record;

  virtual ~RecordReader() {}

  bool next(Record& record)
  {
    if (closed_) {
      BOOST_THROW_EXCEPTION(common::PreConditionException("Attempt to read from a closed reader"));
    }
    return read(record);
  }

  void close()
  {
    if (!closed_) {
      closed_ = true;
      release();
    }
  }

  bool closed() const { return closed_; }

  /// true if every delivered record carries qualities
  virtual bool deliversQualities() const = 0;

protected:
  virtual bool read(Record& record) = 0;
  virtual void release()            = 0;

private:
  bool closed_ = false;
};

typedef RecordReader<sequences::Sequence> SequenceReader;
typedef RecordReader<sequences::ReadPair> PairedSequenceReader;

}  // namespace io
}  // namespace seqio

#endif  // #ifndef IO_SEQUENCE_READER_HPP
