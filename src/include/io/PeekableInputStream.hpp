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

#ifndef IO_PEEKABLE_INPUT_STREAM_HPP
#define IO_PEEKABLE_INPUT_STREAM_HPP

#include <memory>
#include <string>

#include <boost/iostreams/categories.hpp>
#include <boost/iostreams/stream.hpp>

#include "io/InputStream.hpp"

namespace seqio {
namespace io {

/**
 ** \brief Input stream that allows to put back one line taken from the wrapped stream.
 **
 ** Lines are taken with readLine() directly from the wrapped stream. Reading through stream() first
 ** yields the line given to pushBack() and then continues with the wrapped stream. Once stream() has
 ** delivered data, readLine() and pushBack() are no longer allowed.
 **/
class PeekableInputStream : public InputStream {
  class PrependedLineSource {
  public:
    typedef char                           char_type;
    typedef boost::iostreams::source_tag category;

    explicit PrependedLineSource(PeekableInputStream* owner) : owner_(owner) {}
    std::streamsize read(char* s, std::streamsize n) { return owner_->read(s, n); }

  private:
    PeekableInputStream* owner_;
  };

public:
  explicit PeekableInputStream(std::unique_ptr<InputStream> input);

  /**
   * \brief takes the next line from the wrapped stream, without the newline
   * \return false at the end of the wrapped stream
   */
  bool readLine(std::string& line);

  /**
   * \brief arranges for the line to be the first thing stream() delivers. A newline is appended if missing.
   */
  void pushBack(std::string line);

  std::istream&      stream() override { return stream_; }
  const std::string& name() const override { return input_->name(); }
  void               close() override { input_->close(); }
  bool               closed() const override { return input_->closed(); }

private:
  std::streamsize read(char* s, std::streamsize n);
  void            checkNotStarted(const char* operation) const;

  std::unique_ptr<InputStream>               input_;
  std::string                                pushedLine_;
  std::size_t                                pushedOffset_ = 0;
  bool                                       started_      = false;
  boost::iostreams::stream<PrependedLineSource> stream_;
};

}  // namespace io
}  // namespace seqio

#endif  // #ifndef IO_PEEKABLE_INPUT_STREAM_HPP
