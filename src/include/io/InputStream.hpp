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

#ifndef IO_INPUT_STREAM_HPP
#define IO_INPUT_STREAM_HPP

#include <fstream>
#include <istream>
#include <memory>
#include <string>

#include <boost/iostreams/filtering_stream.hpp>

namespace seqio {
namespace io {

/**
 ** \brief Named byte source consumed by the record readers.
 **
 ** The name is what format detection looks at. It is a path for files, "-" for standard input or
 ** whatever the owner of a borrowed stream chose.
 **/
class InputStream {
public:
  virtual ~InputStream() {}
  virtual std::istream&      stream()       = 0;
  virtual const std::string& name() const   = 0;
  virtual void               close()        = 0;
  virtual bool               closed() const = 0;
};

/**
 ** \brief Input opened by path. ".gz", ".bz2" and ".xz" files are decompressed on the fly. "-" reads
 **        standard input.
 **/
class FileInputStream : public InputStream {
public:
  /**
   * \throws IoException if the file cannot be opened
   */
  explicit FileInputStream(const std::string& path);
  ~FileInputStream() override { close(); }

  std::istream&      stream() override { return input_; }
  const std::string& name() const override { return path_; }
  void               close() override;
  bool               closed() const override { return closed_; }

private:
  const std::string                   path_;
  std::ifstream                       file_;
  boost::iostreams::filtering_istream input_;
  bool                                closed_ = false;
};

/**
 ** \brief Adapter for a stream owned by somebody else. Closing only marks the adapter closed.
 **/
class BorrowedInputStream : public InputStream {
public:
  BorrowedInputStream(std::istream& input, const std::string& name) : input_(input), name_(name) {}

  std::istream&      stream() override { return input_; }
  const std::string& name() const override { return name_; }
  void               close() override { closed_ = true; }
  bool               closed() const override { return closed_; }

private:
  std::istream&     input_;
  const std::string name_;
  bool              closed_ = false;
};

/**
 * \brief opens a path ("-" for standard input) as a possibly compressed input
 */
std::unique_ptr<InputStream> openInput(const std::string& path);

/**
 * \brief true if the path ends with one of the decompressed suffixes: .gz, .bz2, .xz
 */
bool isCompressed(const std::string& path);

}  // namespace io
}  // namespace seqio

#endif  // #ifndef IO_INPUT_STREAM_HPP
