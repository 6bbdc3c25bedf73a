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

#ifndef IO_READER_FACTORY_HPP
#define IO_READER_FACTORY_HPP

#include <memory>
#include <string>

#include <boost/optional.hpp>

#include "io/InputStream.hpp"
#include "io/SequenceReader.hpp"

namespace seqio {
namespace io {

/**
 ** \brief Everything openReader needs to pick and construct a reader.
 **
 ** input2 and qualities are optional. format overrides the detection, colorspace is never detected.
 ** singleInputRead is 0 for both mates, 1 or 2 to keep only that mate of interleaved and SAM/BAM input.
 **/
struct ReaderOptions {
  std::unique_ptr<InputStream> input1;
  std::unique_ptr<InputStream> input2;
  std::unique_ptr<InputStream> qualities;
  bool                         colorspace = false;
  boost::optional<std::string> format;
  bool                         interleaved     = false;
  int                          singleInputRead = 0;
};

/**
 ** \brief Result of openReader: exactly one of the two readers is set.
 **/
class OpenedReader {
public:
  explicit OpenedReader(std::unique_ptr<SequenceReader> single) : single_(std::move(single)) {}
  explicit OpenedReader(std::unique_ptr<PairedSequenceReader> paired) : paired_(std::move(paired)) {}

  bool                  isPaired() const { return bool(paired_); }
  SequenceReader&       single() { return *single_; }
  PairedSequenceReader& paired() { return *paired_; }

  std::unique_ptr<SequenceReader>       releaseSingle() { return std::move(single_); }
  std::unique_ptr<PairedSequenceReader> releasePaired() { return std::move(paired_); }

  bool deliversQualities() const
  {
    return paired_ ? paired_->deliversQualities() : single_->deliversQualities();
  }
  void close()
  {
    if (paired_) {
      paired_->close();
    } else if (single_) {
      single_->close();
    }
  }

private:
  std::unique_ptr<SequenceReader>       single_;
  std::unique_ptr<PairedSequenceReader> paired_;
};

/**
 * \brief validates the option combination, resolves the format and constructs the matching reader
 *
 * \throws InvalidOptionException on contradicting options
 * \throws UnknownFileTypeException if the format cannot be resolved
 */
OpenedReader openReader(ReaderOptions options);

}  // namespace io
}  // namespace seqio

#endif  // #ifndef IO_READER_FACTORY_HPP
