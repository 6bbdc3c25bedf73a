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

#ifndef FORMAT_SEQ_FORMATTER_HPP
#define FORMAT_SEQ_FORMATTER_HPP

#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

#include "format/SequenceFormat.hpp"
#include "sequences/ReadPair.hpp"

namespace seqio {
namespace format {

/**
 * \brief formatted records keyed by output file name, in the order they have to be written
 */
typedef std::map<std::string, std::vector<std::string>> FormattedRecords;

/**
 ** \brief Formats single reads or read pairs into the right destinations and counts what was written.
 **
 ** Writing the formatted records is up to the caller, which allows batching and writing from other
 ** threads. written() counts reads for single-end and pairs for paired output.
 **/
class SeqFormatter {
public:
  typedef std::pair<std::size_t, std::size_t> BasePairs;

  SeqFormatter(std::unique_ptr<SequenceFormat> format, const std::string& file1)
    : format_(std::move(format)), file1_(file1)
  {
  }
  virtual ~SeqFormatter() {}

  /**
   * \param read2 mate of read1 or null. Ignored by single-end formatters, required by the others.
   */
  virtual void format(
      FormattedRecords& result, const sequences::Sequence& read1, const sequences::Sequence* read2 = 0) = 0;

  void format(FormattedRecords& result, const sequences::ReadPair& pair) { format(result, pair[0], &pair[1]); }

  /// true if format requires read2
  virtual bool paired() const = 0;

  std::size_t           written() const { return written_; }
  /// (read 1 base pairs, read 2 base pairs)
  BasePairs             writtenBp() const { return BasePairs(read1Bp_, read2Bp_); }
  const SequenceFormat& sequenceFormat() const { return *format_; }
  const std::string&    file1() const { return file1_; }

protected:
  void countPair(const sequences::Sequence& read1, const sequences::Sequence& read2)
  {
    ++written_;
    read1Bp_ += read1.getLength();
    read2Bp_ += read2.getLength();
  }
  static const sequences::Sequence& requireMate(const sequences::Sequence* read2);

  std::unique_ptr<SequenceFormat> format_;
  const std::string               file1_;
  std::size_t                     written_ = 0;
  std::size_t                     read1Bp_ = 0;
  std::size_t                     read2Bp_ = 0;
};

class SingleEndFormatter : public SeqFormatter {
public:
  SingleEndFormatter(std::unique_ptr<SequenceFormat> format, const std::string& file1)
    : SeqFormatter(std::move(format), file1)
  {
  }

  void format(
      FormattedRecords& result, const sequences::Sequence& read1, const sequences::Sequence* read2 = 0) override;
  using SeqFormatter::format;
  bool paired() const override { return false; }
};

/**
 ** \brief Both mates go to file1, one after the other
 **/
class InterleavedFormatter : public SeqFormatter {
public:
  InterleavedFormatter(std::unique_ptr<SequenceFormat> format, const std::string& file1)
    : SeqFormatter(std::move(format), file1)
  {
  }

  void format(
      FormattedRecords& result, const sequences::Sequence& read1, const sequences::Sequence* read2 = 0) override;
  using SeqFormatter::format;
  bool paired() const override { return true; }
};

class PairedEndFormatter : public SeqFormatter {
public:
  PairedEndFormatter(std::unique_ptr<SequenceFormat> format, const std::string& file1, const std::string& file2)
    : SeqFormatter(std::move(format), file1), file2_(file2)
  {
  }

  void format(
      FormattedRecords& result, const sequences::Sequence& read1, const sequences::Sequence* read2 = 0) override;
  using SeqFormatter::format;
  bool paired() const override { return true; }

  const std::string& file2() const { return file2_; }

private:
  const std::string file2_;
};

/**
 ** \brief getFormat parameters
 **/
struct FormatOptions {
  boost::optional<std::string> fileFormat;
  bool                         colorspace = false;
  boost::optional<bool>        qualities;
  std::size_t                  lineLength = 0;
};

/**
 * \brief formatter writing to file1 (and file2), format derived from file1 with getFormat
 *
 * Paired-end if file2 is given, interleaved if requested, single-end otherwise.
 */
std::unique_ptr<SeqFormatter> createSeqFormatter(
    const std::string&                  file1,
    const boost::optional<std::string>& file2       = boost::none,
    bool                                interleaved = false,
    const FormatOptions&                options     = FormatOptions());

}  // namespace format
}  // namespace seqio

#endif  // #ifndef FORMAT_SEQ_FORMATTER_HPP
