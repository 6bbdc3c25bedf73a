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

#ifndef FORMAT_SEQUENCE_FORMAT_HPP
#define FORMAT_SEQUENCE_FORMAT_HPP

#include <memory>
#include <string>

#include <boost/optional.hpp>

#include "sequences/Sequence.hpp"

namespace seqio {
namespace format {

/**
 ** \brief Renders one record as text in a sequence file format
 **/
class SequenceFormat {
public:
  virtual ~SequenceFormat() {}
  virtual std::string format(const sequences::Sequence& read) const = 0;
  virtual const char* name() const                                  = 0;
};

/**
 ** \brief ">name\nsequence\n". With a non-zero line length the sequence is split into lines of at most
 **        that many characters. Colorspace records are written with their primer.
 **/
class FastaFormat : public SequenceFormat {
public:
  explicit FastaFormat(std::size_t lineLength = 0, bool colorspace = false)
    : lineLength_(lineLength), colorspace_(colorspace)
  {
  }

  std::string format(const sequences::Sequence& read) const override;
  const char* name() const override { return "fasta"; }

private:
  const std::size_t lineLength_;
  const bool        colorspace_;
};

/**
 ** \brief "@name\nsequence\n+name2\nqualities\n". Colorspace records are written with their primer.
 **/
class FastqFormat : public SequenceFormat {
public:
  explicit FastqFormat(bool colorspace = false) : colorspace_(colorspace) {}

  /**
   * \throws InvalidOptionException for records without qualities
   */
  std::string format(const sequences::Sequence& read) const override;
  const char* name() const override { return "fastq"; }

private:
  const bool colorspace_;
};

/**
 * \brief output format for a path
 *
 * Without an explicit fileFormat, the format is guessed from the path. When that fails, qualities decides:
 * fastq if they are available, fasta if not. Only fasta and fastq can be written.
 *
 * \param qualities whether the written records will have qualities, none if unknown
 * \throws UnknownFileTypeException if the format cannot be determined or is not writable
 * \throws InvalidOptionException if fastq is requested for records without qualities
 */
std::unique_ptr<SequenceFormat> getFormat(
    const std::string&                  path,
    const boost::optional<std::string>& fileFormat = boost::none,
    bool                                colorspace = false,
    boost::optional<bool>               qualities  = boost::none,
    std::size_t                         lineLength = 0);

}  // namespace format
}  // namespace seqio

#endif  // #ifndef FORMAT_SEQUENCE_FORMAT_HPP
