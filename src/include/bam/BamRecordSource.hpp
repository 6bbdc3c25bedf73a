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

#pragma once

#include <istream>
#include <memory>

#include <boost/iostreams/filtering_stream.hpp>

#include "bam/Tokenizer.hpp"
#include "io/InputStream.hpp"
#include "sam/AlignmentRecord.hpp"

namespace seqio {
namespace bam {

/**
 * \brief Decompresses the BGZF input, skips the bam header and decodes the alignment records
 */
class BamRecordSource : public sam::AlignmentRecordSource {
public:
  /**
   * \throws FormatException if the input does not start with a valid bam header
   */
  explicit BamRecordSource(std::unique_ptr<io::InputStream> input);

  bool               next(sam::AlignmentRecord& record) override;
  void               close() override;
  const std::string& name() const override { return input_->name(); }

private:
  void readMagic();
  void readText();
  void readReferences();
  void skipToFirstRecord();
  template <typename T>
  T read(const char* what);
  void skip(std::size_t bytes, const char* what);

  std::unique_ptr<io::InputStream>    input_;
  boost::iostreams::filtering_istream stream_;
  Tokenizer                           tokenizer_;
};

}  // namespace bam
}  // namespace seqio
