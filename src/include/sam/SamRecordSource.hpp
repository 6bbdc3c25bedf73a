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

#ifndef SAM_SAM_RECORD_SOURCE_HPP
#define SAM_SAM_RECORD_SOURCE_HPP

#include <memory>
#include <string>
#include <vector>

#include "io/InputStream.hpp"
#include "sam/AlignmentRecord.hpp"

namespace seqio {
namespace sam {

/**
 ** \brief Parses SAM text. Header lines ('@') are skipped, only QNAME, FLAG, SEQ and QUAL are decoded.
 **/
class SamRecordSource : public AlignmentRecordSource {
public:
  explicit SamRecordSource(std::unique_ptr<io::InputStream> input) : input_(std::move(input)) {}

  bool               next(AlignmentRecord& record) override;
  void               close() override { input_->close(); }
  const std::string& name() const override { return input_->name(); }

private:
  std::unique_ptr<io::InputStream> input_;
  std::string                      line_;
  std::vector<std::string>         fields_;
  std::size_t                      lineNumber_ = 0;
};

}  // namespace sam
}  // namespace seqio

#endif  // #ifndef SAM_SAM_RECORD_SOURCE_HPP
