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

#ifndef FASTQ_FASTQ_READER_HPP
#define FASTQ_FASTQ_READER_HPP

#include <memory>

#include "fastq/Tokenizer.hpp"
#include "io/InputStream.hpp"
#include "io/SequenceReader.hpp"

namespace seqio {
namespace fastq {

/**
 ** \brief Turns the tokenizer output into records. The builder decides between plain, colorspace and
 **        SRA colorspace records.
 **
 ** A non-empty secondary header must repeat the record header.
 **/
class FastqReader : public io::SequenceReader {
public:
  explicit FastqReader(
      std::unique_ptr<io::InputStream> input, sequences::SequenceBuilder builder = sequences::makePlainSequence);
  ~FastqReader() override { close(); }

  bool deliversQualities() const override { return true; }

protected:
  bool read(sequences::Sequence& sequence) override;
  void release() override { input_->close(); }

private:
  std::unique_ptr<io::InputStream> input_;
  Tokenizer                        tokenizer_;
  const sequences::SequenceBuilder builder_;
};

}  // namespace fastq
}  // namespace seqio

#endif  // #ifndef FASTQ_FASTQ_READER_HPP
