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
 ** \file fasta/FastaReader.hpp
 **
 ** Line oriented FASTA parser.
 **
 **/

#ifndef FASTA_FASTA_READER_HPP
#define FASTA_FASTA_READER_HPP

#include <memory>
#include <string>

#include "io/InputStream.hpp"
#include "io/SequenceReader.hpp"

namespace seqio {
namespace fasta {

/**
 ** \brief Reads FASTA records.
 **
 ** Lines are stripped of surrounding whitespace (including '\r'). Blank lines and lines starting with '#'
 ** are ignored. Sequence lines of a record are concatenated, or joined with '\n' when line breaks are kept
 ** (used for QUAL files where the line structure is irrelevant but the tokens must stay apart).
 **/
class FastaReader : public io::SequenceReader {
public:
  FastaReader(
      std::unique_ptr<io::InputStream> input,
      bool                             keepLinebreaks = false,
      sequences::SequenceBuilder       builder        = sequences::makePlainSequence);
  ~FastaReader() override { close(); }

  bool               deliversQualities() const override { return false; }
  const std::string& name() const { return input_->name(); }

protected:
  bool read(sequences::Sequence& sequence) override;
  void release() override { input_->close(); }

private:
  std::unique_ptr<io::InputStream> input_;
  const bool                       keepLinebreaks_;
  const sequences::SequenceBuilder builder_;

  std::size_t lineNumber_ = 0;
  // header of the record being accumulated, taken from the line that ended the previous record
  bool        haveName_   = false;
  std::string name_;
  std::string line_;
};

}  // namespace fasta
}  // namespace seqio

#endif  // #ifndef FASTA_FASTA_READER_HPP
