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

#ifndef FASTA_FASTA_QUAL_READER_HPP
#define FASTA_FASTA_QUAL_READER_HPP

#include <memory>

#include "fasta/FastaReader.hpp"
#include "sequences/QualityTable.hpp"

namespace seqio {
namespace fasta {

/**
 ** \brief Combines a FASTA file with the matching QUAL file into records with qualities.
 **
 ** Both files are traversed in lock-step and must list the same read names in the same order. QUAL
 ** records hold whitespace separated numeric values that are converted with the QualityTable.
 **/
class FastaQualReader : public io::SequenceReader {
public:
  FastaQualReader(
      std::unique_ptr<io::InputStream> fasta,
      std::unique_ptr<io::InputStream> qual,
      sequences::SequenceBuilder       builder = sequences::makePlainSequence);
  ~FastaQualReader() override { close(); }

  bool deliversQualities() const override { return true; }

protected:
  bool read(sequences::Sequence& sequence) override;
  void release() override;

private:
  std::string decodeQualities(const sequences::Sequence& qualRecord) const;

  FastaReader                      fastaReader_;
  FastaReader                      qualReader_;
  const sequences::SequenceBuilder builder_;
  const sequences::QualityTable&   qualityTable_;
  sequences::Sequence              fastaRecord_;
  sequences::Sequence              qualRecord_;
};

}  // namespace fasta
}  // namespace seqio

#endif  // #ifndef FASTA_FASTA_QUAL_READER_HPP
