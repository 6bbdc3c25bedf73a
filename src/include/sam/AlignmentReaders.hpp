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

#ifndef SAM_ALIGNMENT_READERS_HPP
#define SAM_ALIGNMENT_READERS_HPP

#include <memory>

#include "io/SequenceReader.hpp"
#include "sam/AlignmentRecord.hpp"

namespace seqio {
namespace sam {

/// recovers the read from an alignment record, in the orientation stored in the file
sequences::Sequence toSequence(AlignmentRecord&& record);

/**
 ** \brief Single-end view of an alignment stream: every record, or only the first or only the second
 **        mate of each template.
 **/
class SingleEndAlignmentReader : public io::SequenceReader {
public:
  enum MateFilter { ALL, READ1, READ2 };

  SingleEndAlignmentReader(std::unique_ptr<AlignmentRecordSource> source, MateFilter filter = ALL)
    : source_(std::move(source)), filter_(filter)
  {
  }
  ~SingleEndAlignmentReader() override { close(); }

  bool deliversQualities() const override { return true; }

protected:
  bool read(sequences::Sequence& sequence) override;
  void release() override { source_->close(); }

private:
  std::unique_ptr<AlignmentRecordSource> source_;
  const MateFilter                       filter_;
  AlignmentRecord                        record_;
};

/**
 ** \brief Pairs consecutive records of a name-sorted alignment stream.
 **
 ** Both records of a pair must have the same name and be flagged as first and second mate. The pair is
 ** returned first mate first, whatever the order in the stream.
 **/
class PairedEndAlignmentReader : public io::PairedSequenceReader {
public:
  explicit PairedEndAlignmentReader(std::unique_ptr<AlignmentRecordSource> source) : source_(std::move(source))
  {
  }
  ~PairedEndAlignmentReader() override { close(); }

  bool deliversQualities() const override { return true; }

protected:
  bool read(sequences::ReadPair& pair) override;
  void release() override { source_->close(); }

private:
  std::unique_ptr<AlignmentRecordSource> source_;
  AlignmentRecord                        records_[2];
};

}  // namespace sam
}  // namespace seqio

#endif  // #ifndef SAM_ALIGNMENT_READERS_HPP
