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

#ifndef PAIRED_PAIRED_READERS_HPP
#define PAIRED_PAIRED_READERS_HPP

#include <memory>

#include "io/SequenceReader.hpp"

namespace seqio {
namespace paired {

/**
 ** \brief Reads mate 1 from one reader and mate 2 from another, in lock-step.
 **
 ** Both inputs must run out at the same time and every pair must pass sequenceNamesMatch.
 **/
class PairedFileReader : public io::PairedSequenceReader {
public:
  PairedFileReader(std::unique_ptr<io::SequenceReader> reader1, std::unique_ptr<io::SequenceReader> reader2)
    : reader1_(std::move(reader1)), reader2_(std::move(reader2))
  {
  }
  ~PairedFileReader() override { close(); }

  bool deliversQualities() const override
  {
    return reader1_->deliversQualities() && reader2_->deliversQualities();
  }

protected:
  bool read(sequences::ReadPair& pair) override;
  void release() override
  {
    reader1_->close();
    reader2_->close();
  }

private:
  std::unique_ptr<io::SequenceReader> reader1_;
  std::unique_ptr<io::SequenceReader> reader2_;
};

/**
 ** \brief Takes pairs of consecutive records from a single reader.
 **/
class InterleavedReader : public io::PairedSequenceReader {
public:
  explicit InterleavedReader(std::unique_ptr<io::SequenceReader> reader) : reader_(std::move(reader)) {}
  ~InterleavedReader() override { close(); }

  bool deliversQualities() const override { return reader_->deliversQualities(); }

protected:
  bool read(sequences::ReadPair& pair) override;
  void release() override { reader_->close(); }

private:
  std::unique_ptr<io::SequenceReader> reader_;
};

/**
 ** \brief Single-end view of one mate of a paired reader. The other mate is read and dropped, so the
 **        pairing checks still apply.
 **/
class MateProjectionReader : public io::SequenceReader {
public:
  /**
   * \param mate 1 or 2
   * \throws InvalidParameterException for any other mate number
   */
  MateProjectionReader(std::unique_ptr<io::PairedSequenceReader> reader, int mate);
  ~MateProjectionReader() override { close(); }

  bool deliversQualities() const override { return reader_->deliversQualities(); }

protected:
  bool read(sequences::Sequence& sequence) override;
  void release() override { reader_->close(); }

private:
  std::unique_ptr<io::PairedSequenceReader> reader_;
  const std::size_t                         index_;
  sequences::ReadPair                       pair_;
};

}  // namespace paired
}  // namespace seqio

#endif  // #ifndef PAIRED_PAIRED_READERS_HPP
