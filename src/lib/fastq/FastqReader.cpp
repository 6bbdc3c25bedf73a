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

#include <boost/format.hpp>

#include "fastq/FastqReader.hpp"

namespace seqio {
namespace fastq {

namespace {
// windows line endings are accepted
const bool MIXED_NEWLINE = true;
}  // namespace

FastqReader::FastqReader(std::unique_ptr<io::InputStream> input, sequences::SequenceBuilder builder)
  : input_(std::move(input)),
    tokenizer_(input_->stream(), Tokenizer::DEFAULT_BUFFER_SIZE, MIXED_NEWLINE),
    builder_(builder)
{
}

bool FastqReader::read(sequences::Sequence& sequence)
{
  if (!tokenizer_.next()) {
    return false;
  }
  const Tokenizer::Token& token = tokenizer_.token();

  const auto nameRange  = token.getName();
  const auto basesRange = token.getBases();
  const auto name2Range = token.getName2();
  const auto qualsRange = token.getQscores();

  sequences::Sequence::Name name(nameRange.first, nameRange.second);
  sequences::Sequence::Name name2(name2Range.first, name2Range.second);
  if (!name2.empty() && name2 != name) {
    throw FastqInvalidFormat(
        (boost::format("At record %d: Sequence descriptions in the FASTQ file don't match ('%s' != '%s'). The "
                       "second sequence description must be either empty or equal to the first description.") %
         tokenizer_.recordCount() % sequences::truncateString(name) % sequences::truncateString(name2))
            .str());
  }

  sequence = builder_(
      std::move(name),
      sequences::Sequence::Residues(basesRange.first, basesRange.second),
      sequences::Sequence::Qualities(std::string(qualsRange.first, qualsRange.second)),
      std::move(name2));
  return true;
}

}  // namespace fastq
}  // namespace seqio
