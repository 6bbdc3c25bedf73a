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

#include <cctype>

#include <boost/format.hpp>

#include "common/Exceptions.hpp"
#include "fasta/FastaQualReader.hpp"

namespace seqio {
namespace fasta {

FastaQualReader::FastaQualReader(
    std::unique_ptr<io::InputStream> fasta, std::unique_ptr<io::InputStream> qual, sequences::SequenceBuilder builder)
  : fastaReader_(std::move(fasta)),
    qualReader_(std::move(qual), true),
    builder_(builder),
    qualityTable_(sequences::QualityTable::instance())
{
}

void FastaQualReader::release()
{
  fastaReader_.close();
  qualReader_.close();
}

std::string FastaQualReader::decodeQualities(const sequences::Sequence& qualRecord) const
{
  const std::string& values = qualRecord.getSequence();
  std::string        ret;
  ret.reserve(values.size() / 2);
  const char* const end   = values.data() + values.size();
  const char*       token = values.data();
  while (end != token) {
    if (std::isspace(static_cast<unsigned char>(*token))) {
      ++token;
      continue;
    }
    const char* tokenEnd = token;
    while (end != tokenEnd && !std::isspace(static_cast<unsigned char>(*tokenEnd))) {
      ++tokenEnd;
    }
    char quality = 0;
    if (!qualityTable_.decode(token, tokenEnd, quality)) {
      BOOST_THROW_EXCEPTION(common::FormatException(
          (boost::format("Within read named '%s': Found invalid quality value %s") %
           sequences::truncateString(qualRecord.getName()) % std::string(token, tokenEnd))
              .str()));
    }
    ret.push_back(quality);
    token = tokenEnd;
  }
  return ret;
}

bool FastaQualReader::read(sequences::Sequence& sequence)
{
  const bool haveFasta = fastaReader_.next(fastaRecord_);
  const bool haveQual  = qualReader_.next(qualRecord_);
  if (!haveFasta && !haveQual) {
    return false;
  }
  if (!haveQual) {
    BOOST_THROW_EXCEPTION(common::PairingException(
        "Reads are improperly paired. There are more reads in the FASTA file than in the QUAL file."));
  }
  if (!haveFasta) {
    BOOST_THROW_EXCEPTION(common::PairingException(
        "Reads are improperly paired. There are more reads in the QUAL file than in the FASTA file."));
  }
  if (fastaRecord_.getName() != qualRecord_.getName()) {
    BOOST_THROW_EXCEPTION(common::FormatException(
        (boost::format("The read names in the FASTA and QUAL file do not match ('%s' != '%s')") %
         fastaRecord_.getName() % qualRecord_.getName())
            .str()));
  }

  sequences::Sequence::Name     name     = fastaRecord_.getName();
  sequences::Sequence::Residues residues = fastaRecord_.getSequence();
  sequence = builder_(std::move(name), std::move(residues), decodeQualities(qualRecord_), std::string());
  return true;
}

}  // namespace fasta
}  // namespace seqio
