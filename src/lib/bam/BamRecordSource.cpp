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

#include <algorithm>
#include <vector>

#include <boost/iostreams/filter/gzip.hpp>

#include "bam/BamRecordSource.hpp"
#include "common/Debug.hpp"
#include "common/Exceptions.hpp"

namespace seqio {
namespace bam {

BamRecordSource::BamRecordSource(std::unique_ptr<io::InputStream> input)
  : input_(std::move(input)), tokenizer_(stream_)
{
  stream_.push(boost::iostreams::gzip_decompressor());
  stream_.push(input_->stream());
  stream_.exceptions(std::ios_base::badbit);
  skipToFirstRecord();
}

void BamRecordSource::close()
{
  stream_.reset();
  input_->close();
}

template <typename T>
T BamRecordSource::read(const char* what)
{
  T ret = 0;
  if (!stream_.read((char*)&ret, sizeof(ret))) {
    BOOST_THROW_EXCEPTION(
        common::FormatException(std::string("Unable to read ") + what + " from bam stream " + name()));
  }
  return ret;
}

void BamRecordSource::skip(std::size_t bytes, const char* what)
{
  std::vector<char> buffer(bytes);
  if (bytes && !stream_.read(buffer.data(), bytes)) {
    BOOST_THROW_EXCEPTION(common::FormatException(
        std::string("Unable to read ") + what + " from bam stream " + name() + ". length " << bytes));
  }
}

void BamRecordSource::readMagic()
{
  char magic[4];
  if (!stream_.read(magic, sizeof(magic))) {
    BOOST_THROW_EXCEPTION(common::FormatException("Unable to read magic from bam stream " + name()));
  }

  static const char expected[sizeof(magic)] = {'B', 'A', 'M', 1};
  if (!std::equal(magic, magic + sizeof(magic), expected)) {
    BOOST_THROW_EXCEPTION(common::FormatException("Incorrect magic read from bam stream " + name()));
  }
}

void BamRecordSource::readText()
{
  skip(read<uint32_t>("l_text"), "text");
}

void BamRecordSource::readReferences()
{
  uint32_t n_ref = read<uint32_t>("n_ref");
  while (n_ref--) {
    skip(read<uint32_t>("l_name"), "name");
    read<uint32_t>("l_ref");
  }
}

void BamRecordSource::skipToFirstRecord()
{
  readMagic();
  readText();
  readReferences();
}

bool BamRecordSource::next(sam::AlignmentRecord& record)
{
  if (!tokenizer_.next()) {
    return false;
  }
  const Tokenizer::Token& token = tokenizer_.token();
  const auto              name  = token.getName();
  record.queryName.assign(name.first, name.second);
  record.flag = token.flag();
  token.decodeBases(record.querySequence);
  if (token.hasQscores()) {
    std::string qscores;
    token.decodeQscores(qscores);
    record.queryQualities = std::move(qscores);
  } else {
    record.queryQualities = boost::none;
  }
  return true;
}

}  // namespace bam
}  // namespace seqio
