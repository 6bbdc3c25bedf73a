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

#include <cerrno>
#include <iostream>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/iostreams/filter/bzip2.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filter/lzma.hpp>

#include "common/Debug.hpp"
#include "common/Exceptions.hpp"
#include "common/SystemCompatibility.hpp"
#include "io/InputStream.hpp"

namespace seqio {
namespace io {

bool isCompressed(const std::string& path)
{
  return boost::algorithm::ends_with(path, ".gz") || boost::algorithm::ends_with(path, ".bz2") ||
         boost::algorithm::ends_with(path, ".xz");
}

FileInputStream::FileInputStream(const std::string& path) : path_(path)
{
  if (boost::algorithm::ends_with(path_, ".gz")) {
    // also handles multi-member gzip such as BGZF
    input_.push(boost::iostreams::gzip_decompressor());
  } else if (boost::algorithm::ends_with(path_, ".bz2")) {
    input_.push(boost::iostreams::bzip2_decompressor());
  } else if (boost::algorithm::ends_with(path_, ".xz")) {
    input_.push(boost::iostreams::lzma_decompressor());
  }

  if (STDIN_FILE_NAME == path_) {
    input_.push(std::cin);
  } else {
    file_.open(path_, std::ios_base::in | std::ios_base::binary);
    if (!file_) {
      BOOST_THROW_EXCEPTION(common::IoException(errno, std::string("Failed to open input file ") + path_));
    }
    input_.push(file_);
  }
  input_.exceptions(std::ios_base::badbit);
}

void FileInputStream::close()
{
  if (!closed_) {
    closed_ = true;
    input_.reset();
    if (file_.is_open()) {
      file_.close();
    }
  }
}

std::unique_ptr<InputStream> openInput(const std::string& path)
{
  SEQIO_THREAD_CERR_DEV_TRACE("opening input " << path);
  return std::unique_ptr<InputStream>(new FileInputStream(path));
}

}  // namespace io
}  // namespace seqio
