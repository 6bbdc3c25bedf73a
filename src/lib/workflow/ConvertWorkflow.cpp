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
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <vector>

#include <boost/format.hpp>
#include <boost/iostreams/filter/gzip.hpp>

#include "common/Debug.hpp"
#include "common/Exceptions.hpp"
#include "common/SystemCompatibility.hpp"
#include "common/Version.hpp"
#include "io/InputStream.hpp"
#include "workflow/ConvertWorkflow.hpp"

namespace seqio {
namespace workflow {

namespace {

void writeBatch(format::FormattedRecords& batch, const OutputStreams& outputs)
{
  for (auto& file : batch) {
    const auto it = outputs.find(file.first);
    if (outputs.end() == it) {
      BOOST_THROW_EXCEPTION(common::PreConditionException("No output stream for " + file.first));
    }
    std::ostream& os = *it->second;
    for (const std::string& record : file.second) {
      if (!os.write(record.data(), record.size())) {
        BOOST_THROW_EXCEPTION(common::IoException(
            errno, std::string("Error writing output stream ") + file.first + ". Error: " + strerror(errno)));
      }
    }
    file.second.clear();
  }
}

template <typename ReaderT>
std::size_t pump(
    ReaderT& reader, format::SeqFormatter& formatter, const OutputStreams& outputs, std::size_t batchSize)
{
  typename ReaderT::Record record;
  format::FormattedRecords batch;
  std::size_t              inBatch = 0;
  while (reader.next(record)) {
    formatter.format(batch, record);
    if (++inBatch == batchSize) {
      writeBatch(batch, outputs);
      inBatch = 0;
    }
  }
  writeBatch(batch, outputs);
  reader.close();
  return formatter.written();
}

void flush(const OutputStreams& outputs)
{
  for (const auto& output : outputs) {
    if (!output.second->flush()) {
      BOOST_THROW_EXCEPTION(common::IoException(errno, "Failed to flush output " + output.first));
    }
  }
}

}  // namespace

std::size_t convertRecords(
    io::OpenedReader&     reader,
    format::SeqFormatter& formatter,
    const OutputStreams&  outputs,
    std::size_t           batchSize)
{
  if (reader.isPaired() != formatter.paired()) {
    BOOST_THROW_EXCEPTION(common::PreConditionException(
        reader.isPaired() ? "Paired reads cannot be written by a single-end formatter"
                          : "Single-end reads cannot be written by a paired formatter"));
  }
  if (!batchSize) {
    batchSize = DEFAULT_BATCH_SIZE;
  }
  const std::size_t written = reader.isPaired() ? pump(reader.paired(), formatter, outputs, batchSize)
                                                : pump(reader.single(), formatter, outputs, batchSize);
  flush(outputs);
  return written;
}

void convert(const options::SeqioOptions& options)
{
  if (options.verbose_) {
    SEQIO_THREAD_CERR << "Version: " << common::Version::string() << std::endl;
    SEQIO_THREAD_CERR << "argc: " << options.argc() << " argv: " << options.getCommandLine() << std::endl;
  }

  io::ReaderOptions readerOptions;
  readerOptions.input1 = io::openInput(options.inputFile1_);
  if (!options.inputFile2_.empty()) {
    readerOptions.input2 = io::openInput(options.inputFile2_);
  }
  if (!options.qualityFile_.empty()) {
    readerOptions.qualities = io::openInput(options.qualityFile_);
  }
  if (!options.inputFormat_.empty()) {
    readerOptions.format = options.inputFormat_;
  }
  readerOptions.colorspace      = options.colorspace_;
  readerOptions.interleaved     = options.interleaved_;
  readerOptions.singleInputRead = options.singleInputRead_;

  try {
    io::OpenedReader reader = io::openReader(std::move(readerOptions));

    format::FormatOptions formatOptions;
    if (!options.outputFormat_.empty()) {
      formatOptions.fileFormat = options.outputFormat_;
    }
    formatOptions.colorspace = options.colorspace_;
    formatOptions.qualities  = reader.deliversQualities();
    formatOptions.lineLength = options.lineLength_;
    const boost::optional<std::string> output2 =
        options.outputFile2_.empty() ? boost::optional<std::string>()
                                      : boost::optional<std::string>(options.outputFile2_);
    const std::unique_ptr<format::SeqFormatter> formatter =
        format::createSeqFormatter(options.outputFile1_, output2, options.interleavedOutput_, formatOptions);
    if (options.verbose_) {
      SEQIO_THREAD_CERR << "Writing " << formatter->sequenceFormat().name() << " to " << options.outputFile1_
                        << (output2 ? " and " + *output2 : std::string()) << std::endl;
    }

    std::vector<std::unique_ptr<std::ofstream>> files;
    OutputStreams                              outputs;
    for (const std::string& path : {options.outputFile1_, options.outputFile2_}) {
      if (path.empty() || outputs.count(path)) {
        continue;
      }
      if (STDIN_FILE_NAME == path) {
        outputs[path] = &std::cout;
        continue;
      }
      files.emplace_back(new std::ofstream(path, std::ios_base::out | std::ios_base::binary));
      if (!*files.back()) {
        BOOST_THROW_EXCEPTION(common::IoException(
            errno, (boost::format("Failed to open output file %s: %s") % path % strerror(errno)).str()));
      }
      outputs[path] = files.back().get();
    }

    const std::size_t written = convertRecords(reader, *formatter, outputs);
    if (options.verbose_) {
      const format::SeqFormatter::BasePairs bp = formatter->writtenBp();
      SEQIO_THREAD_CERR << "Wrote " << written << (formatter->paired() ? " read pairs" : " reads") << " ("
                        << bp.first << " + " << bp.second << " bp)" << std::endl;
    }
  } catch (boost::iostreams::gzip_error& e) {
    BOOST_THROW_EXCEPTION(common::IoException(
        EIO,
        e.what() + std::string(" ") + std::to_string(e.error()) +
            (boost::iostreams::gzip::zlib_error == e.error()
                 ? (" zlib error:" + std::to_string(e.zlib_error_code()))
                 : std::string(""))));
  }
}

}  // namespace workflow
}  // namespace seqio
