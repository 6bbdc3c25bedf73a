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

#ifndef IO_FILE_FORMAT_HPP
#define IO_FILE_FORMAT_HPP

#include <iostream>
#include <string>
#include <utility>

#include <boost/optional.hpp>

namespace seqio {
namespace io {

class PeekableInputStream;

/**
 ** \brief Record encodings. Colorspace is an orthogonal flag: SRA_FASTQ only exists for colorspace,
 **        SAM and BAM do not support it.
 **/
enum class FileFormat { FASTA, FASTQ, SRA_FASTQ, SAM, BAM };

/// "fasta", "fastq", "sra-fastq", "sam", "bam"
const char* toString(FileFormat format);

inline std::ostream& operator<<(std::ostream& os, FileFormat format) { return os << toString(format); }

/**
 * \brief case-insensitive lookup of a format name
 * \return none if the name is not one of the known formats
 */
boost::optional<FileFormat> parseFileFormat(const std::string& name);

/**
 * \brief splits off the extension, looking through one compression suffix (.gz, .bz2, .xz)
 * \return (stem, extension, compression suffix). Extensions keep their leading dot and are empty when absent.
 */
struct SplitPath {
  std::string stem;
  std::string extension;
  std::string compression;
};
SplitPath splitExtCompressed(const std::string& path);

/**
 * \brief guesses the format from the file name extension
 *
 * .fasta .fa .fna .csfasta .csfa are FASTA, .fastq .fq and *_sequence.txt are FASTQ, .sam and .bam are
 * SAM and BAM. The extension is compared case-insensitively.
 *
 * \throws UnknownFileTypeException if raiseOnFailure is set and the extension is not recognized
 */
boost::optional<FileFormat> guessFormatFromName(const std::string& path, bool raiseOnFailure = false);

/**
 * \brief guesses the format from the first line that is neither blank nor a '#' comment: '>' is FASTA,
 *        '@' is FASTQ.
 *
 * The examined line is pushed back into the stream so that the reader sees it as the first line. Comment
 * and blank lines before it are consumed.
 *
 * \return none if the stream is empty or the first significant line starts with anything else
 */
boost::optional<FileFormat> sniffFormat(PeekableInputStream& input);

}  // namespace io
}  // namespace seqio

#endif  // #ifndef IO_FILE_FORMAT_HPP
