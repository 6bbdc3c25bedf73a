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

#pragma once

#include <map>
#include <ostream>
#include <string>

#include "format/SeqFormatter.hpp"
#include "io/ReaderFactory.hpp"
#include "options/SeqioOptions.hpp"

namespace seqio {
namespace workflow {

/// destination stream for each formatter output file name
typedef std::map<std::string, std::ostream*> OutputStreams;

static const std::size_t DEFAULT_BATCH_SIZE = 10000;

/**
 * \brief pulls every record of reader through formatter and writes the result in batches
 *
 * The reader is closed on return. Single readers need a single-end formatter, paired readers a paired one.
 *
 * \return number of records (single-end) or pairs written
 */
std::size_t convertRecords(
    io::OpenedReader&     reader,
    format::SeqFormatter& formatter,
    const OutputStreams&  outputs,
    std::size_t           batchSize = DEFAULT_BATCH_SIZE);

void convert(const options::SeqioOptions& options);

}  // namespace workflow
}  // namespace seqio
