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

#ifndef COMMON_SYSTEM_COMPATIBILITY_HPP
#define COMMON_SYSTEM_COMPATIBILITY_HPP

#define STDIN_FILE_NAME "-"

namespace seqio {
namespace common {

int getTerminalWindowSize(unsigned short int& ws_row, unsigned short int& ws_col);

/**
 * \brief Generate a core dump with a meaningful backtrace
 */
void terminateWithCoreDump();

}  // namespace common
}  // namespace seqio

#endif  // #ifndef COMMON_SYSTEM_COMPATIBILITY_HPP
