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

#include <signal.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include "common/SystemCompatibility.hpp"

namespace seqio {
namespace common {

int getTerminalWindowSize(unsigned short int& ws_row, unsigned short int& ws_col)
{
  winsize ws = {0, 0, 0, 0};
  if (!ioctl(STDERR_FILENO, TIOCGWINSZ, &ws)) {
    ws_row = ws.ws_row;
    ws_col = ws.ws_col;
    return 0;
  }

  return -1;
}

void terminateWithCoreDump()
{
  raise(SIGSEGV);
}

}  // namespace common
}  // namespace seqio
