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

#include "common/Debug.hpp"
#include "common/SystemCompatibility.hpp"

namespace seqio {
namespace common {

namespace detail {

// global variable that allows turning off cerr output for things such as unit tests.
std::atomic_int        CerrBlocker::cerrBlocked_(0);
boost::recursive_mutex CerrLocker::cerrMutex_;

}  // namespace detail

}  // namespace common
}  // namespace seqio
