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

#ifndef COMMON_DEBUG_HPP
#define COMMON_DEBUG_HPP

#include <atomic>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include <boost/current_function.hpp>
#include <boost/date_time/c_time.hpp>
#include <boost/io/ios_state.hpp>
#include <boost/thread.hpp>

#include "common/SystemCompatibility.hpp"

namespace seqio {

// simple helper for composing error messages
template <typename T>
std::string operator<<(std::string&& str, const T& t)
{
  std::stringstream strm;
  strm << t;
  return str + strm.str();
}

namespace common {

static std::ostream nostream(0);

/**
 * \brief helper macro to simplify the thread-guarded logging. All elements on a single << line are serialized
 * under one CerrLocker
 */
#define SEQIO_THREAD_CERR                                                                          \
  if (const ::seqio::common::detail::CerrLocker& seqio_cerr_lock = ::seqio::common::detail::CerrLocker()) \
    ;                                                                                                \
  else                                                                                               \
    (seqio_cerr_lock.cerrBlocked() ? ::seqio::common::nostream : std::cerr)                          \
        << ::seqio::common::detail::ThreadTimestamp()

#define SEQIO_ASSERT_CERR                                                                     \
  if (::seqio::common::detail::CerrLocker seqio_cerr_lock = ::seqio::common::detail::CerrLocker()) \
    ;                                                                                         \
  else                                                                                        \
    std::cerr << ::seqio::common::detail::ThreadTimestamp()

#define SEQIO_SCOPE_BLOCK_CERR                                                                   \
  if (const ::seqio::common::detail::CerrBlocker blocker = ::seqio::common::detail::CerrBlocker()) \
    ;                                                                                            \
  else

/**
 * \brief Evaluates expression always (even if NDEBUG is set and so on). Also uses ostream serialization
 * which, unlike the standard assert, has shown not to allocate the dynamic memory at the time when you least
 *        expect this to happen.
 */
#define SEQIO_VERIFY_MSG(expr, msg)                                                                      \
  {                                                                                                      \
    if (expr) {                                                                                          \
    } else {                                                                                             \
      SEQIO_ASSERT_CERR << "ERROR: ***** Internal Program Error - assertion (" << #expr << ") failed in " \
                        << (BOOST_CURRENT_FUNCTION) << ":" << __FILE__ << '(' << __LINE__ << "): " << msg \
                        << std::endl;                                                                    \
      ::seqio::common::terminateWithCoreDump();                                                          \
    }                                                                                                    \
  }

#ifdef NDEBUG
#define SEQIO_ASSERT_MSG(expr, msg)
#else
#define SEQIO_ASSERT_MSG(expr, msg) SEQIO_VERIFY_MSG(expr, msg)
#endif

namespace detail {

class ThreadTimestamp {
public:
};

/**
 * \brief formats time stamp and thread id to simplify threaded logging
 */
inline std::ostream& operator<<(std::ostream& os, const ThreadTimestamp&)
{
  // IMPORTANT: this is the way to serialize date without causing any dynamic memory operations to occur
  ::std::time_t t;
  ::std::time(&t);
  ::std::tm curr, *curr_ptr;
  curr_ptr = boost::date_time::c_time::localtime(&t, &curr);

  os << (curr_ptr->tm_year + 1900) << '-' << std::setfill('0') << std::setw(2) << (curr_ptr->tm_mon + 1)
     << '-' << std::setfill('0') << std::setw(2) << curr_ptr->tm_mday << ' ' << std::setfill('0')
     << std::setw(2) << curr_ptr->tm_hour << ':' << std::setfill('0') << std::setw(2) << curr_ptr->tm_min
     << ':' << std::setfill('0') << std::setw(2) << curr_ptr->tm_sec << ' ' << "\t["
     << boost::this_thread::get_id() << "]\t";
  return os;
}

/**
 * \brief Blocks SEQIO_THREAD_CERR messages. Use for unit tests
 */
class CerrBlocker {
  static std::atomic_int cerrBlocked_;

public:
  CerrBlocker();

  ~CerrBlocker();

  operator bool() const { return false; }

  static bool blocked() { return cerrBlocked_; }
};

/**
 * \brief Guards std::cerr for the duration of CerrLocker existance
 *        Restores any changes made to ios::base
 */
class CerrLocker {
  static boost::recursive_mutex             cerrMutex_;
  boost::lock_guard<boost::recursive_mutex> lock_;
  boost::io::ios_base_all_saver             ias_;

public:
  CerrLocker(const CerrLocker& that) : lock_(cerrMutex_), ias_(std::cerr) {}
  CerrLocker() : lock_(cerrMutex_), ias_(std::cerr) {}
  operator bool() const { return false; }

  bool cerrBlocked() const { return CerrBlocker::blocked(); }
};

inline CerrBlocker::CerrBlocker()
{
  ++cerrBlocked_;
}

inline CerrBlocker::~CerrBlocker()
{
  SEQIO_ASSERT_MSG(cerrBlocked_, "Attempt to unblock more times than blocked. something is really wrong");
  --cerrBlocked_;
}

}  // namespace detail
}  // namespace common

/**
 ** \brief Provide a mechanism for detailed level of debugging
 **/
#ifdef SEQIO_THREAD_CERR_DEV_TRACE_ENABLED
#define SEQIO_THREAD_CERR_DEV_TRACE(trace) \
  {                                        \
    SEQIO_THREAD_CERR << trace << std::endl; \
  }
#define SEQIO_DEV_TRACE_BLOCK(block) block
#else
#define SEQIO_THREAD_CERR_DEV_TRACE(blah)
#define SEQIO_DEV_TRACE_BLOCK(block)
#endif

}  // namespace seqio

#endif  // #ifndef COMMON_DEBUG_HPP
