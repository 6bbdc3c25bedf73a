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

#ifndef COMMON_PROGRAM_HPP
#define COMMON_PROGRAM_HPP

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <boost/algorithm/string/join.hpp>
#include <boost/noncopyable.hpp>
#include <boost/program_options.hpp>

#include "common/Debug.hpp"
#include "common/Exceptions.hpp"
#include "common/Version.hpp"

namespace seqio {
namespace common {

namespace bpo = boost::program_options;

/**
 ** Command line handling shared by the seqio tools.
 **
 ** Derived classes register their options in namedOptions_ and validate the parsed values in
 ** postProcess, throwing InvalidOptionException on conflicts.
 **/
class Options : boost::noncopyable {
public:
  enum Action { RUN, HELP, VERSION, ABORT };
  Options();
  virtual ~Options() {}

  /// parses argv and any --response-file. Problems are reported on std::clog and yield ABORT
  Action             parse(int argc, const char* const argv[]);
  std::string        usage() const;
  int                argc() const { return argc_; }
  const char* const* argv() const { return argv_; }

  std::string getCommandLine() const
  {
    return boost::join(std::vector<std::string>(argv(), argv() + argc()), " ");
  }

protected:
  bool                     version_ = false;
  bpo::options_description namedOptions_;

private:
  typedef boost::shared_ptr<bpo::option_description> OptionDescriptionPtr;
  typedef std::vector<OptionDescriptionPtr>          OptionDescriptionPtrs;

  virtual std::string usagePrefix() const = 0;
  virtual void        postProcess(bpo::variables_map&) {}

  Action      abort(const std::string& reason) const;
  std::string helpDefaults(const OptionDescriptionPtrs& options) const;
  std::string help(const OptionDescriptionPtrs& options) const;

  // kept so that usage() can tell --help from --help-defaults
  bpo::variables_map vm_;
  int                argc_ = 0;
  const char* const* argv_ = 0;
};

/**
 ** Parses the command line into O and hands it to callback. Never returns: the process exits with
 ** 0 on success, 1 on option or seqio errors, 2 on other boost errors, 3 on anything else.
 **/
template <class O>
void run(void (*callback)(const O&), int argc, char* argv[])
{
  // avoids locale::facet::_S_create_c_locale failures in program_options on misconfigured hosts
  setenv("LC_ALL", "C", 0);
  int status = 0;
  try {
    O options;
    switch (options.parse(argc, argv)) {
    case O::RUN:
      callback(options);
      break;
    case O::HELP:
      std::cout << options.usage() << std::endl;
      break;
    case O::VERSION:
      std::cout << Version::string() << std::endl;
      break;
    default:
      status = 1;
    }
  } catch (const ExceptionData& exception) {
    std::clog << "Error: " << exception.getContext() << ": " << exception.getMessage() << std::endl;
    status = 1;
  } catch (const boost::exception& e) {
    std::clog << "Error: boost::exception: " << boost::diagnostic_information(e) << std::endl;
    status = 2;
  } catch (const std::exception& e) {
    std::clog << "Error: " << e.what() << std::endl;
    status = 3;
  }
  exit(status);
}

}  // namespace common
}  // namespace seqio

#endif  // #ifndef COMMON_PROGRAM_HPP
