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
#include <fstream>
#include <sstream>

#include <boost/tokenizer.hpp>

#include "common/Program.hpp"
#include "common/SystemCompatibility.hpp"

namespace seqio {
namespace common {

namespace {

const char* const HELP_OPTION          = "help";
const char* const HELP_DEFAULTS_OPTION = "help-defaults";
const char* const RESPONSE_FILE_OPTION = "response-file";

/// whitespace-separated arguments stored in a response file
std::vector<std::string> readResponseFile(const std::string& path)
{
  std::ifstream is(path.c_str());
  if (!is) {
    BOOST_THROW_EXCEPTION(InvalidOptionException("Could not open response file: " + path));
  }
  std::ostringstream contents;
  contents << is.rdbuf();
  if (is.bad()) {
    BOOST_THROW_EXCEPTION(InvalidOptionException("Could not read response file: " + path));
  }
  const std::string                                   text = contents.str();
  const boost::char_separator<char>                   separator(" \t\n\r");
  const boost::tokenizer<boost::char_separator<char>> tokens(text, separator);
  return std::vector<std::string>(tokens.begin(), tokens.end());
}

unsigned terminalColumns()
{
  unsigned short int rows    = 0;
  unsigned short int columns = 0;
  if (-1 == getTerminalWindowSize(rows, columns) || 50 > columns) {
    return bpo::options_description::m_default_line_length;
  }
  return columns;
}

}  // namespace

Options::Options()
{
  namedOptions_.add_options()("help,h", "produce help message and exit")(
      HELP_DEFAULTS_OPTION, "produce tab-delimited list of command line options and their default values")(
      "version,V", bpo::bool_switch(&version_), "print program version information")(
      RESPONSE_FILE_OPTION, bpo::value<std::string>(), "file with more command line arguments");
}

Options::Action Options::parse(int argc, const char* const argv[])
{
  argc_ = argc;
  argv_ = argv;
  vm_.clear();
  bpo::options_description allOptions("Allowed options");
  allOptions.add(namedOptions_);
  try {
    bpo::store(bpo::command_line_parser(argc, argv).options(allOptions).run(), vm_);
    if (vm_.count(RESPONSE_FILE_OPTION)) {
      const std::vector<std::string> args = readResponseFile(vm_[RESPONSE_FILE_OPTION].as<std::string>());
      bpo::store(bpo::command_line_parser(args).options(allOptions).run(), vm_);
    }
    bpo::notify(vm_);

    if (vm_.count(HELP_OPTION) || vm_.count(HELP_DEFAULTS_OPTION)) {
      return HELP;
    }
    if (version_) {
      return VERSION;
    }
    postProcess(vm_);
  } catch (const InvalidOptionException& e) {
    return abort(e.getMessage());
  } catch (const bpo::error& e) {
    return abort(e.what());
  } catch (const boost::exception& e) {
    return abort(boost::diagnostic_information(e));
  } catch (const std::exception& e) {
    return abort(e.what());
  }
  return RUN;
}

Options::Action Options::abort(const std::string& reason) const
{
  std::clog << usage() << std::endl;
  std::clog << "Failed to parse the options: " << reason << std::endl;
  return ABORT;
}

std::string Options::helpDefaults(const OptionDescriptionPtrs& sortedOptions) const
{
  std::string ret;
  for (const OptionDescriptionPtr& option : sortedOptions) {
    ret += option->long_name() + "\t" + option->format_parameter() + "\n";
  }
  return ret;
}

std::string Options::help(const OptionDescriptionPtrs& sortedOptions) const
{
  const unsigned           columns = terminalColumns();
  bpo::options_description printed("Command line options", columns, columns / 2);
  for (const OptionDescriptionPtr& option : sortedOptions) {
    printed.add(option);
  }

  std::ostringstream os;
  os << usagePrefix() << "\n\n" << printed << std::endl;
  return os.str();
}

std::string Options::usage() const
{
  OptionDescriptionPtrs sortedOptions = namedOptions_.options();
  std::sort(
      sortedOptions.begin(),
      sortedOptions.end(),
      [](const OptionDescriptionPtr& left, const OptionDescriptionPtr& right) {
        return left->long_name() < right->long_name();
      });

  return vm_.count(HELP_DEFAULTS_OPTION) ? helpDefaults(sortedOptions) : help(sortedOptions);
}

}  // namespace common
}  // namespace seqio
