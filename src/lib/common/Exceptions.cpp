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

#include <cstring>

#include "common/Exceptions.hpp"

namespace seqio {
namespace common {

ExceptionData::ExceptionData(int errorNumber, const std::string& message)
  : boost::exception(), errorNumber_(errorNumber), message_(message)
{
}

std::string ExceptionData::getContext() const
{
  const std::string errorNumberMessage =
      errorNumber_ ? std::string(" (") + std::strerror(errorNumber_) + ")" : std::string("");
  return boost::diagnostic_information(*this) + errorNumberMessage;
}

IoException::IoException(int errorNumber, const std::string& message)
  : std::ios_base::failure(message), ExceptionData(errorNumber, message)
{
}

InvalidParameterException::InvalidParameterException(const std::string& message)
  : std::logic_error(message), ExceptionData(EINVAL, message)
{
}

InvalidOptionException::InvalidOptionException(const std::string& message)
  : std::logic_error(message), ExceptionData(EINVAL, message)
{
}

PreConditionException::PreConditionException(const std::string& message)
  : std::logic_error(message), ExceptionData(EINVAL, message)
{
}

}  // namespace common
}  // namespace seqio
