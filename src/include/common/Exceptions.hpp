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

#ifndef COMMON_EXCEPTIONS_HPP
#define COMMON_EXCEPTIONS_HPP

#include <boost/cerrno.hpp>
#include <boost/exception/all.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/throw_exception.hpp>
#include <ios>
#include <stdexcept>
#include <string>

namespace seqio {
namespace common {

/**
 ** \brief Virtual base class to all the exception classes in seqio.
 **
 ** Use BOOST_THROW_EXCEPTION to get the context info (file, function, line)
 ** at the throw site.
 **/
class ExceptionData : public boost::exception {
public:
  ExceptionData(int errorNumber = 0, const std::string& message = "");
  ExceptionData(const ExceptionData& e)
    : boost::exception(e), errorNumber_(e.errorNumber_), message_(e.message_)
  {
  }
  virtual ~ExceptionData() throw() {}
  int                getErrorNumber() const { return errorNumber_; }
  const std::string& getMessage() const { return message_; }
  std::string        getContext() const;

private:
  const int         errorNumber_;
  const std::string message_;
  ExceptionData&    operator=(const ExceptionData&);
};

class SeqioException : public std::exception, public ExceptionData {
public:
  SeqioException(int errorNumber, const std::string& message) : ExceptionData(errorNumber, message) {}
  SeqioException(const std::string& message) : ExceptionData(0, message) {}
  SeqioException(const SeqioException& e) : std::exception(e), ExceptionData(e) {}
  virtual const char* what() const throw() { return getMessage().c_str(); }

private:
  SeqioException& operator=(const SeqioException&);
};

/**
 * \brief Exception thrown when there are problems with the IO operations
 */
class IoException : public std::ios_base::failure, public ExceptionData {
public:
  IoException(int errorNumber, const std::string& message);
};

/**
 ** \brief Structural violation within a single input file: sequence line before any header,
 **        invalid colorspace primer, quality/sequence length mismatch, undecodable quality value.
 **
 ** The message carries the read name and/or line number of the offending record.
 **/
class FormatException : public SeqioException {
public:
  FormatException(const std::string& message) : SeqioException(message) {}
};

/**
 ** \brief Two record streams that are expected to advance in lock-step went out of sync:
 **        unequal record counts, mate names that do not match, odd interleaved count.
 **/
class PairingException : public SeqioException {
public:
  PairingException(const std::string& message) : SeqioException(message) {}
};

/**
 ** \brief File format could not be resolved from the name, the content or the explicit value.
 **/
class UnknownFileTypeException : public SeqioException {
public:
  UnknownFileTypeException(const std::string& message) : SeqioException(message) {}
};

/**
 ** \brief Exception thrown when the client supplied an invalid parameter.
 **
 **/
class InvalidParameterException : public std::logic_error, public ExceptionData {
public:
  InvalidParameterException(const std::string& message);
};

/**
 ** \brief Exception thrown when mutually exclusive or missing options are supplied.
 **
 **/
class InvalidOptionException : public std::logic_error, public ExceptionData {
public:
  InvalidOptionException(const std::string& message);
};

/**
 ** \brief Exception thrown when a method invocation violates the pre-conditions.
 **
 **/
class PreConditionException : public std::logic_error, public ExceptionData {
public:
  PreConditionException(const std::string& message);
};

}  // namespace common
}  // namespace seqio

#endif  // #ifndef COMMON_EXCEPTIONS_HPP
