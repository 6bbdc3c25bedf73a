#pragma once

#include <memory>
#include <sstream>
#include <string>

#include "io/InputStream.hpp"

namespace seqio {
namespace io {

/**
 ** \brief in-memory input for tests
 **/
class StringInputStream : public InputStream {
public:
  StringInputStream(const std::string& content, const std::string& name) : stream_(content), name_(name) {}

  std::istream&      stream() override { return stream_; }
  const std::string& name() const override { return name_; }
  void               close() override { closed_ = true; }
  bool               closed() const override { return closed_; }

private:
  std::istringstream stream_;
  const std::string  name_;
  bool               closed_ = false;
};

inline std::unique_ptr<InputStream> makeInput(const std::string& content, const std::string& name = "-")
{
  return std::unique_ptr<InputStream>(new StringInputStream(content, name));
}

}  // namespace io
}  // namespace seqio
