#pragma once
#include <cstddef>
#include <string>

#include "../log_record.hpp"

namespace logwire
{

class IFormatter
{
 public:
  virtual ~IFormatter() = default;
  // Replaces the contents of `out`; returns the formatted length.
  virtual size_t Format(const LogRecord& record, std::string& out) = 0;
};

}  // namespace logwire
