#pragma once
#include <cstdint>
#include <string_view>

namespace logwire
{

enum class Status : uint8_t
{
  OK = 0,
  CIRCULAR_REFERENCE = 1,
  NOT_AN_OBJECT = 2
};

constexpr std::string_view to_string(Status status)
{
  switch (status)
  {
    case Status::OK:
      return "OK";
    case Status::CIRCULAR_REFERENCE:
      return "CIRCULAR_REFERENCE";
    case Status::NOT_AN_OBJECT:
      return "NOT_AN_OBJECT";
  }
  return "UNKNOWN";
}

}  // namespace logwire
