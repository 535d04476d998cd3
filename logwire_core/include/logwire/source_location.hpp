#pragma once
#include <cstdint>

#if __cplusplus >= 202002L && __has_include(<source_location>)
#include <source_location>
#define LOGWIRE_HAS_STD_SOURCE_LOCATION 1
#endif

namespace logwire
{

struct SourceLocation
{
  const char* file_path;
  const char* file_name;
  const char* function_name;
  uint32_t line;

  static constexpr const char* ExtractFilename(const char* path)
  {
    const char* name = path;
    for (const char* p = path; *p != '\0'; ++p)
    {
      if (*p == '/' || *p == '\\') name = p + 1;
    }
    return name;
  }
};

#if defined(LOGWIRE_HAS_STD_SOURCE_LOCATION)
#define LOGWIRE_CURRENT_LOCATION()                                                      \
  ::logwire::SourceLocation                                                             \
  {                                                                                     \
    std::source_location::current().file_name(),                                        \
        ::logwire::SourceLocation::ExtractFilename(std::source_location::current().file_name()), \
        std::source_location::current().function_name(),                                \
        std::source_location::current().line()                                          \
  }
#else
#define LOGWIRE_CURRENT_LOCATION()                                                     \
  ::logwire::SourceLocation                                                            \
  {                                                                                    \
    __FILE__, ::logwire::SourceLocation::ExtractFilename(__FILE__), __func__,          \
        static_cast<uint32_t>(__LINE__)                                                \
  }
#endif

}  // namespace logwire
