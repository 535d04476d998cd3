#pragma once
#include <cstdint>
#include <mutex>
#include <string>

namespace logwire
{

// Generates insert ids: 32 lowercase hex characters laid out as
// <12 millisecond timestamp><8 process salt><12 counter>. Within one
// generator the ids compare strictly increasing as strings; the salt keeps
// ids from different processes apart within the same millisecond.
class InsertIdGenerator
{
 public:
  static constexpr size_t kIdLength = 32;

  static InsertIdGenerator& Instance();

  InsertIdGenerator();
  explicit InsertIdGenerator(uint32_t salt);

  InsertIdGenerator(const InsertIdGenerator&) = delete;
  InsertIdGenerator& operator=(const InsertIdGenerator&) = delete;

  std::string Next();

  uint32_t Salt() const { return salt_; }

 private:
  const uint32_t salt_;
  std::mutex mutex_;
  uint64_t last_ms_ = 0;
  uint64_t counter_ = 0;
};

}  // namespace logwire
