#include "logwire/insert_id.hpp"

#include <random>

#include "logwire/timestamp.hpp"

namespace logwire
{

namespace
{

constexpr uint64_t kTimestampMask = (1ULL << 48) - 1;
constexpr uint64_t kCounterMask = (1ULL << 48) - 1;

uint32_t random_salt()
{
  std::random_device rd;
  return static_cast<uint32_t>(rd());
}

void append_hex(std::string& out, uint64_t value, int digits)
{
  static const char kHex[] = "0123456789abcdef";
  for (int shift = (digits - 1) * 4; shift >= 0; shift -= 4)
  {
    out += kHex[(value >> shift) & 0x0F];
  }
}

}  // namespace

InsertIdGenerator& InsertIdGenerator::Instance()
{
  static InsertIdGenerator inst;
  return inst;
}

InsertIdGenerator::InsertIdGenerator() : salt_(random_salt()) {}

InsertIdGenerator::InsertIdGenerator(uint32_t salt) : salt_(salt) {}

std::string InsertIdGenerator::Next()
{
  uint64_t now_ms = (wall_clock_now_ns() / 1'000'000ULL) & kTimestampMask;
  uint64_t ms;
  uint64_t count;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // 时钟回拨时沿用上一次的时间戳，保证单调
    if (now_ms > last_ms_)
    {
      last_ms_ = now_ms;
    }
    ms = last_ms_;
    count = ++counter_ & kCounterMask;
  }

  std::string id;
  id.reserve(kIdLength);
  append_hex(id, ms, 12);
  append_hex(id, salt_, 8);
  append_hex(id, count, 12);
  return id;
}

}  // namespace logwire
