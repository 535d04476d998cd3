#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <type_traits>

#include "platform.hpp"

namespace logwire
{

// Bounded multi-producer / single-consumer queue. Each cell carries a
// sequence number: seq == pos means free for the producer claiming pos,
// seq == pos + 1 means filled and ready for the consumer.
template <typename T, size_t Capacity>
class MPSCRingBuffer
{
  static_assert(Capacity >= 2 && (Capacity & (Capacity - 1)) == 0,
                "Capacity must be a power of 2");
  static_assert(std::is_trivially_copyable_v<T>, "T must be trivially copyable");

 public:
  MPSCRingBuffer()
  {
    for (uint64_t i = 0; i < Capacity; ++i)
    {
      cells_[i].seq.store(i, std::memory_order_relaxed);
    }
  }

  MPSCRingBuffer(const MPSCRingBuffer&) = delete;
  MPSCRingBuffer& operator=(const MPSCRingBuffer&) = delete;

  bool TryPush(const T& item)
  {
    uint64_t pos = enqueue_pos_.load(std::memory_order_relaxed);
    for (;;)
    {
      Cell& cell = cells_[pos & kMask];
      uint64_t seq = cell.seq.load(std::memory_order_acquire);
      auto diff = static_cast<int64_t>(seq) - static_cast<int64_t>(pos);
      if (diff == 0)
      {
        if (enqueue_pos_.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed))
        {
          cell.data = item;
          cell.seq.store(pos + 1, std::memory_order_release);
          return true;
        }
      }
      else if (diff < 0)
      {
        return false;  // full
      }
      else
      {
        pos = enqueue_pos_.load(std::memory_order_relaxed);
      }
    }
  }

  // Consumer side only.
  bool TryPop(T& item)
  {
    Cell& cell = cells_[dequeue_pos_ & kMask];
    if (cell.seq.load(std::memory_order_acquire) != dequeue_pos_ + 1)
    {
      return false;
    }
    item = cell.data;
    cell.seq.store(dequeue_pos_ + Capacity, std::memory_order_release);
    ++dequeue_pos_;
    return true;
  }

  bool Empty() const
  {
    const Cell& cell = cells_[dequeue_pos_ & kMask];
    return cell.seq.load(std::memory_order_acquire) != dequeue_pos_ + 1;
  }

  static constexpr size_t GetCapacity() { return Capacity; }

 private:
  static constexpr uint64_t kMask = Capacity - 1;

  struct alignas(LOGWIRE_CACHELINE_SIZE) Cell
  {
    std::atomic<uint64_t> seq;
    T data;
  };

  Cell cells_[Capacity];
  alignas(LOGWIRE_CACHELINE_SIZE) std::atomic<uint64_t> enqueue_pos_{0};
  alignas(LOGWIRE_CACHELINE_SIZE) uint64_t dequeue_pos_ = 0;
};

}  // namespace logwire
