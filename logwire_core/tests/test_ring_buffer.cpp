#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <thread>
#include <vector>

#include "logwire/ring_buffer.hpp"

using logwire::MPSCRingBuffer;

struct TestItem
{
  uint32_t producer_id;
  uint32_t sequence;
};

TEST(MPSCRingBuffer, PushPopInOrder)
{
  MPSCRingBuffer<TestItem, 16> buffer;
  for (uint32_t i = 0; i < 10; ++i)
  {
    EXPECT_TRUE(buffer.TryPush({1, i}));
  }
  for (uint32_t i = 0; i < 10; ++i)
  {
    TestItem out{};
    ASSERT_TRUE(buffer.TryPop(out));
    EXPECT_EQ(out.sequence, i);
  }
}

TEST(MPSCRingBuffer, EmptyPopFails)
{
  MPSCRingBuffer<TestItem, 8> buffer;
  TestItem out{};
  EXPECT_TRUE(buffer.Empty());
  EXPECT_FALSE(buffer.TryPop(out));
}

TEST(MPSCRingBuffer, FullPushFailsUntilPopped)
{
  MPSCRingBuffer<TestItem, 4> buffer;
  for (uint32_t i = 0; i < 4; ++i)
  {
    EXPECT_TRUE(buffer.TryPush({0, i}));
  }
  EXPECT_FALSE(buffer.TryPush({0, 4}));

  TestItem out{};
  ASSERT_TRUE(buffer.TryPop(out));
  EXPECT_EQ(out.sequence, 0u);
  EXPECT_TRUE(buffer.TryPush({0, 4}));
}

TEST(MPSCRingBuffer, CapacityIsCompileTime)
{
  static_assert(MPSCRingBuffer<TestItem, 64>::GetCapacity() == 64);
  EXPECT_EQ((MPSCRingBuffer<TestItem, 8>::GetCapacity()), 8u);
}

TEST(MPSCRingBuffer, WrapAroundManyRounds)
{
  MPSCRingBuffer<TestItem, 8> buffer;
  for (uint32_t round = 0; round < 20; ++round)
  {
    for (uint32_t i = 0; i < 5; ++i)
    {
      ASSERT_TRUE(buffer.TryPush({round, i}));
    }
    for (uint32_t i = 0; i < 5; ++i)
    {
      TestItem out{};
      ASSERT_TRUE(buffer.TryPop(out));
      EXPECT_EQ(out.producer_id, round);
      EXPECT_EQ(out.sequence, i);
    }
  }
  EXPECT_TRUE(buffer.Empty());
}

TEST(MPSCRingBuffer, MultiProducerKeepsPerProducerOrder)
{
  constexpr uint32_t kProducers = 4;
  constexpr uint32_t kItems = 5000;
  MPSCRingBuffer<TestItem, 256> buffer;
  std::vector<std::thread> producers;

  for (uint32_t p = 0; p < kProducers; ++p)
  {
    producers.emplace_back(
        [p, &buffer]()
        {
          for (uint32_t i = 0; i < kItems; ++i)
          {
            while (!buffer.TryPush({p, i}))
            {
              std::this_thread::yield();
            }
          }
        });
  }

  std::vector<uint32_t> next(kProducers, 0);
  uint32_t received = 0;
  while (received < kProducers * kItems)
  {
    TestItem out{};
    if (!buffer.TryPop(out))
    {
      std::this_thread::yield();
      continue;
    }
    ASSERT_LT(out.producer_id, kProducers);
    EXPECT_EQ(out.sequence, next[out.producer_id]);
    next[out.producer_id] = out.sequence + 1;
    ++received;
  }

  for (auto& thread : producers)
  {
    thread.join();
  }
  for (uint32_t p = 0; p < kProducers; ++p)
  {
    EXPECT_EQ(next[p], kItems);
  }
}
