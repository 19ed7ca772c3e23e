/**
 * @file test_kernel.cpp
 * @brief Unit tests for the kernel facade: OS tasks, Spinlock, Interval and
 *        the MPSC ring buffer
 */

#include "brainrt/kernel.hpp"
#include "brainrt/mpsc_ring_buffer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <string>
#include <vector>

using namespace brainrt;

/* ============================================================================
 * Thread
 * ========================================================================= */

TEST(ThreadTest, SpawnRunsEntryAndJoins)
{
   std::atomic<int> runs{0};

   auto thread = Thread::spawn([&runs] { runs.fetch_add(1); }, {.name = "spawned"});
   ASSERT_TRUE(thread.has_value());
   EXPECT_TRUE(thread->joinable());
   EXPECT_EQ(thread->name(), "spawned");

   thread->join();
   EXPECT_FALSE(thread->joinable());
   EXPECT_EQ(runs.load(), 1);
}

TEST(ThreadTest, EntrySeesItsOwnIdentity)
{
   Thread::Id inside = 0;
   std::string name;

   auto thread = Thread::spawn([&] {
      inside = this_thread::id();
      name   = std::string(this_thread::name());
   }, {.name = "identity"});
   ASSERT_TRUE(thread.has_value());

   Thread::Id const outside = thread->get_id();
   thread->join();

   EXPECT_EQ(inside, outside);
   EXPECT_NE(inside, this_thread::id());
   EXPECT_EQ(name, "identity");
}

TEST(ThreadTest, CurrentComparesEqualToItself)
{
   auto a = Thread::current();
   auto b = Thread::current();

   EXPECT_TRUE(a == b);
   EXPECT_FALSE(a.joinable());
   EXPECT_EQ(a.get_id(), this_thread::id());
}

TEST(ThreadTest, MovedHandleKeepsTask)
{
   auto thread = Thread::spawn([] {});
   ASSERT_TRUE(thread.has_value());

   Thread moved = std::move(*thread);
   EXPECT_FALSE(thread->joinable());
   EXPECT_TRUE(moved.joinable());
   moved.join();
}

TEST(ThreadTest, EntryWithLargeCapture)
{
   std::array<int, 64> values{};
   values.fill(3);
   std::atomic<int> sum{0};

   auto thread = Thread::spawn([values, &sum] {
      int total = 0;
      for (int v : values) total += v;
      sum = total;
   });
   ASSERT_TRUE(thread.has_value());
   thread->join();

   EXPECT_EQ(sum.load(), 192);
}

TEST(ThreadTest, NotifyWakesNotifyTake)
{
   this_thread::notify_take(true, 0);
   auto self = Thread::current();

   auto notifier = Thread::spawn([&self] {
      this_thread::delay(5);
      self.notify();
   });
   ASSERT_TRUE(notifier.has_value());

   EXPECT_GE(this_thread::notify_take(true, 1000), 1u);
   notifier->join();
}

TEST(ThreadTest, DefaultOptionsGiveUnnamedTask)
{
   Thread::Options const defaults{};
   EXPECT_EQ(defaults.name, nullptr);
   EXPECT_EQ(defaults.priority, config::DEFAULT_TASK_PRIORITY);
   EXPECT_EQ(defaults.stack_depth, config::DEFAULT_TASK_STACK_DEPTH);

   std::string seen;
   auto thread = Thread::spawn([&seen] { seen = this_thread::name(); });
   ASSERT_TRUE(thread.has_value());
   thread->join();
   EXPECT_EQ(seen, "<unnamed>");
}

TEST(ThreadTest, SpawnErrorHasDescription)
{
   EXPECT_FALSE(to_string(SpawnError::TaskNotCreated).empty());
   EXPECT_FALSE(to_string(SpawnError::RunQueueFull).empty());
}

/* ============================================================================
 * Spinlock
 * ========================================================================= */

TEST(SpinlockTest, TryLockFailsWhileHeld)
{
   Spinlock lock;

   EXPECT_TRUE(lock.try_lock());
   EXPECT_TRUE(lock.is_locked());
   EXPECT_FALSE(lock.try_lock());

   lock.unlock();
   EXPECT_FALSE(lock.is_locked());
}

TEST(SpinlockTest, GuardProvidesMutualExclusion)
{
   constexpr int threads    = 4;
   constexpr int increments = 20000;

   Spinlock lock;
   int counter = 0;

   std::vector<Thread> workers;
   for (int i = 0; i < threads; ++i) {
      auto worker = Thread::spawn([&] {
         for (int n = 0; n < increments; ++n) {
            SpinlockGuard guard(lock);
            ++counter;
         }
      });
      ASSERT_TRUE(worker.has_value());
      workers.push_back(std::move(*worker));
   }
   for (auto& worker : workers) {
      worker.join();
   }

   EXPECT_EQ(counter, threads * increments);
   EXPECT_FALSE(lock.is_locked());
}

/* ============================================================================
 * Interval
 * ========================================================================= */

TEST(IntervalTest, PeriodsDoNotDrift)
{
   Interval interval;
   std::uint32_t const start = this_thread::millis();

   for (int i = 0; i < 5; ++i) {
      this_thread::delay(2); // loop body
      interval.delay(10);
   }

   std::uint32_t const elapsed = this_thread::millis() - start;
   EXPECT_GE(elapsed, 49u);
   EXPECT_LT(elapsed, 150u);
}

/* ============================================================================
 * MpscRingBuffer
 * ========================================================================= */

TEST(MpscRingBufferTest, FifoOrder)
{
   MpscRingBuffer<int, 8> buffer;

   for (int i = 0; i < 5; ++i) {
      EXPECT_TRUE(buffer.push(i));
   }
   EXPECT_EQ(buffer.approx_size(), 5u);

   int value = -1;
   for (int i = 0; i < 5; ++i) {
      ASSERT_TRUE(buffer.pop(value));
      EXPECT_EQ(value, i);
   }
   EXPECT_FALSE(buffer.pop(value));
}

TEST(MpscRingBufferTest, RejectsPushWhenFull)
{
   MpscRingBuffer<int, 4> buffer;

   for (int i = 0; i < 4; ++i) {
      EXPECT_TRUE(buffer.push(i));
   }
   EXPECT_FALSE(buffer.push(4));

   int value = 0;
   ASSERT_TRUE(buffer.pop(value));
   EXPECT_TRUE(buffer.push(4));  // the freed cell is reused on the next lap
}

TEST(MpscRingBufferTest, DestructorReleasesElements)
{
   auto tracked = std::make_shared<int>(1);
   {
      MpscRingBuffer<std::shared_ptr<int>, 4> buffer;
      buffer.push(tracked);
      buffer.push(tracked);
      EXPECT_EQ(tracked.use_count(), 3);
   }
   EXPECT_EQ(tracked.use_count(), 1);
}

TEST(MpscRingBufferTest, ConcurrentProducersLoseNothing)
{
   constexpr int producers = 4;
   constexpr int per_producer = 5000;

   auto buffer = std::make_unique<MpscRingBuffer<int, 256>>();
   std::vector<int> received;
   received.reserve(producers * per_producer);

   std::vector<Thread> threads;
   for (int p = 0; p < producers; ++p) {
      auto thread = Thread::spawn([&buffer, p] {
         for (int n = 0; n < per_producer; ++n) {
            while (!buffer->push(p * per_producer + n)) {
               this_thread::delay(0);
            }
         }
      });
      ASSERT_TRUE(thread.has_value());
      threads.push_back(std::move(*thread));
   }

   int value = 0;
   while (received.size() < static_cast<std::size_t>(producers * per_producer)) {
      if (buffer->pop(value)) {
         received.push_back(value);
      }
   }
   for (auto& thread : threads) {
      thread.join();
   }

   std::sort(received.begin(), received.end());
   for (int i = 0; i < producers * per_producer; ++i) {
      ASSERT_EQ(received[i], i);
   }
}
