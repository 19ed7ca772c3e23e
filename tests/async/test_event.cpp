/**
 * @file test_event.cpp
 * @brief Unit tests for Event
 */

#include "brainrt/event.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace brainrt;

class EventTest : public ::testing::Test
{
protected:
   Executor executor;
   Event    event;
};

TEST_F(EventTest, SetWakesEveryWaiter)
{
   int woken = 0;

   std::vector<JoinHandle<void>> waiters;
   for (int i = 0; i < 3; ++i) {
      waiters.push_back(executor.spawn([this, &woken] {
         this_task::await(event.wait());
         ++woken;
      }));
   }

   executor.run_until_stalled();
   EXPECT_EQ(woken, 0);
   EXPECT_EQ(event.waiter_count(), 3u);

   event.set();
   EXPECT_EQ(event.waiter_count(), 0u);
   executor.run_until_stalled();

   EXPECT_EQ(woken, 3);
   for (auto const& waiter : waiters) {
      EXPECT_TRUE(waiter.is_finished());
   }
}

TEST_F(EventTest, WaitOnSetEventCompletesImmediately)
{
   event.set();
   EXPECT_TRUE(event.is_set());

   auto handle = executor.spawn([this] {
      this_task::await(event.wait());
      return true;
   });
   executor.run_until_stalled();

   ASSERT_TRUE(handle.is_finished());
   EXPECT_EQ(event.waiter_count(), 0u);
   EXPECT_TRUE(executor.block_on(std::move(handle)));
}

TEST_F(EventTest, ResetMakesNewWaitersBlock)
{
   event.set();
   event.reset();
   EXPECT_FALSE(event.is_set());

   auto handle = executor.spawn([this] { this_task::await(event.wait()); });
   executor.run_until_stalled();
   EXPECT_FALSE(handle.is_finished());

   event.set();
   executor.run_until_stalled();
   EXPECT_TRUE(handle.is_finished());
}

TEST_F(EventTest, RepeatedPollsRegisterOnce)
{
   auto handle = executor.spawn([this] {
      auto wait = event.wait();
      Waker const first = this_task::waker();
      Waker const second = this_task::waker();
      Context cx(first);
      Context again(second);

      EXPECT_FALSE(wait.poll(cx).has_value());
      EXPECT_FALSE(wait.poll(again).has_value());
      return event.waiter_count();
   });

   EXPECT_EQ(executor.block_on(std::move(handle)), 1u);
}

TEST_F(EventTest, BlockOnWaitOutsideTask)
{
   auto setter = executor.spawn([this] {
      this_task::sleep(5);
      event.set();
   });

   executor.block_on(event.wait());
   EXPECT_TRUE(event.is_set());
   EXPECT_TRUE(setter.is_finished());
}

TEST_F(EventTest, CancelledWaitersAreDropped)
{
   for (int round = 0; round < 1000; ++round) {
      auto waiter = executor.spawn([this] { this_task::await(event.wait()); });
      executor.run_until_stalled();
      waiter.cancel();
      executor.run_until_stalled();
   }

   EXPECT_EQ(executor.stats().live_tasks, 0u);
   EXPECT_EQ(event.waiter_count(), 0u);
}

TEST_F(EventTest, LiveWaiterSurvivesPruning)
{
   bool woken = false;
   auto survivor = executor.spawn([this, &woken] {
      this_task::await(event.wait());
      woken = true;
   });
   executor.run_until_stalled();

   for (int round = 0; round < 10; ++round) {
      auto dropped = executor.spawn([this] { this_task::await(event.wait()); });
      executor.run_until_stalled();
   }
   executor.run_until_stalled();
   EXPECT_EQ(event.waiter_count(), 1u);

   event.set();
   executor.run_until_stalled();
   EXPECT_TRUE(woken);
   EXPECT_TRUE(survivor.is_finished());
}
