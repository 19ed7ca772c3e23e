/**
 * @file test_port.cpp
 * @brief Unit tests for the port layer (pthreads + boost.context backend)
 */

#include "brainrt/port.h"

#include <gtest/gtest.h>

#include <atomic>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

/* ============================================================================
 * Test Fixtures
 * ========================================================================= */

class PortTest : public ::testing::Test
{
protected:
   static constexpr size_t stack_size = 64 * 1024;

   void SetUp() override
   {
      brainrt_port_init();
   }

   static brainrt_port_context_t* as_context(uint8_t* storage)
   {
      return reinterpret_cast<brainrt_port_context_t*>(storage);
   }
};

/* ============================================================================
 * Context Switching Tests
 * ========================================================================= */

TEST_F(PortTest, ContextRunsToCompletion)
{
   std::vector<uint8_t> stack(stack_size);
   alignas(BRAINRT_PORT_CONTEXT_ALIGN) uint8_t context_storage[BRAINRT_PORT_CONTEXT_SIZE];
   auto* context = as_context(context_storage);

   bool entry_called = false;
   auto entry = [](void* arg)
   {
      *static_cast<bool*>(arg) = true;
   };

   brainrt_port_context_init(context, stack.data(), stack_size, entry, &entry_called);
   EXPECT_FALSE(brainrt_port_context_finished(context));

   brainrt_port_context_switch(context);

   EXPECT_TRUE(entry_called);
   EXPECT_TRUE(brainrt_port_context_finished(context));

   brainrt_port_context_destroy(context);
}

TEST_F(PortTest, InterleavedContexts)
{
   std::vector<uint8_t> stack1(stack_size);
   std::vector<uint8_t> stack2(stack_size);

   alignas(BRAINRT_PORT_CONTEXT_ALIGN) uint8_t ctx1_storage[BRAINRT_PORT_CONTEXT_SIZE];
   alignas(BRAINRT_PORT_CONTEXT_ALIGN) uint8_t ctx2_storage[BRAINRT_PORT_CONTEXT_SIZE];
   auto* ctx1 = as_context(ctx1_storage);
   auto* ctx2 = as_context(ctx2_storage);

   int steps[3] = {0, 0, 0};  // [step1, step2, execution_order]

   auto entry1 = [](void* arg)
   {
      auto* steps = static_cast<int*>(arg);
      steps[0] = ++steps[2];  // 1
      brainrt_port_context_yield();
      steps[0] = ++steps[2];  // 3
   };

   auto entry2 = [](void* arg)
   {
      auto* steps = static_cast<int*>(arg);
      steps[1] = ++steps[2];  // 2
      brainrt_port_context_yield();
      steps[1] = ++steps[2];  // 4
   };

   brainrt_port_context_init(ctx1, stack1.data(), stack_size, entry1, steps);
   brainrt_port_context_init(ctx2, stack2.data(), stack_size, entry2, steps);

   brainrt_port_context_switch(ctx1);
   EXPECT_EQ(steps[0], 1);

   brainrt_port_context_switch(ctx2);
   EXPECT_EQ(steps[1], 2);

   brainrt_port_context_switch(ctx1);
   EXPECT_EQ(steps[0], 3);
   EXPECT_TRUE(brainrt_port_context_finished(ctx1));

   brainrt_port_context_switch(ctx2);
   EXPECT_EQ(steps[1], 4);
   EXPECT_TRUE(brainrt_port_context_finished(ctx2));

   brainrt_port_context_destroy(ctx1);
   brainrt_port_context_destroy(ctx2);
}

TEST_F(PortTest, InContextOnlyInsideContext)
{
   std::vector<uint8_t> stack(stack_size);
   alignas(BRAINRT_PORT_CONTEXT_ALIGN) uint8_t context_storage[BRAINRT_PORT_CONTEXT_SIZE];
   auto* context = as_context(context_storage);

   bool inside = false;
   auto entry = [](void* arg)
   {
      *static_cast<bool*>(arg) = brainrt_port_in_context();
   };

   EXPECT_FALSE(brainrt_port_in_context());
   brainrt_port_context_init(context, stack.data(), stack_size, entry, &inside);
   brainrt_port_context_switch(context);

   EXPECT_TRUE(inside);
   EXPECT_FALSE(brainrt_port_in_context());

   brainrt_port_context_destroy(context);
}

TEST_F(PortTest, YieldOutsideContextIsNoop)
{
   brainrt_port_context_yield();
   SUCCEED();
}

struct UnwindProbe
{
   bool* destroyed;
   ~UnwindProbe() { *destroyed = true; }
};

TEST_F(PortTest, DestroyUnwindsSuspendedContext)
{
   std::vector<uint8_t> stack(stack_size);
   alignas(BRAINRT_PORT_CONTEXT_ALIGN) uint8_t context_storage[BRAINRT_PORT_CONTEXT_SIZE];
   auto* context = as_context(context_storage);

   bool destroyed = false;
   auto entry = [](void* arg)
   {
      UnwindProbe probe{static_cast<bool*>(arg)};
      brainrt_port_context_yield();
      ADD_FAILURE() << "Suspended context must not run again";
   };

   brainrt_port_context_init(context, stack.data(), stack_size, entry, &destroyed);
   brainrt_port_context_switch(context);
   EXPECT_FALSE(destroyed);

   brainrt_port_context_destroy(context);
   EXPECT_TRUE(destroyed);
}

TEST_F(PortTest, ExceptionsStayInsideContext)
{
   std::vector<uint8_t> stack(stack_size);
   alignas(BRAINRT_PORT_CONTEXT_ALIGN) uint8_t context_storage[BRAINRT_PORT_CONTEXT_SIZE];
   auto* context = as_context(context_storage);

   std::string caught;
   auto entry = [](void* arg)
   {
      try {
         brainrt_port_context_yield();
         throw std::runtime_error("thrown after resume");
      } catch (std::exception const& e) {
         *static_cast<std::string*>(arg) = e.what();
      }
   };

   brainrt_port_context_init(context, stack.data(), stack_size, entry, &caught);
   brainrt_port_context_switch(context);
   brainrt_port_context_switch(context);

   EXPECT_EQ(caught, "thrown after resume");
   brainrt_port_context_destroy(context);
}

/* ============================================================================
 * OS Task Tests
 * ========================================================================= */

TEST_F(PortTest, TaskCreateAndJoin)
{
   std::atomic<int> ran{0};
   auto entry = [](void* arg)
   {
      static_cast<std::atomic<int>*>(arg)->fetch_add(1);
   };

   auto* task = brainrt_port_task_create(entry, &ran, 8, 8192, "worker");
   ASSERT_NE(task, nullptr);
   EXPECT_STREQ(brainrt_port_task_get_name(task), "worker");

   brainrt_port_task_join(task);
   EXPECT_EQ(ran.load(), 1);

   brainrt_port_task_release(task);
}

TEST_F(PortTest, TaskIdsAreUnique)
{
   auto entry = [](void*) {};

   auto* a = brainrt_port_task_create(entry, nullptr, 8, 8192, "a");
   auto* b = brainrt_port_task_create(entry, nullptr, 8, 8192, "b");
   ASSERT_NE(a, nullptr);
   ASSERT_NE(b, nullptr);

   EXPECT_NE(brainrt_port_task_get_id(a), brainrt_port_task_get_id(b));
   EXPECT_NE(brainrt_port_task_get_id(a), brainrt_port_task_get_id(brainrt_port_task_current()));

   brainrt_port_task_join(a);
   brainrt_port_task_join(b);
   brainrt_port_task_release(a);
   brainrt_port_task_release(b);
}

TEST_F(PortTest, CurrentTaskIsStable)
{
   EXPECT_EQ(brainrt_port_task_current(), brainrt_port_task_current());
}

TEST_F(PortTest, NotifyWakesWaitingTask)
{
   struct Shared
   {
      brainrt_port_task_t main;
      std::atomic<bool>   sent{false};
   } shared{brainrt_port_task_current()};

   auto entry = [](void* arg)
   {
      auto* shared = static_cast<Shared*>(arg);
      brainrt_port_delay(5);
      shared->sent = true;
      brainrt_port_task_notify(shared->main);
   };

   brainrt_port_task_notify_take(true, 0); // drop stale notifications

   auto* task = brainrt_port_task_create(entry, &shared, 8, 8192, "notifier");
   ASSERT_NE(task, nullptr);

   uint32_t value = brainrt_port_task_notify_take(true, 1000);
   EXPECT_GE(value, 1u);
   EXPECT_TRUE(shared.sent.load());

   brainrt_port_task_join(task);
   brainrt_port_task_release(task);
}

TEST_F(PortTest, NotifyTakeTimesOut)
{
   brainrt_port_task_notify_take(true, 0);

   uint32_t const before = brainrt_port_millis();
   EXPECT_EQ(brainrt_port_task_notify_take(true, 20), 0u);
   EXPECT_GE(brainrt_port_millis() - before, 19u);
}

TEST_F(PortTest, NotifyCountsAndDecrements)
{
   auto* self = brainrt_port_task_current();
   brainrt_port_task_notify_take(true, 0);

   brainrt_port_task_notify(self);
   brainrt_port_task_notify(self);
   brainrt_port_task_notify(self);

   EXPECT_EQ(brainrt_port_task_notify_take(false, 0), 3u);
   EXPECT_EQ(brainrt_port_task_notify_take(true, 0), 2u);
   EXPECT_EQ(brainrt_port_task_notify_take(true, 0), 0u);
}

/* ============================================================================
 * Time Tests
 * ========================================================================= */

TEST_F(PortTest, DelayAdvancesClock)
{
   uint32_t const before = brainrt_port_millis();
   brainrt_port_delay(15);
   EXPECT_GE(brainrt_port_millis() - before, 15u);
}

TEST_F(PortTest, DelayUntilAdvancesReference)
{
   uint32_t reference = brainrt_port_millis();
   uint32_t const start = reference;

   brainrt_port_delay_until(&reference, 10);
   brainrt_port_delay_until(&reference, 10);

   EXPECT_EQ(reference, start + 20);
   EXPECT_GE(brainrt_port_millis() - start, 20u);
}

/* ============================================================================
 * TLS Tests
 * ========================================================================= */

TEST_F(PortTest, TlsPointerIsPerTask)
{
   static int dtor_calls = 0;
   dtor_calls = 0;

   struct Observed
   {
      void* initial{reinterpret_cast<void*>(0x1)};
      void* after_set{nullptr};
   } observed;

   auto entry = [](void* arg)
   {
      auto* observed = static_cast<Observed*>(arg);
      static int block = 0;
      observed->initial = brainrt_port_get_tls_pointer();
      brainrt_port_set_tls_pointer(&block, [](void*) { ++dtor_calls; });
      observed->after_set = brainrt_port_get_tls_pointer();
   };

   void* const previous = brainrt_port_get_tls_pointer();

   auto* task = brainrt_port_task_create(entry, &observed, 8, 8192, "tls");
   ASSERT_NE(task, nullptr);
   brainrt_port_task_join(task);
   brainrt_port_task_release(task);

   EXPECT_EQ(observed.initial, nullptr);
   EXPECT_NE(observed.after_set, nullptr);
   EXPECT_EQ(dtor_calls, 1);  // ran when the task ended

   // The main thread's pointer is untouched
   EXPECT_EQ(brainrt_port_get_tls_pointer(), previous);
}

/* ============================================================================
 * Diagnostics
 * ========================================================================= */

TEST_F(PortTest, DiagnosticWriteGoesToStderr)
{
   testing::internal::CaptureStderr();
   brainrt_port_diagnostic_write("port diagnostic line");
   std::string const output = testing::internal::GetCapturedStderr();

   EXPECT_NE(output.find("port diagnostic line"), std::string::npos);
}
