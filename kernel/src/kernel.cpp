// Kernel facade over the port layer: OS tasks and the spinlock.

#include "brainrt/kernel.hpp"
#include "brainrt/port.h"

#include <cassert>
#include <memory>

#include "DEBUG_PRINT.hpp"

namespace brainrt
{

std::string_view to_string(SpawnError error) noexcept
{
   switch (error) {
      case SpawnError::TaskNotCreated: return "the stack cannot be used as the TCB was not created";
      case SpawnError::RunQueueFull:   return "the executor's run queue is full";
   }
   return "unknown spawn error";
}

/* ============================================================================
 * Spinlock
 * ========================================================================= */

void Spinlock::lock()
{
   std::uint32_t spins = 0;
   while (flag.test_and_set(std::memory_order_acquire)) {
      if (++spins < config::SPINLOCK_SPINS_BEFORE_YIELD) {
         brainrt_port_cpu_relax();
      } else {
         // Holder may be preempted: give it the CPU
         brainrt_port_delay(0);
         spins = 0;
      }
   }
}

void Spinlock::unlock()
{
   flag.clear(std::memory_order_release);
}

/* ============================================================================
 * Thread
 * ========================================================================= */

static void thread_launcher(void* varg)
{
   std::unique_ptr<Thread::EntryFn> entry(static_cast<Thread::EntryFn*>(varg));
   (*entry)();
}

std::expected<Thread, SpawnError> Thread::spawn(EntryFn&& entry, Options const& options)
{
   auto payload = std::make_unique<EntryFn>(std::move(entry));

   auto* task = brainrt_port_task_create(thread_launcher,
                                         payload.get(),
                                         options.priority,
                                         options.stack_depth,
                                         options.name);
   if (!task) {
      LOG_TASK("failed to create OS task '%s'", options.name ? options.name : "<unnamed>");
      return std::unexpected(SpawnError::TaskNotCreated);
   }

   payload.release(); // owned by thread_launcher now
   return Thread(task, true);
}

Thread Thread::current()
{
   auto* task = brainrt_port_task_current();
   brainrt_port_task_retain(task);
   return Thread(task, false);
}

Thread::~Thread()
{
   if (task) brainrt_port_task_release(task);
}

Thread::Thread(Thread&& other) noexcept
   : task(std::exchange(other.task, nullptr)), owned(std::exchange(other.owned, false))
{
}

Thread& Thread::operator=(Thread&& other) noexcept
{
   if (this != &other) {
      if (task) brainrt_port_task_release(task);
      task  = std::exchange(other.task, nullptr);
      owned = std::exchange(other.owned, false);
   }
   return *this;
}

Thread::Id Thread::get_id() const noexcept
{
   return task ? brainrt_port_task_get_id(task) : 0;
}

std::string_view Thread::name() const noexcept
{
   return task ? brainrt_port_task_get_name(task) : std::string_view{};
}

void Thread::notify() const noexcept
{
   if (task) brainrt_port_task_notify(task);
}

void Thread::join()
{
   assert(joinable() && "join() requires a spawned, not yet joined task");
   brainrt_port_task_join(task);
   owned = false;
}

namespace this_thread
{
   ::brainrt::Thread::Id id()
   {
      return brainrt_port_task_get_id(brainrt_port_task_current());
   }

   std::string_view name()
   {
      return brainrt_port_task_get_name(brainrt_port_task_current());
   }

   std::uint32_t millis()
   {
      return brainrt_port_millis();
   }

   void delay(std::uint32_t ms)
   {
      brainrt_port_delay(ms);
   }

   std::uint32_t notify_take(bool clear_on_exit, std::uint32_t timeout_ms)
   {
      return brainrt_port_task_notify_take(clear_on_exit, timeout_ms);
   }
}  // namespace this_thread

}  // namespace brainrt
