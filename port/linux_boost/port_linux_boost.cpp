/**
 * @file port_linux_boost.cpp
 * @brief Linux simulation port using pthreads and Boost.Context
 *
 * pthreads stand in for the RTOS's preemptive tasks. Boost.Context fibers
 * provide the stackful execution contexts that async tasks run on, bound to
 * stacks owned by the runtime (as they would be on the target).
 */

#include "brainrt/port.h"
#include "brainrt/port_traits.h"

#include <boost/context/fiber.hpp>
#include <boost/context/preallocated.hpp>
#include <boost/context/stack_context.hpp>

#include <algorithm>
#include <atomic>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <new>
#include <pthread.h>
#include <sched.h>
#include <string>

#include "DEBUG_PRINT.hpp"

/* ============================================================================
 * Port Context Structure
 * ========================================================================= */

struct brainrt_port_context
{
   boost::context::fiber thread;  // Context fiber (owned by switcher when suspended)
   boost::context::fiber sched;   // Switcher fiber (owned by context when running)
   void*                 stack_top;
   size_t                stack_size;
   brainrt_port_entry_t  entry;
   void*                 arg;
};

// Verify that port_traits.h constants are correct
static_assert(sizeof(brainrt_port_context) == BRAINRT_PORT_CONTEXT_SIZE,
              "BRAINRT_PORT_CONTEXT_SIZE mismatch - adjust in port_traits.h");
static_assert(alignof(brainrt_port_context) == BRAINRT_PORT_CONTEXT_ALIGN,
              "BRAINRT_PORT_CONTEXT_ALIGN mismatch - adjust in port_traits.h");
static_assert((BRAINRT_STACK_ALIGN & (BRAINRT_STACK_ALIGN - 1)) == 0,
              "BRAINRT_STACK_ALIGN must be a power of two");

/* ============================================================================
 * OS Task Record
 * ========================================================================= */

struct brainrt_port_task
{
   std::atomic<uint32_t> refs{1};
   uint32_t             id{};
   std::string          name;
   uint32_t             priority{};
   brainrt_port_entry_t entry{nullptr};
   void*                arg{nullptr};
   pthread_t            handle{};
   bool                 owns_thread{false};

   std::mutex              notify_lock;
   std::condition_variable notify_cv;
   uint32_t                notify_value{0};

   void*                   tls{nullptr};
   brainrt_port_tls_dtor_t tls_dtor{nullptr};

   // The block stays attached while its destructor runs: destructors of
   // task-local values may still look up other values of the same task.
   void run_tls_dtor() noexcept
   {
      if (tls && tls_dtor) {
         auto dtor = tls_dtor;
         dtor(tls);
         tls      = nullptr;
         tls_dtor = nullptr;
      }
   }
};

static std::atomic<uint32_t> task_id_generator{1};

/* ============================================================================
 * Thread-Local State
 * ========================================================================= */

// Binds a pthread to its task record. Adopted threads (main, test threads)
// get a record on first use that lives until the thread exits.
struct TaskBinding
{
   brainrt_port_task* task{nullptr};

   ~TaskBinding()
   {
      if (task) {
         task->run_tls_dtor();
         brainrt_port_task_release(task);
         task = nullptr;
      }
   }
};
static thread_local TaskBinding tls_binding;

// Context currently running on this pthread (used by context_yield)
static thread_local brainrt_port_context* tls_current_context = nullptr;

/* ============================================================================
 * OS Tasks
 * ========================================================================= */

static void* task_trampoline(void* vtask)
{
   auto* task = static_cast<brainrt_port_task*>(vtask);
   tls_binding.task = task; // the creator handed us a reference

   LOG_PORT("task '%s' (#%u) started", task->name.c_str(), task->id);
   task->entry(task->arg);
   LOG_PORT("task '%s' (#%u) finished", task->name.c_str(), task->id);

   // Tear down task-local storage before joiners are released
   task->run_tls_dtor();
   return nullptr;
}

extern "C" brainrt_port_task_t brainrt_port_task_create(brainrt_port_entry_t entry,
                                                        void* arg,
                                                        uint32_t priority,
                                                        uint32_t stack_depth,
                                                        char const* name)
{
   auto* task = new (std::nothrow) brainrt_port_task{};
   if (!task) {
      errno = ENOMEM;
      return nullptr;
   }
   task->id       = task_id_generator.fetch_add(1, std::memory_order_relaxed);
   task->name     = name ? name : "<unnamed>";
   task->priority = priority;
   task->entry    = entry;
   task->arg      = arg;
   task->refs.store(2, std::memory_order_relaxed); // caller + running thread

   pthread_attr_t attr;
   pthread_attr_init(&attr);
   auto const stack_bytes = std::max<size_t>(stack_depth, BRAINRT_PORT_MIN_TASK_STACK);
   pthread_attr_setstacksize(&attr, stack_bytes);

   int rc = pthread_create(&task->handle, &attr, task_trampoline, task);
   pthread_attr_destroy(&attr);

   if (rc != 0) {
      LOG_PORT("pthread_create failed for '%s' (rc=%d)", task->name.c_str(), rc);
      delete task;
      errno = ENOMEM;
      return nullptr;
   }
   task->owns_thread = true;
   return task;
}

extern "C" void brainrt_port_task_join(brainrt_port_task_t task)
{
   assert(task && task->owns_thread && "Only created tasks can be joined");
   pthread_join(task->handle, nullptr);
   task->owns_thread = false;
}

extern "C" brainrt_port_task_t brainrt_port_task_current(void)
{
   if (!tls_binding.task) {
      auto* task = new brainrt_port_task{};
      task->id   = task_id_generator.fetch_add(1, std::memory_order_relaxed);
      task->name = "adopted#" + std::to_string(task->id);
      tls_binding.task = task;
      LOG_PORT("adopted host thread as task #%u", task->id);
   }
   return tls_binding.task;
}

extern "C" void brainrt_port_task_retain(brainrt_port_task_t task)
{
   task->refs.fetch_add(1, std::memory_order_relaxed);
}

extern "C" void brainrt_port_task_release(brainrt_port_task_t task)
{
   if (task->refs.fetch_sub(1, std::memory_order_acq_rel) == 1) {
      if (task->owns_thread) {
         // Last reference dropped without a join: let the thread clean up
         pthread_detach(task->handle);
      }
      delete task;
   }
}

extern "C" char const* brainrt_port_task_get_name(brainrt_port_task_t task)
{
   return task->name.c_str();
}

extern "C" uint32_t brainrt_port_task_get_id(brainrt_port_task_t task)
{
   return task->id;
}

extern "C" void brainrt_port_task_notify(brainrt_port_task_t task)
{
   {
      std::lock_guard lk(task->notify_lock);
      ++task->notify_value;
   }
   task->notify_cv.notify_one();
}

extern "C" uint32_t brainrt_port_task_notify_take(bool clear_on_exit, uint32_t timeout_ms)
{
   auto* task = brainrt_port_task_current();

   std::unique_lock lk(task->notify_lock);
   auto has_value = [task] { return task->notify_value != 0; };

   if (timeout_ms == BRAINRT_PORT_TIMEOUT_MAX) {
      task->notify_cv.wait(lk, has_value);
   } else if (!task->notify_cv.wait_for(lk, std::chrono::milliseconds(timeout_ms), has_value)) {
      return 0;
   }

   uint32_t value = task->notify_value;
   task->notify_value = clear_on_exit ? 0 : value - 1;
   return value;
}

/* ============================================================================
 * Time
 * ========================================================================= */

static std::atomic<int64_t> clock_origin_ns{0};

static int64_t steady_now_ns()
{
   using namespace std::chrono;
   return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

extern "C" uint32_t brainrt_port_millis(void)
{
   int64_t origin = clock_origin_ns.load(std::memory_order_relaxed);
   if (origin == 0) {
      int64_t expected = 0;
      int64_t now = steady_now_ns();
      if (clock_origin_ns.compare_exchange_strong(expected, now, std::memory_order_relaxed)) {
         origin = now;
      } else {
         origin = expected;
      }
   }
   return static_cast<uint32_t>((steady_now_ns() - origin) / 1'000'000);
}

extern "C" void brainrt_port_delay(uint32_t ms)
{
   if (ms == 0) {
      sched_yield();
      return;
   }
   struct timespec req = {.tv_sec = ms / 1000, .tv_nsec = static_cast<long>(ms % 1000) * 1'000'000};
   while (nanosleep(&req, &req) == -1 && errno == EINTR) {
   }
}

extern "C" void brainrt_port_delay_until(uint32_t* prev_time, uint32_t delta)
{
   uint32_t const deadline = *prev_time + delta;
   uint32_t const now      = brainrt_port_millis();

   // Wrap-safe "now < deadline"
   if (static_cast<int32_t>(deadline - now) > 0) {
      brainrt_port_delay(deadline - now);
   }
   *prev_time = deadline;
}

/* ============================================================================
 * Thread-Local Storage
 * ========================================================================= */

extern "C" void brainrt_port_set_tls_pointer(void* tls_base, brainrt_port_tls_dtor_t dtor)
{
   auto* task = brainrt_port_task_current();
   task->tls      = tls_base;
   task->tls_dtor = dtor;
}

extern "C" void* brainrt_port_get_tls_pointer(void)
{
   return brainrt_port_task_current()->tls;
}

/* ============================================================================
 * Execution Contexts
 * ========================================================================= */

// No-op stack allocator for preallocated memory
struct preallocated_stack_noop
{
   using traits_type = boost::context::stack_traits;
   boost::context::stack_context allocate(size_t) { std::abort(); }
   void deallocate(boost::context::stack_context&) noexcept {}
};

extern "C" void brainrt_port_context_init(brainrt_port_context_t* context,
                                          void* stack_base,
                                          size_t stack_size,
                                          brainrt_port_entry_t entry,
                                          void* arg)
{
   // Construct brainrt_port_context_t in place
   ::new (context) brainrt_port_context
   {
      .thread     = {},
      .sched      = {},
      .stack_top  = static_cast<uint8_t*>(stack_base) + stack_size,
      .stack_size = stack_size,
      .entry      = entry,
      .arg        = arg,
   };

   boost::context::stack_context boost_stack_context =
   {
      .size = context->stack_size,
      .sp   = context->stack_top,
   };

   boost::context::preallocated boost_prealloc(
      boost_stack_context.sp,
      boost_stack_context.size,
      boost_stack_context
   );

   preallocated_stack_noop stack_allocator;

   context->thread = boost::context::fiber(
      std::allocator_arg,
      boost_prealloc,
      stack_allocator,
      [context](boost::context::fiber&& sched_in) mutable -> boost::context::fiber
      {
         // Store the switcher continuation so context_yield() can jump back
         context->sched = std::move(sched_in);

         try {
            tls_current_context = context;
            context->entry(context->arg);
            tls_current_context = nullptr;
         } catch (boost::context::detail::forced_unwind const&) {
            tls_current_context = nullptr;
            throw;
         }

         return std::move(context->sched);
      }
   );
}

extern "C" void brainrt_port_context_switch(brainrt_port_context_t* to)
{
   assert(to->thread && "No context to switch to");

   auto* previous = tls_current_context;
   tls_current_context = to;
   to->thread = std::move(to->thread).resume();
   tls_current_context = previous;
}

extern "C" void brainrt_port_context_yield(void)
{
   // Not inside a context - nothing to yield from
   if (!tls_current_context) return;

   auto* current = tls_current_context;
   tls_current_context = nullptr;

   assert(current->sched && "No switcher context to return to");
   current->sched = std::move(current->sched).resume();

   // Resumed by a later context_switch(), which already set tls_current_context
}

extern "C" bool brainrt_port_context_finished(brainrt_port_context_t const* context)
{
   return !context->thread;
}

extern "C" bool brainrt_port_in_context(void)
{
   return tls_current_context != nullptr;
}

extern "C" void brainrt_port_context_destroy(brainrt_port_context_t* context)
{
   if (context->thread) {
      // Still suspended: destroying the fiber unwinds its stack
      LOG_PORT("unwinding live context %p", static_cast<void*>(context));
      auto* previous = tls_current_context;
      context->thread = boost::context::fiber{};
      tls_current_context = previous;
   }

   context->sched = boost::context::fiber{};
   context->~brainrt_port_context();
}

/* ============================================================================
 * CPU Hints
 * ========================================================================= */

extern "C" void brainrt_port_cpu_relax(void)
{
#if defined(__x86_64__) || defined(__i386__)
   __builtin_ia32_pause();
#elif defined(__aarch64__) || defined(__arm__)
   __asm__ __volatile__("yield");
#endif
}

/* ============================================================================
 * Platform Initialization
 * ========================================================================= */

extern "C" void brainrt_port_init(void)
{
   clock_origin_ns.store(steady_now_ns(), std::memory_order_relaxed);
   (void)brainrt_port_task_current();
}

/* ============================================================================
 * Debug / Diagnostics
 * ========================================================================= */

static std::mutex diagnostic_lock;

extern "C" void brainrt_port_diagnostic_write(char const* message)
{
   std::lock_guard lk(diagnostic_lock);
   std::fprintf(stderr, "%s\n", message);
   std::fflush(stderr);
}
