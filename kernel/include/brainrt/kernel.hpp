/**
 * @file kernel.hpp
 * @brief brainrt Kernel API
 *
 * Configuration, the type-erased callable used throughout the runtime, the
 * spinlock, and the facade over the port's OS tasks.
 */

#ifndef BRAINRT_KERNEL_HPP
#define BRAINRT_KERNEL_HPP

#include "brainrt/port.h"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <new>
#include <string_view>
#include <type_traits>
#include <utility>

namespace brainrt
{

namespace config
{
   /**
    * @brief Smart ports on the brain (numbered 1..SMART_PORT_COUNT)
    */
   static constexpr std::uint8_t SMART_PORT_COUNT = 21;

   /**
    * @brief ADI (3-wire) ports per namespace (numbered 1..ADI_PORT_COUNT, A..H)
    */
   static constexpr std::uint8_t ADI_PORT_COUNT = 8;

   /**
    * @brief Expander index used for the brain's own ADI ports
    */
   static constexpr std::uint8_t INTERNAL_ADI_EXPANDER = SMART_PORT_COUNT + 1;
   static_assert(SMART_PORT_COUNT < 32, "Registry masks hold at most 31 smart ports");
   static_assert(ADI_PORT_COUNT <= 8, "ADI masks are 8 bits wide");

   /**
    * @brief Stack reserved for every async task (bytes)
    */
   static constexpr std::size_t TASK_STACK_SIZE = 64 * 1024;
   static_assert(TASK_STACK_SIZE % BRAINRT_STACK_ALIGN == 0, "Task stacks must keep port alignment");

   /**
    * @brief Maximum number of live async tasks per executor
    *
    * Also the run queue capacity: a task is queued at most once.
    */
   static constexpr std::size_t MAX_TASKS = 256;
   static_assert((MAX_TASKS & (MAX_TASKS - 1)) == 0, "Run queue capacity must be a power of two");

   /**
    * @brief Upper bound on one idle wait of an executor (ms)
    */
   static constexpr std::uint32_t EXECUTOR_IDLE_WAIT_MS = 10;

   static constexpr std::uint32_t DEFAULT_TASK_PRIORITY    = 8;
   static constexpr std::uint32_t DEFAULT_TASK_STACK_DEPTH = 8192;

   /**
    * @brief Spins before a contended Spinlock yields its OS task
    */
   static constexpr std::uint32_t SPINLOCK_SPINS_BEFORE_YIELD = 64;
}  // namespace config

/* ============================================================================
 * Function - Type-Erased Callable with Configurable Storage
 * ========================================================================= */

/**
 * @brief Heap allocation policy for Function
 */
enum class HeapPolicy
{
   NoHeap,      // Compile error if callable doesn't fit inline storage
   CanUseHeap,  // Use inline storage if possible, heap otherwise
   MustUseHeap  // Always allocate on heap
};

/**
 * @brief Move-only type-erased callable
 *
 * Like std::function, but the storage is chosen at compile time: callables
 * up to InlineSize bytes live inside the object, larger ones go to the heap
 * only if the policy allows it.
 *
 * @tparam Signature Function signature (e.g., void(), int(float))
 * @tparam InlineSize Size of inline storage buffer in bytes
 * @tparam Policy Heap allocation policy
 */
template<typename Signature, std::size_t InlineSize = 32, HeapPolicy Policy = HeapPolicy::NoHeap>
class Function;

template<typename Ret, typename... Args, std::size_t InlineSize, HeapPolicy Policy>
class Function<Ret(Args...), InlineSize, Policy>
{
   static constexpr bool AllowHeap = (Policy != HeapPolicy::NoHeap);
   static constexpr bool ForceHeap = (Policy == HeapPolicy::MustUseHeap);

   struct Ops
   {
      Ret  (*invoke)(Function&, Args&&...);
      void (*relocate)(Function& dst, Function& src);
      void (*destroy)(Function&);
   };

   Ops const* ops{nullptr};

   union Storage
   {
      alignas(std::max_align_t) std::array<std::byte, InlineSize> buffer;
      void* heap;
   } storage{};

public:
   constexpr Function() = default;
   constexpr Function(std::nullptr_t) noexcept {}

   template<typename F>
      requires (!std::is_same_v<std::decay_t<F>, Function>)
   Function(F&& f)
   {
      emplace(std::forward<F>(f));
   }

   ~Function() { reset(); }

   Function(Function&& other) noexcept { take(other); }

   Function& operator=(Function&& other) noexcept
   {
      if (this != &other) {
         reset();
         take(other);
      }
      return *this;
   }

   Function(Function const&)            = delete;
   Function& operator=(Function const&) = delete;

   /**
    * @brief Replace the stored callable
    */
   template<typename F>
   void emplace(F&& f)
   {
      using Stored = std::decay_t<F>;
      static_assert(std::is_invocable_r_v<Ret, Stored&, Args...>,
                    "Callable signature does not match Function signature");

      constexpr bool Fits    = sizeof(Stored) <= InlineSize && alignof(Stored) <= alignof(std::max_align_t);
      constexpr bool OnHeap  = ForceHeap || !Fits;
      static_assert(!OnHeap || AllowHeap,
                    "Callable too large for inline storage. "
                    "Increase InlineSize or allow heap allocation.");

      reset();

      if constexpr (OnHeap) {
         storage.heap = new Stored(std::forward<F>(f));
      } else {
         ::new (static_cast<void*>(storage.buffer.data())) Stored(std::forward<F>(f));
      }
      ops = &OpsFor<Stored, OnHeap>::table;
   }

   /**
    * @brief Invoke the stored callable
    *
    * const because the stored callable does not change; the callable itself
    * may still mutate its captures.
    */
   Ret operator()(Args... args) const
   {
      return ops->invoke(const_cast<Function&>(*this), std::forward<Args>(args)...);
   }

   explicit operator bool() const noexcept { return ops != nullptr; }

   void reset() noexcept
   {
      if (ops) {
         ops->destroy(*this);
         ops = nullptr;
      }
   }

private:
   template<typename F, bool OnHeap>
   struct OpsFor
   {
      static F* target(Function& self)
      {
         if constexpr (OnHeap) {
            return static_cast<F*>(self.storage.heap);
         } else {
            return std::launder(reinterpret_cast<F*>(self.storage.buffer.data()));
         }
      }

      static Ret invoke(Function& self, Args&&... args)
      {
         return (*target(self))(std::forward<Args>(args)...);
      }

      static void relocate(Function& dst, Function& src)
      {
         if constexpr (OnHeap) {
            dst.storage.heap = std::exchange(src.storage.heap, nullptr);
         } else {
            F* from = target(src);
            ::new (static_cast<void*>(dst.storage.buffer.data())) F(std::move(*from));
            from->~F();
         }
      }

      static void destroy(Function& self)
      {
         if constexpr (OnHeap) {
            delete target(self);
            self.storage.heap = nullptr;
         } else {
            target(self)->~F();
         }
      }

      static constexpr Ops table{
         .invoke   = &OpsFor::invoke,
         .relocate = &OpsFor::relocate,
         .destroy  = &OpsFor::destroy,
      };
   };

   void take(Function& other) noexcept
   {
      if (!other.ops) return;
      other.ops->relocate(*this, other);
      ops = std::exchange(other.ops, nullptr);
   }
};

/* ============================================================================
 * Spinlock
 * ========================================================================= */

/**
 * @brief Spinlock for short critical sections shared between OS tasks
 *
 * Busy-waits with a CPU hint; after config::SPINLOCK_SPINS_BEFORE_YIELD
 * failed attempts it yields the OS task so a preempted holder can finish.
 * Only hold it for bounded, non-suspending work.
 *
 * Usage:
 *   Spinlock lock;
 *   {
 *       SpinlockGuard guard(lock);
 *       // ... critical section ...
 *   } // Automatically unlocked
 */
class Spinlock
{
public:
   constexpr Spinlock() = default;
   ~Spinlock() = default;

   Spinlock(Spinlock const&)            = delete;
   Spinlock& operator=(Spinlock const&) = delete;
   Spinlock(Spinlock&&)                 = delete;
   Spinlock& operator=(Spinlock&&)      = delete;

   void lock();
   void unlock();

   bool try_lock()
   {
      return !flag.test_and_set(std::memory_order_acquire);
   }

   /**
    * @brief Racy snapshot, only for debugging/assertions
    */
   [[nodiscard]] bool is_locked() const
   {
      return flag.test(std::memory_order_relaxed);
   }

private:
   std::atomic_flag flag = ATOMIC_FLAG_INIT;
};

/**
 * @brief RAII guard for spinlocks
 */
class SpinlockGuard
{
public:
   explicit SpinlockGuard(Spinlock& lock) : lock(lock)
   {
      lock.lock();
   }

   ~SpinlockGuard()
   {
      lock.unlock();
   }

   SpinlockGuard(SpinlockGuard const&)            = delete;
   SpinlockGuard& operator=(SpinlockGuard const&) = delete;
   SpinlockGuard(SpinlockGuard&&)                 = delete;
   SpinlockGuard& operator=(SpinlockGuard&&)      = delete;

private:
   Spinlock& lock;
};

/* ============================================================================
 * OS Tasks
 * ========================================================================= */

enum class SpawnError
{
   TaskNotCreated, // The OS could not allocate the task (stack/TCB)
   RunQueueFull,   // Executor already holds config::MAX_TASKS live tasks
};

[[nodiscard]] std::string_view to_string(SpawnError error) noexcept;

struct ThreadOptions
{
   char const*   name{nullptr};
   std::uint32_t priority{config::DEFAULT_TASK_PRIORITY};
   std::uint32_t stack_depth{config::DEFAULT_TASK_STACK_DEPTH};
};

/**
 * @brief Owned handle to an OS-level (preemptively scheduled) task
 *
 * Dropping the handle does not stop the task.
 */
class Thread
{
public:
   using Id = std::uint32_t;
   using EntryFn = Function<void(), 32, HeapPolicy::CanUseHeap>;
   using Options = ThreadOptions;

   /**
    * @brief Create an OS task running entry
    */
   [[nodiscard]] static std::expected<Thread, SpawnError> spawn(EntryFn&& entry, Options const& options = {});

   /**
    * @brief Handle to the calling OS task
    */
   [[nodiscard]] static Thread current();

   ~Thread();
   Thread(Thread&& other) noexcept;
   Thread& operator=(Thread&& other) noexcept;
   Thread(Thread const&)            = delete;
   Thread& operator=(Thread const&) = delete;

   [[nodiscard]] Id get_id() const noexcept;
   [[nodiscard]] std::string_view name() const noexcept;

   /**
    * @brief Wake the task if it is blocked in this_thread::notify_take()
    */
   void notify() const noexcept;

   /**
    * @brief Wait for the task to finish
    *
    * Only valid once, and only for tasks created by spawn().
    */
   void join();

   [[nodiscard]] bool joinable() const noexcept { return task != nullptr && owned; }

   bool operator==(Thread const& other) const noexcept { return task == other.task; }

private:
   Thread(brainrt_port_task_t task, bool owned) noexcept : task(task), owned(owned) {}

   brainrt_port_task_t task{nullptr};
   bool owned{false};
};

namespace this_thread
{
   [[nodiscard]] ::brainrt::Thread::Id id();
   [[nodiscard]] std::string_view name();

   /**
    * @brief Milliseconds since the port started
    */
   [[nodiscard]] std::uint32_t millis();

   /**
    * @brief Block the whole OS task
    *
    * Inside an async task prefer this_task::sleep(), which only suspends
    * the task.
    */
   void delay(std::uint32_t ms);

   /**
    * @brief Wait for a notification (see Thread::notify())
    * @return Notification count observed, 0 on timeout
    */
   std::uint32_t notify_take(bool clear_on_exit = true, std::uint32_t timeout_ms = BRAINRT_PORT_TIMEOUT_MAX);
}  // namespace this_thread

/**
 * @brief Fixed-rate delay that compensates for the loop body's run time
 */
class Interval
{
public:
   Interval() : last_unblock_time(this_thread::millis()) {}

   /**
    * @brief Block until delta ms after the previous unblock
    */
   void delay(std::uint32_t delta_ms)
   {
      brainrt_port_delay_until(&last_unblock_time, delta_ms);
   }

private:
   std::uint32_t last_unblock_time;
};

} // namespace brainrt

#endif // BRAINRT_KERNEL_HPP
