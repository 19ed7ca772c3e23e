/**
 * @file executor.hpp
 * @brief Cooperative async executor running on top of one OS task
 *
 * Async tasks are stackful: each runs on its own execution context from the
 * port layer and gives the OS task back only at this_task::await(). One
 * executor per OS task multiplexes any number of them (up to
 * config::MAX_TASKS), so the RTOS still sees a single, ordinary task whose
 * priority and preemption are untouched.
 *
 * Key properties:
 * - FIFO among queued tasks
 * - Wakers may be invoked from any OS task or timer context
 * - An exception escaping a task is caught at the task boundary, reported
 *   on the diagnostic channel and handed to the joiner as TaskFault
 * - With nothing to poll the executor blocks on the OS task's notification,
 *   bounded by the next timer deadline
 *
 * Usage:
 *   Executor executor;
 *   auto handle = executor.spawn([] { this_task::sleep(10); return 42; });
 *   int value = executor.block_on(std::move(handle));
 */

#ifndef BRAINRT_EXECUTOR_HPP
#define BRAINRT_EXECUTOR_HPP

#include "brainrt/kernel.hpp"

#include <atomic>
#include <cassert>
#include <concepts>
#include <cstdint>
#include <exception>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace brainrt
{

using TaskId = std::uint32_t;

enum class TaskStatus : std::uint8_t
{
   Queued,    // Spawned or woken, waiting in the run queue
   Polling,   // Currently running on the executor
   Pending,   // Suspended at an await, waiting for its waker
   Ready,     // Completed with a value
   Panicked,  // Completed by throwing
   Cancelled, // Completed by cancellation
};

[[nodiscard]] std::string_view to_string(TaskStatus status) noexcept;

[[nodiscard]] constexpr bool is_terminal(TaskStatus status) noexcept
{
   return status >= TaskStatus::Ready;
}

/**
 * @brief Thrown at the suspension point of a cancelled task, and to the
 *        joiner of a cancelled task
 */
class TaskCancelled : public std::exception
{
public:
   explicit TaskCancelled(TaskId id) noexcept : task(id) {}

   [[nodiscard]] char const* what() const noexcept override { return "task was cancelled"; }
   [[nodiscard]] TaskId task_id() const noexcept { return task; }

private:
   TaskId task;
};

/**
 * @brief A joined task completed by throwing
 *
 * cause() is the exception the task threw.
 */
class TaskFault : public std::runtime_error
{
public:
   TaskFault(TaskId id, std::string name, std::string message, std::exception_ptr cause);

   [[nodiscard]] TaskId task_id() const noexcept { return task; }
   [[nodiscard]] std::string const& task_name() const noexcept { return name; }
   [[nodiscard]] std::string const& message() const noexcept { return text; }
   [[nodiscard]] std::exception_ptr cause() const noexcept { return original; }

private:
   TaskId             task;
   std::string        name;
   std::string        text;
   std::exception_ptr original;
};

namespace detail
{
   class TaskCore;
   class RunQueue;
}

/* ============================================================================
 * Waker / Context
 * ========================================================================= */

/**
 * @brief Re-queues one task
 *
 * Copyable, and safe to invoke from any OS task. Repeated wakes before the
 * task's next poll queue it once. Waking a finished task does nothing.
 */
class Waker
{
public:
   Waker() = default;

   void wake() const;

   /**
    * @brief True once the task has completed or been destroyed; waking it
    *        would do nothing
    */
   [[nodiscard]] bool expired() const noexcept;

   /**
    * @brief True if both wakers wake the same task
    */
   [[nodiscard]] bool will_wake(Waker const& other) const noexcept
   {
      return !task.owner_before(other.task) && !other.task.owner_before(task);
   }

private:
   friend class detail::TaskCore;

   explicit Waker(std::weak_ptr<detail::TaskCore> task) noexcept : task(std::move(task)) {}

   std::weak_ptr<detail::TaskCore> task;
};

/**
 * @brief What a future sees while being polled
 */
class Context
{
public:
   explicit Context(Waker const& waker) noexcept : current(&waker) {}

   [[nodiscard]] Waker const& waker() const noexcept { return *current; }

private:
   Waker const* current;
};

/**
 * @brief A future: poll() returns the output once complete, otherwise
 *        std::nullopt after arranging for cx.waker() to be woken
 */
template<typename F>
concept Pollable = requires(F& future, Context& cx) {
   typename std::remove_cvref_t<F>::Output;
   { future.poll(cx) } -> std::same_as<std::optional<typename std::remove_cvref_t<F>::Output>>;
};

template<typename T> class JoinHandle;

namespace detail
{
   template<typename T>
   using stored_t = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

   using TaskBody = Function<void(), 48, HeapPolicy::CanUseHeap>;

   /**
    * @brief Completion slot shared by a task and its JoinHandle
    */
   class JoinStateBase
   {
   public:
      virtual ~JoinStateBase() = default;

      [[nodiscard]] bool finished() const noexcept { return done.load(std::memory_order_acquire); }

      /**
       * @brief Register the waker to invoke on completion
       * @return false if the task already completed
       */
      bool set_joiner(Waker const& waker);

      void complete_fault(std::exception_ptr fault);
      void complete_cancelled(TaskId id);

   protected:
      template<typename Store>
      void complete(Store&& store)
      {
         Waker joiner_waker;
         {
            SpinlockGuard guard(lock);
            if (done.load(std::memory_order_relaxed)) return;
            store();
            done.store(true, std::memory_order_release);
            joiner_waker = std::move(joiner);
         }
         joiner_waker.wake();
      }

      void rethrow_if_failed() const;

      mutable Spinlock   lock;
      std::atomic<bool>  done{false};
      std::exception_ptr error;
      Waker              joiner;
   };

   template<typename T>
   class JoinState final : public JoinStateBase
   {
   public:
      void complete_value(T value)
      {
         complete([&] { result.emplace(std::move(value)); });
      }

      /**
       * @brief Move the result out, rethrowing a fault or cancellation
       */
      T take()
      {
         assert(finished() && "Result taken before the task completed");
         rethrow_if_failed();
         assert(result && "Result already taken");
         return std::move(*result);
      }

   private:
      std::optional<T> result;
   };

   struct SpawnedTask
   {
      std::weak_ptr<TaskCore> task;
      TaskId                  id;
   };

   struct Sleeper
   {
      std::uint32_t deadline;
      Waker         waker;
   };

   void request_cancel(std::weak_ptr<TaskCore> const& task) noexcept;

   [[nodiscard]] TaskCore* running_task();

   [[nodiscard]] Waker current_waker();

   /**
    * @brief Throw TaskCancelled if the running task was cancelled
    */
   void check_cancelled();

   /**
    * @brief Give the OS task back to the executor until the running task
    *        is polled again
    */
   void suspend();

   template<typename F>
   struct spawn_output
   {
      using type = std::invoke_result_t<std::decay_t<F>&>;
   };

   template<Pollable F>
   struct spawn_output<F>
   {
      using type = typename std::remove_cvref_t<F>::Output;
   };

   template<typename T>
   struct is_join_handle : std::false_type {};

   template<typename T>
   struct is_join_handle<JoinHandle<T>> : std::true_type {};
}  // namespace detail

template<typename F>
using spawn_output_t = typename detail::spawn_output<F>::type;

/* ============================================================================
 * this_task
 * ========================================================================= */

namespace this_task
{
   /**
    * @brief Whether the caller runs inside an async task
    */
   [[nodiscard]] bool in_task();

   [[nodiscard]] TaskId id();
   [[nodiscard]] std::string_view name();

   /**
    * @brief Waker of the running task
    */
   [[nodiscard]] Waker waker();

   /**
    * @brief Suspend the running task until future completes
    *
    * Throws TaskCancelled if the task is cancelled while suspended.
    */
   template<Pollable F>
   auto await(F&& future) -> typename std::remove_cvref_t<F>::Output
   {
      assert(in_task() && "this_task::await() outside of an async task");

      Waker waker = detail::current_waker();
      Context cx(waker);
      while (true) {
         detail::check_cancelled();
         if (auto output = future.poll(cx)) return std::move(*output);
         detail::suspend();
      }
   }

   /**
    * @brief Let every other queued task run once
    */
   void yield_now();

   /**
    * @brief Suspend the running task for at least ms milliseconds
    */
   void sleep(std::uint32_t ms);

   /**
    * @brief Suspend the running task until this_thread::millis() reaches
    *        deadline
    */
   void sleep_until(std::uint32_t deadline);
}  // namespace this_task

/**
 * @brief Future completing once the port clock reaches a deadline
 */
class Sleep
{
public:
   using Output = std::monostate;

   explicit Sleep(std::uint32_t deadline) noexcept : deadline(deadline) {}

   std::optional<std::monostate> poll(Context& cx);

private:
   std::uint32_t deadline;
   bool          registered{false};
};

/**
 * @brief Future that is pending exactly once
 */
class YieldNow
{
public:
   using Output = std::monostate;

   std::optional<std::monostate> poll(Context& cx);

private:
   bool yielded{false};
};

/* ============================================================================
 * Executor
 * ========================================================================= */

struct TaskOptions
{
   std::string_view name{};
};

class Executor
{
public:
   struct Stats
   {
      std::uint64_t polls{0};      // Task resumptions
      std::uint64_t idle_waits{0}; // Blocking waits on the OS task notification
      std::uint64_t panics{0};     // Tasks completed by throwing
      std::size_t   timers{0};     // Pending sleep deadlines
      std::size_t   live_tasks{0}; // Spawned and not yet completed
   };

   /**
    * @brief Create an executor owned by the calling OS task
    *
    * Only the owning OS task may poll it.
    */
   Executor();
   ~Executor();

   Executor(Executor const&)            = delete;
   Executor& operator=(Executor const&) = delete;
   Executor(Executor&&)                 = delete;
   Executor& operator=(Executor&&)      = delete;

   /**
    * @brief Executor of the running task, or else of the calling OS task
    *        (created on first use)
    */
   static Executor& current();

   /**
    * @brief Queue a callable or a Pollable future as a new task
    * @return Handle to the task, or RunQueueFull / TaskNotCreated
    */
   template<typename F>
   auto try_spawn(F&& work, TaskOptions const& options = {})
      -> std::expected<JoinHandle<spawn_output_t<F>>, SpawnError>;

   /**
    * @brief try_spawn() that throws std::length_error (RunQueueFull) or
    *        std::system_error (TaskNotCreated)
    */
   template<typename F>
   auto spawn(F&& work, TaskOptions const& options = {}) -> JoinHandle<spawn_output_t<F>>;

   /**
    * @brief Poll every task queued at the start of the pass once
    * @return Number of tasks polled
    */
   std::size_t tick();

   /**
    * @brief Poll until no task is runnable
    */
   void run_until_stalled();

   /**
    * @brief Drive the executor until work completes and return its output
    *
    * work is a JoinHandle, a Pollable future or a callable (spawned as a
    * task). Faults surface as TaskFault for callables and handles, and as
    * the original exception for futures.
    */
   template<typename T>
   T block_on(JoinHandle<T> handle);

   template<typename F>
      requires (!detail::is_join_handle<std::remove_cvref_t<F>>::value)
   auto block_on(F&& work);

   /**
    * @brief Wake waker once the port clock reaches deadline
    *
    * Owning OS task only.
    */
   void add_timer(std::uint32_t deadline, Waker waker);

   /**
    * @brief Counters snapshot; may be read from any OS task
    */
   [[nodiscard]] Stats stats() const;

private:
   std::expected<detail::SpawnedTask, SpawnError> spawn_task(detail::TaskBody body,
                                                            std::shared_ptr<detail::JoinStateBase> state,
                                                            TaskOptions const& options,
                                                            bool report_faults);

   template<typename F>
   auto make_task(F&& work, TaskOptions const& options, bool report_faults)
      -> std::expected<JoinHandle<spawn_output_t<F>>, SpawnError>;

   void run_task(std::shared_ptr<detail::TaskCore> const& task);
   void resume(detail::TaskCore& task);
   void forget(detail::TaskCore const& task);
   void wake_sleepers();
   void idle_wait();

   std::shared_ptr<detail::RunQueue> queue;
   Thread::Id                        owner;

   mutable Spinlock tasks_lock;
   std::unordered_map<TaskId, std::shared_ptr<detail::TaskCore>> tasks;

   std::vector<detail::Sleeper> sleepers; // min-heap on deadline

   // Written by the owning OS task, read by stats() from any
   std::atomic<std::uint64_t> polls{0};
   std::atomic<std::uint64_t> idle_waits{0};
   std::atomic<std::uint64_t> panics{0};
   std::atomic<std::size_t>   timer_count{0};
};

/* ============================================================================
 * JoinHandle
 * ========================================================================= */

/**
 * @brief Owning handle to a spawned task, and a future of its result
 *
 * Dropping the handle cancels the task; detach() lets it run on.
 */
template<typename T>
class [[nodiscard]] JoinHandle
{
public:
   using Output = detail::stored_t<T>;

   ~JoinHandle()
   {
      if (state && !state->finished()) detail::request_cancel(task);
   }

   JoinHandle(JoinHandle&& other) noexcept
      : task(std::move(other.task)), state(std::move(other.state)), task_id(other.task_id)
   {
   }

   JoinHandle& operator=(JoinHandle&& other) noexcept
   {
      if (this != &other) {
         if (state && !state->finished()) detail::request_cancel(task);
         task    = std::move(other.task);
         state   = std::move(other.state);
         task_id = other.task_id;
      }
      return *this;
   }

   JoinHandle(JoinHandle const&)            = delete;
   JoinHandle& operator=(JoinHandle const&) = delete;

   [[nodiscard]] TaskId id() const noexcept { return task_id; }

   [[nodiscard]] bool is_finished() const noexcept { return state && state->finished(); }

   /**
    * @brief Stop the task at its next suspension point
    *
    * No effect on a completed task. Joining a cancelled task throws
    * TaskCancelled.
    */
   void cancel() noexcept
   {
      if (state && !state->finished()) detail::request_cancel(task);
   }

   /**
    * @brief Let the task run to completion unobserved
    */
   void detach() noexcept
   {
      task.reset();
      state.reset();
   }

   std::optional<Output> poll(Context& cx)
   {
      assert(state && "Polling a joined or detached handle");
      if (state->finished() || !state->set_joiner(cx.waker())) {
         return take_output();
      }
      return std::nullopt;
   }

   /**
    * @brief Wait for the result: awaits inside a task, drives the calling
    *        OS task's executor outside
    */
   T join();

private:
   friend class Executor;

   JoinHandle(std::weak_ptr<detail::TaskCore> task, std::shared_ptr<detail::JoinState<Output>> state, TaskId id) noexcept
      : task(std::move(task)), state(std::move(state)), task_id(id)
   {
   }

   Output take_output()
   {
      auto completed = std::move(state);
      task.reset();
      return completed->take();
   }

   T take_result()
   {
      if constexpr (std::is_void_v<T>) {
         take_output();
      } else {
         return take_output();
      }
   }

   std::weak_ptr<detail::TaskCore>            task;
   std::shared_ptr<detail::JoinState<Output>> state;
   TaskId                                     task_id{0};
};

/* ============================================================================
 * Template implementations
 * ========================================================================= */

template<typename F>
auto Executor::make_task(F&& work, TaskOptions const& options, bool report_faults)
   -> std::expected<JoinHandle<spawn_output_t<F>>, SpawnError>
{
   using R      = spawn_output_t<F>;
   using Output = detail::stored_t<R>;

   auto state = std::make_shared<detail::JoinState<Output>>();

   detail::TaskBody body = [work = std::forward<F>(work), state]() mutable {
      if constexpr (Pollable<std::decay_t<F>>) {
         state->complete_value(this_task::await(work));
      } else if constexpr (std::is_void_v<R>) {
         std::invoke(work);
         state->complete_value(std::monostate{});
      } else {
         state->complete_value(std::invoke(work));
      }
   };

   auto spawned = spawn_task(std::move(body), state, options, report_faults);
   if (!spawned) return std::unexpected(spawned.error());

   return JoinHandle<R>(std::move(spawned->task), std::move(state), spawned->id);
}

template<typename F>
auto Executor::try_spawn(F&& work, TaskOptions const& options)
   -> std::expected<JoinHandle<spawn_output_t<F>>, SpawnError>
{
   return make_task(std::forward<F>(work), options, true);
}

template<typename F>
auto Executor::spawn(F&& work, TaskOptions const& options) -> JoinHandle<spawn_output_t<F>>
{
   auto handle = try_spawn(std::forward<F>(work), options);
   if (!handle) {
      if (handle.error() == SpawnError::RunQueueFull) {
         throw std::length_error(std::string(to_string(handle.error())));
      }
      throw std::system_error(std::make_error_code(std::errc::not_enough_memory),
                              std::string(to_string(handle.error())));
   }
   return std::move(*handle);
}

template<typename T>
T Executor::block_on(JoinHandle<T> handle)
{
   assert(!this_task::in_task() && "Executor::block_on() inside a task, use this_task::await()");

   while (!handle.is_finished()) {
      if (tick() == 0 && !handle.is_finished()) {
         idle_wait();
      }
   }
   return handle.take_result();
}

template<typename F>
   requires (!detail::is_join_handle<std::remove_cvref_t<F>>::value)
auto Executor::block_on(F&& work)
{
   if constexpr (Pollable<F>) {
      // The future stays on this stack; a task polls it in place
      auto waiter = make_task([&work] { return this_task::await(work); }, {.name = "block_on"}, false);
      if (!waiter) {
         throw std::length_error(std::string(to_string(waiter.error())));
      }
      try {
         return block_on(std::move(*waiter));
      } catch (TaskFault const& fault) {
         std::rethrow_exception(fault.cause());
      }
   } else {
      return block_on(spawn(std::forward<F>(work)));
   }
}

template<typename T>
T JoinHandle<T>::join()
{
   if (this_task::in_task()) {
      if constexpr (std::is_void_v<T>) {
         this_task::await(*this);
      } else {
         return this_task::await(*this);
      }
   } else {
      return Executor::current().block_on(std::move(*this));
   }
}

/* ============================================================================
 * Free functions (current OS task's executor)
 * ========================================================================= */

/**
 * @brief Spawn on the calling OS task's executor
 */
template<typename F>
auto spawn(F&& work, TaskOptions const& options = {}) -> JoinHandle<spawn_output_t<F>>
{
   return Executor::current().spawn(std::forward<F>(work), options);
}

/**
 * @brief Run work to completion
 *
 * Outside a task this drives the calling OS task's executor. Inside a task
 * it behaves like this_task::await(), or a direct call for callables.
 */
template<typename F>
auto block_on(F&& work)
{
   using W = std::remove_cvref_t<F>;

   if constexpr (detail::is_join_handle<W>::value) {
      W handle(std::move(work));
      return handle.join();
   } else if constexpr (Pollable<W>) {
      if (this_task::in_task()) return this_task::await(work);
      return Executor::current().block_on(std::forward<F>(work));
   } else {
      if (this_task::in_task()) return std::invoke(std::forward<F>(work));
      return Executor::current().block_on(std::forward<F>(work));
   }
}

} // namespace brainrt

#endif // BRAINRT_EXECUTOR_HPP
