/**
 * @file executor.cpp
 * @brief Task records, run queue and the executor loop
 *
 * Scheduling protocol: every task carries a `scheduled` flag. A waker that
 * flips it false -> true owns the single run queue entry for that task; any
 * other wake is coalesced. The executor flips it back to false right before
 * resuming the task, so a wake raised during the poll queues the task again.
 * A completed task keeps the flag set forever, which turns later wakes into
 * no-ops.
 */

#include "brainrt/executor.hpp"
#include "brainrt/mpsc_ring_buffer.hpp"
#include "brainrt/port.h"
#include "brainrt/task_local.hpp"

#include <algorithm>
#include <array>
#include <cassert>
#include <new>

#include "DEBUG_PRINT.hpp"

namespace brainrt
{

std::string_view to_string(TaskStatus status) noexcept
{
   switch (status) {
      case TaskStatus::Queued:    return "Queued";
      case TaskStatus::Polling:   return "Polling";
      case TaskStatus::Pending:   return "Pending";
      case TaskStatus::Ready:     return "Ready";
      case TaskStatus::Panicked:  return "Panicked";
      case TaskStatus::Cancelled: return "Cancelled";
   }
   return "Unknown";
}

TaskFault::TaskFault(TaskId id, std::string name, std::string message, std::exception_ptr cause)
   : std::runtime_error("task #" + std::to_string(id) + " '" + name + "' panicked: " + message),
     task(id),
     name(std::move(name)),
     text(std::move(message)),
     original(std::move(cause))
{
}

namespace detail
{

/* ============================================================================
 * Run Queue
 * ========================================================================= */

/**
 * @brief Ready tasks of one executor
 *
 * Shared with the executor's tasks through weak references so wakers that
 * outlive the executor find nothing to push to.
 */
class RunQueue
{
public:
   RunQueue() : owner(brainrt_port_task_current())
   {
      brainrt_port_task_retain(owner);
   }

   ~RunQueue()
   {
      brainrt_port_task_release(owner);
   }

   RunQueue(RunQueue const&)            = delete;
   RunQueue& operator=(RunQueue const&) = delete;

   void push(std::shared_ptr<TaskCore> task) noexcept
   {
      // Cannot fail: a task is queued at most once and live tasks are
      // capped at the queue capacity
      [[maybe_unused]] bool const pushed = ready.push(std::move(task));
      assert(pushed && "Run queue overflow");
      brainrt_port_task_notify(owner);
   }

   bool pop(std::shared_ptr<TaskCore>& task) noexcept
   {
      return ready.pop(task);
   }

   [[nodiscard]] std::size_t size() const noexcept { return ready.approx_size(); }

private:
   brainrt_port_task_t owner;
   MpscRingBuffer<std::shared_ptr<TaskCore>, config::MAX_TASKS> ready;
};

/* ============================================================================
 * Task Record
 * ========================================================================= */

struct alignas(BRAINRT_STACK_ALIGN) StackChunk
{
   std::array<std::byte, BRAINRT_STACK_ALIGN> bytes;
};

class TaskCore : public std::enable_shared_from_this<TaskCore>
{
public:
   TaskCore(TaskId id,
            std::string name,
            Executor& owner,
            std::weak_ptr<RunQueue> queue,
            TaskBody body,
            std::shared_ptr<JoinStateBase> join,
            bool report_faults)
      : id(id),
        name(std::move(name)),
        owner(owner),
        queue(std::move(queue)),
        body(std::move(body)),
        join(std::move(join)),
        report_faults(report_faults),
        stack(std::make_unique_for_overwrite<StackChunk[]>(config::TASK_STACK_SIZE / sizeof(StackChunk)))
   {
   }

   ~TaskCore()
   {
      release_context();
   }

   TaskCore(TaskCore const&)            = delete;
   TaskCore& operator=(TaskCore const&) = delete;

   [[nodiscard]] Waker waker() { return Waker(weak_from_this()); }

   [[nodiscard]] brainrt_port_context_t* context() noexcept
   {
      return reinterpret_cast<brainrt_port_context_t*>(context_storage.data());
   }

   void start();

   /**
    * @brief Destroy the execution context, unwinding it if still suspended
    */
   void release_context() noexcept
   {
      if (!context_live) return;
      if (!brainrt_port_context_finished(context())) {
         LOG_EXEC("task #%u: unwinding suspended stack", id);
         unwinding = true;
      }
      brainrt_port_context_destroy(context());
      context_live = false;
   }

   /**
    * @brief Drop everything a completed task no longer needs
    */
   void release_resources() noexcept
   {
      release_context();
      stack.reset();
      body.reset();
   }

   TaskId const                         id;
   std::string const                    name;
   Executor&                            owner;
   std::weak_ptr<RunQueue> const        queue;
   TaskBody                             body;
   std::shared_ptr<JoinStateBase> const join;
   bool const                           report_faults;

   std::atomic<TaskStatus> status{TaskStatus::Queued};
   std::atomic<bool>       scheduled{true}; // queued on spawn
   std::atomic<bool>       cancel_requested{false};

   bool context_live{false};
   bool unwinding{false};

private:
   std::unique_ptr<StackChunk[]> stack;
   alignas(BRAINRT_PORT_CONTEXT_ALIGN) std::array<std::byte, BRAINRT_PORT_CONTEXT_SIZE> context_storage{};
};

static TaskLocal<Cell<TaskCore*>> running_task_local([]() -> TaskCore* { return nullptr; });

static void schedule(std::shared_ptr<TaskCore> task) noexcept
{
   // Release: whatever the waker changed is visible to the next poll
   if (task->scheduled.exchange(true, std::memory_order_acq_rel)) return;

   auto queue = task->queue.lock();
   if (!queue) return;

   TaskStatus expected = TaskStatus::Pending;
   task->status.compare_exchange_strong(expected, TaskStatus::Queued, std::memory_order_acq_rel);
   queue->push(std::move(task));
}

static std::string describe(std::exception_ptr const& error)
{
   try {
      std::rethrow_exception(error);
   } catch (std::exception const& e) {
      return e.what();
   } catch (...) {
      return "exception not derived from std::exception";
   }
}

static void finish_panicked(TaskCore& task, std::exception_ptr error)
{
   auto message = describe(error);
   task.status.store(TaskStatus::Panicked, std::memory_order_release);

   if (task.report_faults) {
      std::string const report = "task #" + std::to_string(task.id) + " '" + task.name + "' on OS task '"
                               + brainrt_port_task_get_name(brainrt_port_task_current())
                               + "' panicked: " + message;
      brainrt_port_diagnostic_write(report.c_str());
   }

   task.join->complete_fault(std::make_exception_ptr(TaskFault(task.id, task.name, std::move(message), std::move(error))));
}

static void finish_cancelled(TaskCore& task)
{
   task.status.store(TaskStatus::Cancelled, std::memory_order_release);
   task.join->complete_cancelled(task.id);
}

// Runs on the task's own stack. Nothing thrown by the task leaves here,
// except the port's forced unwinding of a destroyed context.
static void task_entry(void* arg)
{
   auto& task = *static_cast<TaskCore*>(arg);

   try {
      if (task.cancel_requested.load(std::memory_order_acquire)) throw TaskCancelled(task.id);
      task.body();
      task.status.store(TaskStatus::Ready, std::memory_order_release);
   } catch (TaskCancelled const& cancelled) {
      if (cancelled.task_id() == task.id) {
         finish_cancelled(task);
      } else {
         // Joined a cancelled task without handling it
         finish_panicked(task, std::current_exception());
      }
   } catch (...) {
      if (task.unwinding) throw;
      finish_panicked(task, std::current_exception());
   }
}

void TaskCore::start()
{
   assert(!context_live && "Task started twice");
   brainrt_port_context_init(context(), stack.get(), config::TASK_STACK_SIZE, task_entry, this);
   context_live = true;
}

/* ============================================================================
 * Join State
 * ========================================================================= */

bool JoinStateBase::set_joiner(Waker const& waker)
{
   SpinlockGuard guard(lock);
   if (done.load(std::memory_order_relaxed)) return false;
   joiner = waker;
   return true;
}

void JoinStateBase::complete_fault(std::exception_ptr fault)
{
   complete([&] { error = std::move(fault); });
}

void JoinStateBase::complete_cancelled(TaskId id)
{
   auto cancelled = std::make_exception_ptr(TaskCancelled(id));
   complete([&] { error = std::move(cancelled); });
}

void JoinStateBase::rethrow_if_failed() const
{
   if (error) std::rethrow_exception(error);
}

/* ============================================================================
 * Running Task
 * ========================================================================= */

void request_cancel(std::weak_ptr<TaskCore> const& weak) noexcept
{
   auto task = weak.lock();
   if (!task || is_terminal(task->status.load(std::memory_order_acquire))) return;

   LOG_EXEC("task #%u: cancel requested", task->id);
   task->cancel_requested.store(true, std::memory_order_release);
   schedule(std::move(task));
}

TaskCore* running_task()
{
   return running_task_local.get().value_or(nullptr);
}

Waker current_waker()
{
   auto* task = running_task();
   assert(task && "No running task");
   return task->waker();
}

void check_cancelled()
{
   auto* task = running_task();
   if (task && task->cancel_requested.load(std::memory_order_acquire)) {
      throw TaskCancelled(task->id);
   }
}

void suspend()
{
   brainrt_port_context_yield();
}

}  // namespace detail

/* ============================================================================
 * Waker
 * ========================================================================= */

void Waker::wake() const
{
   if (auto core = task.lock()) {
      detail::schedule(std::move(core));
   }
}

bool Waker::expired() const noexcept
{
   auto core = task.lock();
   return !core || is_terminal(core->status.load(std::memory_order_acquire));
}

/* ============================================================================
 * this_task / futures
 * ========================================================================= */

namespace this_task
{
   bool in_task()
   {
      return detail::running_task() != nullptr;
   }

   TaskId id()
   {
      auto* task = detail::running_task();
      return task ? task->id : 0;
   }

   std::string_view name()
   {
      auto* task = detail::running_task();
      return task ? std::string_view(task->name) : std::string_view{};
   }

   Waker waker()
   {
      return detail::current_waker();
   }

   void yield_now()
   {
      await(YieldNow{});
   }

   void sleep(std::uint32_t ms)
   {
      sleep_until(brainrt_port_millis() + ms);
   }

   void sleep_until(std::uint32_t deadline)
   {
      await(Sleep(deadline));
   }
}  // namespace this_task

std::optional<std::monostate> Sleep::poll(Context& cx)
{
   if (static_cast<std::int32_t>(brainrt_port_millis() - deadline) >= 0) {
      return std::monostate{};
   }
   if (!registered) {
      Executor::current().add_timer(deadline, cx.waker());
      registered = true;
   }
   return std::nullopt;
}

std::optional<std::monostate> YieldNow::poll(Context& cx)
{
   if (yielded) return std::monostate{};
   yielded = true;
   cx.waker().wake();
   return std::nullopt;
}

/* ============================================================================
 * Executor
 * ========================================================================= */

namespace
{
   // Heap order for sleepers: the earliest deadline at the front
   struct LaterDeadline
   {
      bool operator()(detail::Sleeper const& a, detail::Sleeper const& b) const noexcept
      {
         return static_cast<std::int32_t>(a.deadline - b.deadline) > 0;
      }
   };

   std::atomic<TaskId> task_id_generator{1};
}

Executor::Executor()
   : queue(std::make_shared<detail::RunQueue>()),
     owner(this_thread::id())
{
   LOG_EXEC("executor %p created on OS task '%s'", static_cast<void*>(this), this_thread::name().data());
}

Executor::~Executor()
{
   // Every unfinished task is resumed once with its cancel flag set so its
   // stack unwinds through TaskCancelled. Tasks spawned during that are
   // picked up by the next round.
   while (true) {
      decltype(tasks) remaining;
      {
         SpinlockGuard guard(tasks_lock);
         remaining.swap(tasks);
      }
      if (remaining.empty()) break;

      for (auto& [id, task] : remaining) {
         task->scheduled.store(true, std::memory_order_release);
         if (!is_terminal(task->status.load(std::memory_order_acquire))) {
            task->cancel_requested.store(true, std::memory_order_release);
            if (task->context_live) {
               resume(*task);
            }
            if (!is_terminal(task->status.load(std::memory_order_acquire))) {
               task->status.store(TaskStatus::Cancelled, std::memory_order_release);
            }
            task->join->complete_cancelled(task->id);
         }
         task->release_resources();
      }
   }
   LOG_EXEC("executor %p destroyed", static_cast<void*>(this));
}

Executor& Executor::current()
{
   // Inside a task: the executor polling it, whichever OS task created it
   if (auto* task = detail::running_task()) return task->owner;

   static TaskLocal<std::shared_ptr<Executor>> executor_local([] { return std::make_shared<Executor>(); });
   return *executor_local.with([](std::shared_ptr<Executor> const& executor) { return executor.get(); }).value();
}

std::expected<detail::SpawnedTask, SpawnError> Executor::spawn_task(detail::TaskBody body,
                                                                   std::shared_ptr<detail::JoinStateBase> state,
                                                                   TaskOptions const& options,
                                                                   bool report_faults)
{
   TaskId const id = task_id_generator.fetch_add(1, std::memory_order_relaxed);
   std::string name = options.name.empty() ? "task#" + std::to_string(id) : std::string(options.name);

   std::shared_ptr<detail::TaskCore> task;
   try {
      task = std::make_shared<detail::TaskCore>(id, std::move(name), *this, queue,
                                                std::move(body), std::move(state), report_faults);
   } catch (std::bad_alloc const&) {
      LOG_EXEC("task #%u: no memory for its stack", id);
      return std::unexpected(SpawnError::TaskNotCreated);
   }

   {
      SpinlockGuard guard(tasks_lock);
      if (tasks.size() >= config::MAX_TASKS) {
         LOG_EXEC("task #%u rejected: %zu live tasks", id, tasks.size());
         return std::unexpected(SpawnError::RunQueueFull);
      }
      tasks.emplace(id, task);
   }

   LOG_EXEC("task #%u '%s' spawned", id, task->name.c_str());
   queue->push(task);
   return detail::SpawnedTask{task, id};
}

std::size_t Executor::tick()
{
   assert(this_thread::id() == owner && "Executor polled from a foreign OS task");

   wake_sleepers();

   // Tasks queued during this pass wait for the next one
   std::size_t const budget = queue->size();
   std::size_t polled = 0;

   std::shared_ptr<detail::TaskCore> task;
   while (polled < budget && queue->pop(task)) {
      run_task(task);
      task.reset();
      ++polled;
   }
   return polled;
}

void Executor::run_until_stalled()
{
   while (tick() != 0) {
   }
}

void Executor::add_timer(std::uint32_t deadline, Waker waker)
{
   // Drop timers of cancelled tasks instead of holding them to their deadline
   if (std::erase_if(sleepers, [](detail::Sleeper const& sleeper) { return sleeper.waker.expired(); }) != 0) {
      std::make_heap(sleepers.begin(), sleepers.end(), LaterDeadline{});
   }
   sleepers.push_back(detail::Sleeper{deadline, std::move(waker)});
   std::push_heap(sleepers.begin(), sleepers.end(), LaterDeadline{});
   timer_count.store(sleepers.size(), std::memory_order_relaxed);
}

Executor::Stats Executor::stats() const
{
   Stats snapshot{
      .polls      = polls.load(std::memory_order_relaxed),
      .idle_waits = idle_waits.load(std::memory_order_relaxed),
      .panics     = panics.load(std::memory_order_relaxed),
      .timers     = timer_count.load(std::memory_order_relaxed),
   };

   SpinlockGuard guard(tasks_lock);
   for (auto const& [id, task] : tasks) {
      if (!is_terminal(task->status.load(std::memory_order_relaxed))) ++snapshot.live_tasks;
   }
   return snapshot;
}

void Executor::run_task(std::shared_ptr<detail::TaskCore> const& task)
{
   // Stale entry: the task was woken while it completed
   if (is_terminal(task->status.load(std::memory_order_acquire))) {
      forget(*task);
      return;
   }

   // Acquire pairs with the waker's exchange: the poll sees what it changed
   task->scheduled.exchange(false, std::memory_order_acq_rel);

   if (task->cancel_requested.load(std::memory_order_acquire) && !task->context_live) {
      // Never started: nothing to unwind
      detail::finish_cancelled(*task);
   } else {
      resume(*task);
      if (!brainrt_port_context_finished(task->context())) {
         TaskStatus expected = TaskStatus::Polling;
         task->status.compare_exchange_strong(expected, TaskStatus::Pending, std::memory_order_acq_rel);
         return;
      }
   }

   auto const status = task->status.load(std::memory_order_acquire);
   if (status == TaskStatus::Panicked && task->report_faults) panics.fetch_add(1, std::memory_order_relaxed);
   LOG_EXEC("task #%u completed: %s", task->id, to_string(status).data());

   task->release_resources();
   if (!task->scheduled.exchange(true, std::memory_order_acq_rel)) {
      forget(*task);
   }
   // Otherwise a wake raced with completion and the queue still holds the
   // task; it is forgotten when that entry is popped
}

void Executor::resume(detail::TaskCore& task)
{
   if (!task.context_live) task.start();

   task.status.store(TaskStatus::Polling, std::memory_order_release);
   polls.fetch_add(1, std::memory_order_relaxed);

   auto* previous = detail::running_task_local.replace(&task).value_or(nullptr);
   brainrt_port_context_switch(task.context());
   detail::running_task_local.set(previous);
}

void Executor::forget(detail::TaskCore const& task)
{
   decltype(tasks)::node_type node;
   {
      SpinlockGuard guard(tasks_lock);
      node = tasks.extract(task.id);
   }
   // node (and possibly the last reference to the task) dies outside the lock
}

void Executor::wake_sleepers()
{
   auto const now = brainrt_port_millis();
   while (!sleepers.empty() && static_cast<std::int32_t>(now - sleepers.front().deadline) >= 0) {
      std::pop_heap(sleepers.begin(), sleepers.end(), LaterDeadline{});
      auto sleeper = std::move(sleepers.back());
      sleepers.pop_back();
      sleeper.waker.wake();
   }
   timer_count.store(sleepers.size(), std::memory_order_relaxed);
}

void Executor::idle_wait()
{
   std::uint32_t timeout = config::EXECUTOR_IDLE_WAIT_MS;
   if (!sleepers.empty()) {
      auto const remaining = static_cast<std::int32_t>(sleepers.front().deadline - brainrt_port_millis());
      if (remaining <= 0) return;
      timeout = std::min(timeout, static_cast<std::uint32_t>(remaining));
   }

   idle_waits.fetch_add(1, std::memory_order_relaxed);
   brainrt_port_task_notify_take(true, timeout);
}

} // namespace brainrt
