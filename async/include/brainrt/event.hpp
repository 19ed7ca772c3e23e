/**
 * @file event.hpp
 * @brief Manual-reset event for async tasks
 *
 * set() may be called from any OS task; every task waiting on wait() is
 * woken. The event stays set until reset().
 *
 *   Event ready;
 *   executor.spawn([&] { this_task::await(ready.wait()); ... });
 *   ready.set(); // e.g. from a sensor OS task
 */

#ifndef BRAINRT_EVENT_HPP
#define BRAINRT_EVENT_HPP

#include "brainrt/executor.hpp"

#include <atomic>
#include <optional>
#include <variant>
#include <vector>

namespace brainrt
{

class Event
{
public:
   class Wait
   {
   public:
      using Output = std::monostate;

      explicit Wait(Event& event) noexcept : event(&event) {}

      std::optional<std::monostate> poll(Context& cx);

   private:
      Event* event;
   };

   Event() = default;
   Event(Event const&)            = delete;
   Event& operator=(Event const&) = delete;

   /**
    * @brief Set the event and wake all waiters
    */
   void set();

   void reset() noexcept { flag.store(false, std::memory_order_release); }

   [[nodiscard]] bool is_set() const noexcept { return flag.load(std::memory_order_acquire); }

   /**
    * @brief Future completing once the event is set
    */
   [[nodiscard]] Wait wait() noexcept { return Wait(*this); }

   /**
    * @brief Number of registered waiters whose task is still live
    */
   [[nodiscard]] std::size_t waiter_count() const;

private:
   bool add_waiter(Waker const& waker);
   void prune_expired() const;

   std::atomic<bool>          flag{false};
   mutable Spinlock           lock;
   mutable std::vector<Waker> waiters;
};

} // namespace brainrt

#endif // BRAINRT_EVENT_HPP
