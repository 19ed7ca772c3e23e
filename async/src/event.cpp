#include "brainrt/event.hpp"

#include <algorithm>

namespace brainrt
{

std::optional<std::monostate> Event::Wait::poll(Context& cx)
{
   if (event->is_set() || !event->add_waiter(cx.waker())) {
      return std::monostate{};
   }
   return std::nullopt;
}

bool Event::add_waiter(Waker const& waker)
{
   SpinlockGuard guard(lock);
   // Checked under the lock: set() cannot slip in between
   if (flag.load(std::memory_order_acquire)) return false;

   prune_expired();

   bool const known = std::any_of(waiters.begin(), waiters.end(),
                                  [&waker](Waker const& waiter) { return waiter.will_wake(waker); });
   if (!known) waiters.push_back(waker);
   return true;
}

void Event::set()
{
   std::vector<Waker> woken;
   {
      SpinlockGuard guard(lock);
      flag.store(true, std::memory_order_release);
      woken.swap(waiters);
   }
   for (auto const& waker : woken) {
      waker.wake();
   }
}

// Waiters of cancelled or finished tasks would otherwise stay until set().
// Caller holds the lock.
void Event::prune_expired() const
{
   std::erase_if(waiters, [](Waker const& waiter) { return waiter.expired(); });
}

std::size_t Event::waiter_count() const
{
   SpinlockGuard guard(lock);
   prune_expired();
   return waiters.size();
}

} // namespace brainrt
