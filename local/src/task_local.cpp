#include "brainrt/task_local.hpp"
#include "brainrt/port.h"

#include <atomic>

#include "DEBUG_PRINT.hpp"

namespace brainrt
{

std::string_view to_string(LocalError error) noexcept
{
   switch (error) {
      case LocalError::Uninitialized:   return "the task-local value is not initialized";
      case LocalError::AlreadyBorrowed: return "the task-local value is already borrowed";
   }
   return "unknown task-local error";
}

namespace detail
{

static std::atomic<std::size_t> local_key_generator{0};

std::size_t next_local_key() noexcept
{
   return local_key_generator.fetch_add(1, std::memory_order_relaxed);
}

static void destroy_storage(void* block)
{
   delete static_cast<LocalStorage*>(block);
}

LocalStorage& LocalStorage::current()
{
   auto* storage = static_cast<LocalStorage*>(brainrt_port_get_tls_pointer());
   if (!storage) {
      storage = new LocalStorage;
      brainrt_port_set_tls_pointer(storage, destroy_storage);
      LOG_LOCAL("attached storage to task '%s'", brainrt_port_task_get_name(brainrt_port_task_current()));
   }
   return *storage;
}

LocalStorage::~LocalStorage()
{
   // Newest keys first. A destructor may touch other keys of this task, even
   // ones already destroyed, in which case they are created again and
   // destroyed by a later iteration.
   while (!slots.empty()) {
      auto slot = std::move(slots.back());
      slots.pop_back();
      slot.reset();
   }
}

LocalSlot* LocalStorage::find(std::size_t key) const noexcept
{
   return key < slots.size() ? slots[key].get() : nullptr;
}

LocalSlot& LocalStorage::insert(std::size_t key, std::unique_ptr<LocalSlot> slot)
{
   if (key >= slots.size()) {
      slots.resize(key + 1);
   }
   if (!slots[key]) {
      slots[key] = std::move(slot);
   }
   return *slots[key];
}

std::size_t LocalStorage::size() const noexcept
{
   std::size_t count = 0;
   for (auto const& slot : slots) {
      if (slot) ++count;
   }
   return count;
}

}  // namespace detail

}  // namespace brainrt
