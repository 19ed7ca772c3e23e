/**
 * @file task_local.hpp
 * @brief Per-OS-task storage keyed by TaskLocal objects
 *
 * A TaskLocal is a key, normally declared static. Every OS task sees its own
 * independent value for each key, created lazily on first access and
 * destroyed when that OS task ends. Values are only reachable inside a
 * callback, so no reference can outlive the access.
 *
 *   static TaskLocal<Cell<int>> counter([] { return 0; });
 *   counter.set(counter.get().value() + 1);
 *
 * Storage is one block per OS task, attached through the port's TLS pointer.
 * No locking: a block is only touched by its own OS task.
 */

#ifndef BRAINRT_TASK_LOCAL_HPP
#define BRAINRT_TASK_LOCAL_HPP

#include "brainrt/kernel.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace brainrt
{

enum class LocalError
{
   Uninitialized,   // No value yet and the key has no initializer
   AlreadyBorrowed, // Conflicting borrow of a RefCell slot
};

[[nodiscard]] std::string_view to_string(LocalError error) noexcept;

enum class AccessMode : std::uint8_t
{
   Plain,   // Read-only after initialization
   Cell,    // Whole-value get/set/replace
   RefCell, // Checked shared/exclusive borrows
};

/**
 * @brief Slot markers: TaskLocal<Cell<T>> and TaskLocal<RefCell<T>> store a
 *        T with mutable access
 */
template<typename T> struct Cell;
template<typename T> struct RefCell;

namespace detail
{
   class LocalSlot
   {
   public:
      explicit LocalSlot(AccessMode mode) noexcept : mode(mode) {}
      virtual ~LocalSlot() = default;

      AccessMode const mode;
   };

   template<typename T>
   class LocalValue final : public LocalSlot
   {
   public:
      template<typename... Args>
      explicit LocalValue(AccessMode mode, Args&&... args) : LocalSlot(mode), value(std::forward<Args>(args)...) {}

      T value;
      std::int32_t borrows{0}; // RefCell only: >0 shared borrows, -1 exclusive
   };

   /**
    * @brief Values of one OS task, indexed by key
    */
   class LocalStorage
   {
   public:
      LocalStorage() = default;
      ~LocalStorage();
      LocalStorage(LocalStorage const&)            = delete;
      LocalStorage& operator=(LocalStorage const&) = delete;

      /**
       * @brief Block of the calling OS task, attached on first use
       */
      static LocalStorage& current();

      [[nodiscard]] LocalSlot* find(std::size_t key) const noexcept;

      /**
       * @brief Store a slot unless one appeared meanwhile (an initializer
       *        that accessed its own key)
       * @return The slot now stored for key
       */
      LocalSlot& insert(std::size_t key, std::unique_ptr<LocalSlot> slot);

      [[nodiscard]] std::size_t size() const noexcept;

   private:
      std::vector<std::unique_ptr<LocalSlot>> slots;
   };

   /**
    * @brief Unique index for a new key (never reused)
    */
   [[nodiscard]] std::size_t next_local_key() noexcept;

   /**
    * @brief Key and initializer shared by all TaskLocal flavours
    */
   template<typename T, AccessMode Mode>
   class TaskLocalKey
   {
   public:
      using Initializer = Function<T(), 32, HeapPolicy::CanUseHeap>;
      static constexpr AccessMode access_mode = Mode;

      TaskLocalKey() : key(next_local_key()) {}
      explicit TaskLocalKey(Initializer init) : key(next_local_key()), initializer(std::move(init)) {}

      TaskLocalKey(TaskLocalKey const&)            = delete;
      TaskLocalKey& operator=(TaskLocalKey const&) = delete;

      /**
       * @brief Whether the calling OS task already holds a value
       */
      [[nodiscard]] bool is_initialized() const
      {
         return LocalStorage::current().find(key) != nullptr;
      }

      [[nodiscard]] bool has_initializer() const noexcept { return static_cast<bool>(initializer); }

   protected:
      using Slot = LocalValue<T>;

      [[nodiscard]] Slot* find() const
      {
         return static_cast<Slot*>(LocalStorage::current().find(key));
      }

      template<typename... Args>
      Slot& emplace(Args&&... args) const
      {
         auto slot = std::make_unique<Slot>(Mode, std::forward<Args>(args)...);
         return static_cast<Slot&>(LocalStorage::current().insert(key, std::move(slot)));
      }

      /**
       * @brief Current value, running the key's initializer if needed
       */
      [[nodiscard]] Slot* find_or_init() const
      {
         if (auto* slot = find()) return slot;
         if (!initializer) return nullptr;
         return &emplace(initializer());
      }

      std::size_t key;
      Initializer initializer;
   };

   /**
    * @brief Borrow count held for the duration of a callback
    */
   class BorrowGuard
   {
   public:
      BorrowGuard(std::int32_t& borrows, std::int32_t delta) noexcept : borrows(borrows), delta(delta)
      {
         borrows = (delta < 0) ? -1 : borrows + 1;
      }
      ~BorrowGuard()
      {
         borrows = (delta < 0) ? 0 : borrows - 1;
      }
      BorrowGuard(BorrowGuard const&)            = delete;
      BorrowGuard& operator=(BorrowGuard const&) = delete;

   private:
      std::int32_t& borrows;
      std::int32_t  delta;
   };
}  // namespace detail

/* ============================================================================
 * TaskLocal<T> - read-only value
 * ========================================================================= */

template<typename T>
class TaskLocal : public detail::TaskLocalKey<T, AccessMode::Plain>
{
   using Base = detail::TaskLocalKey<T, AccessMode::Plain>;

public:
   using Base::Base;

   /**
    * @brief Run f with the calling OS task's value
    * @return f's result, or Uninitialized if there is no value and no
    *         initializer
    */
   template<typename F>
   auto with(F&& f) const -> std::expected<std::invoke_result_t<F, T const&>, LocalError>
   {
      auto* slot = this->find_or_init();
      if (!slot) return std::unexpected(LocalError::Uninitialized);

      if constexpr (std::is_void_v<std::invoke_result_t<F, T const&>>) {
         std::invoke(std::forward<F>(f), std::as_const(slot->value));
         return {};
      } else {
         return std::invoke(std::forward<F>(f), std::as_const(slot->value));
      }
   }

   /**
    * @brief Run f with the value, creating it with init if absent
    *
    * init takes precedence over the key's own initializer.
    */
   template<typename I, typename F>
   decltype(auto) with_or_init(I&& init, F&& f) const
   {
      auto* slot = this->find();
      if (!slot) slot = &this->emplace(std::invoke(std::forward<I>(init)));
      return std::invoke(std::forward<F>(f), std::as_const(slot->value));
   }
};

/* ============================================================================
 * TaskLocal<Cell<T>> - whole-value replacement
 * ========================================================================= */

template<typename T>
class TaskLocal<Cell<T>> : public detail::TaskLocalKey<T, AccessMode::Cell>
{
   using Base = detail::TaskLocalKey<T, AccessMode::Cell>;

public:
   using Base::Base;

   /**
    * @brief Store value, without running the initializer if absent
    */
   void set(T value) const
   {
      if (auto* slot = this->find()) {
         slot->value = std::move(value);
      } else {
         this->emplace(std::move(value));
      }
   }

   /**
    * @brief Copy of the current value
    */
   [[nodiscard]] std::expected<T, LocalError> get() const
      requires std::copy_constructible<T>
   {
      auto* slot = this->find_or_init();
      if (!slot) return std::unexpected(LocalError::Uninitialized);
      return slot->value;
   }

   /**
    * @brief Store value and return the previous one
    * @return The old value, or std::nullopt if there was none and the key
    *         has no initializer (value is stored either way)
    */
   std::optional<T> replace(T value) const
   {
      if (auto* slot = this->find_or_init()) {
         return std::exchange(slot->value, std::move(value));
      }
      this->emplace(std::move(value));
      return std::nullopt;
   }

   /**
    * @brief Move the value out, leaving a default-constructed one behind
    */
   T take() const
      requires std::default_initializable<T>
   {
      return replace(T{}).value_or(T{});
   }
};

/* ============================================================================
 * TaskLocal<RefCell<T>> - checked borrows
 * ========================================================================= */

template<typename T>
class TaskLocal<RefCell<T>> : public detail::TaskLocalKey<T, AccessMode::RefCell>
{
   using Base = detail::TaskLocalKey<T, AccessMode::RefCell>;

public:
   using Base::Base;

   /**
    * @brief Shared borrow; fails while an exclusive borrow is active
    */
   template<typename F>
   auto with_borrow(F&& f) const -> std::expected<std::invoke_result_t<F, T const&>, LocalError>
   {
      auto* slot = this->find_or_init();
      if (!slot) return std::unexpected(LocalError::Uninitialized);
      if (slot->borrows < 0) return std::unexpected(LocalError::AlreadyBorrowed);

      detail::BorrowGuard guard(slot->borrows, +1);
      if constexpr (std::is_void_v<std::invoke_result_t<F, T const&>>) {
         std::invoke(std::forward<F>(f), std::as_const(slot->value));
         return {};
      } else {
         return std::invoke(std::forward<F>(f), std::as_const(slot->value));
      }
   }

   /**
    * @brief Exclusive borrow; fails while any other borrow is active
    */
   template<typename F>
   auto with_borrow_mut(F&& f) const -> std::expected<std::invoke_result_t<F, T&>, LocalError>
   {
      auto* slot = this->find_or_init();
      if (!slot) return std::unexpected(LocalError::Uninitialized);
      if (slot->borrows != 0) return std::unexpected(LocalError::AlreadyBorrowed);

      detail::BorrowGuard guard(slot->borrows, -1);
      if constexpr (std::is_void_v<std::invoke_result_t<F, T&>>) {
         std::invoke(std::forward<F>(f), slot->value);
         return {};
      } else {
         return std::invoke(std::forward<F>(f), slot->value);
      }
   }

   std::expected<void, LocalError> set(T value) const
   {
      auto* slot = this->find();
      if (!slot) {
         this->emplace(std::move(value));
         return {};
      }
      if (slot->borrows != 0) return std::unexpected(LocalError::AlreadyBorrowed);
      slot->value = std::move(value);
      return {};
   }

   [[nodiscard]] std::expected<T, LocalError> get() const
      requires std::copy_constructible<T>
   {
      return with_borrow([](T const& value) { return value; });
   }

   /**
    * @brief Store value and return the previous one, as Cell::replace()
    *
    * Fails only while the value is borrowed.
    */
   std::expected<std::optional<T>, LocalError> replace(T value) const
   {
      auto* slot = this->find_or_init();
      if (!slot) {
         this->emplace(std::move(value));
         return std::optional<T>{};
      }
      if (slot->borrows != 0) return std::unexpected(LocalError::AlreadyBorrowed);
      return std::optional<T>(std::exchange(slot->value, std::move(value)));
   }

   /**
    * @brief Move the value out (or a default one if there was none),
    *        leaving a default-constructed value behind
    */
   std::expected<T, LocalError> take() const
      requires std::default_initializable<T>
   {
      auto old = replace(T{});
      if (!old) return std::unexpected(old.error());
      return std::move(*old).value_or(T{});
   }
};

} // namespace brainrt

#endif // BRAINRT_TASK_LOCAL_HPP
