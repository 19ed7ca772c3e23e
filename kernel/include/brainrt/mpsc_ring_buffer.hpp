/**
 * @file mpsc_ring_buffer.hpp
 * @brief Lock-free Multi-Producer Single-Consumer (MPSC) ring buffer
 *
 * Used as the executor's run queue: any OS task (or timer context) may push
 * a woken task, only the executor's own OS task pops.
 *
 * Based on Dmitry Vyukov's bounded MPMC queue, reduced to one consumer.
 * Each cell carries a sequence number:
 * - sequence == position:     cell free for the producer claiming position
 * - sequence == position + 1: cell holds data for the consumer
 * - sequence == position + N: cell freed, waiting for the next lap
 */

#ifndef BRAINRT_MPSC_RING_BUFFER_HPP
#define BRAINRT_MPSC_RING_BUFFER_HPP

#include "brainrt/port_traits.h"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

namespace brainrt
{

/**
 * @tparam T Element type (nothrow destructible, default constructible)
 * @tparam N Capacity (power of two)
 *
 * push() is safe from many threads; pop() only from the consumer.
 */
template<typename T, std::size_t N>
class MpscRingBuffer
{
   static_assert(N > 0, "Buffer capacity must be greater than zero");
   static_assert((N & (N - 1)) == 0, "Buffer capacity must be a power of two (for fast modulo via masking)");
   static_assert(std::is_nothrow_destructible_v<T>, "T must be nothrow destructible (for safe cleanup in destructor)");

public:
   constexpr MpscRingBuffer() noexcept : MpscRingBuffer(std::make_index_sequence<N>{}) {}

   MpscRingBuffer(MpscRingBuffer&&)                 = delete;
   MpscRingBuffer& operator=(MpscRingBuffer&&)      = delete;
   MpscRingBuffer(MpscRingBuffer const&)            = delete;
   MpscRingBuffer& operator=(MpscRingBuffer const&) = delete;

   /**
    * @brief Drains remaining elements so their destructors run
    *
    * Only destroy once every producer has stopped.
    */
   ~MpscRingBuffer() noexcept
   {
      T tmp;
      while (pop(tmp)) { /* discard */ }
   }

   [[nodiscard]] static constexpr std::size_t capacity() noexcept { return N; }

   /**
    * @brief Approximate element count, may be stale under contention
    */
   [[nodiscard]] std::size_t approx_size() const noexcept
   {
      auto h = head.load(std::memory_order_acquire);
      auto t = tail.load(std::memory_order_acquire);
      return (h >= t) ? (h - t) : 0;
   }

   /**
    * @brief Push an element (multi-producer safe)
    * @return false if the buffer is full
    */
   template<typename U>
   bool push(U&& value) noexcept(std::is_nothrow_constructible_v<T, U&&>)
   {
      auto position = head.load(std::memory_order_relaxed);

      while (true) {
         auto& cell = cells[position & mask];
         auto sequence = cell.sequence.load(std::memory_order_acquire);
         auto diff = static_cast<intptr_t>(sequence) - static_cast<intptr_t>(position);

         if (diff == 0) {
            if (head.compare_exchange_weak(position, position + 1,
                                           std::memory_order_relaxed,
                                           std::memory_order_relaxed)) {
               ::new (cell.storage.data()) T(std::forward<U>(value));

               // Release: element construction happens-before the consumer's read
               cell.sequence.store(position + 1, std::memory_order_release);
               return true;
            }
            // Lost the race for this position; CAS reloaded it
         } else if (diff < 0) {
            return false; // consumer has not freed this cell yet
         } else {
            position = head.load(std::memory_order_relaxed);
         }
      }
   }

   /**
    * @brief Pop an element (single consumer only)
    * @return false if the buffer is empty (or a producer is mid-write)
    */
   bool pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>)
   {
      auto position = tail.load(std::memory_order_relaxed);
      auto& cell = cells[position & mask];

      auto sequence = cell.sequence.load(std::memory_order_acquire);
      auto diff = static_cast<intptr_t>(sequence) - static_cast<intptr_t>(position + 1);

      if (diff != 0) return false;

      tail.store(position + 1, std::memory_order_relaxed);

      auto& item = cell.item();
      out = std::move(item);
      item.~T();

      // Free the cell for the producer one lap ahead
      cell.sequence.store(position + N, std::memory_order_release);
      return true;
   }

private:
   static constexpr std::size_t mask = N - 1;

   struct Cell
   {
      std::atomic<std::size_t> sequence;
      alignas(T) std::array<std::byte, sizeof(T)> storage{};

      constexpr Cell() noexcept = default;
      constexpr explicit Cell(std::size_t seq) noexcept : sequence(seq) {}

      T& item() noexcept { return *std::launder(reinterpret_cast<T*>(storage.data())); }
   };

   template<std::size_t... Is>
   constexpr explicit MpscRingBuffer(std::index_sequence<Is...>) noexcept : cells{ Cell{Is}... } {}

   // Producer and consumer counters on separate cache lines
   alignas(BRAINRT_PORT_CACHE_LINE) std::atomic<std::size_t> head{0};
   alignas(BRAINRT_PORT_CACHE_LINE) std::atomic<std::size_t> tail{0};
   alignas(BRAINRT_PORT_CACHE_LINE) std::array<Cell, N> cells{};
};

}  // namespace brainrt

#endif // BRAINRT_MPSC_RING_BUFFER_HPP
