/**
 * @file spsc_ring.hpp
 * @brief Single-producer/single-consumer ring with inline storage.
 *
 * Bridges a byte-at-a-time driver (UART/I2C interrupt, reader thread) and
 * the endpoint poll loop without allocating:
 *  - Storage is a std::array sized at compile time; nothing on the heap.
 *  - Exception-free hot path (push/pop return bool).
 *  - Minimal synchronization: acquire/release pairs for SPSC.
 *  - Indices padded to avoid false sharing.
 *
 * One-slot-open scheme: usable capacity is N - 1.
 *
 * @tparam T Element type. Must be trivially copyable or nothrow-movable.
 * @tparam N Slot count (power of two, >= 2).
 */
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <utility>

namespace flem::mem {

/// Cache line size hint (adjust per platform if needed).
inline constexpr std::size_t kCacheLine = 64;

/// @brief Trait to constrain element types for interrupt/RT safety.
template <class T>
struct SpscTraits {
  static constexpr bool ok =
    std::is_trivially_copyable_v<T> ||
    std::is_nothrow_move_constructible_v<T>;
};

template <class T, std::size_t N>
class SpscRing final {
  static_assert(N >= 2, "SpscRing needs at least two slots");
  static_assert((N & (N - 1)) == 0, "SpscRing slot count must be a power of two");
  static_assert(SpscTraits<T>::ok, "T must be trivially copyable or nothrow-movable");
  static_assert(std::atomic<std::size_t>::is_always_lock_free,
                "std::atomic<size_t> must be lock-free on this target");

public:
  using value_type = T;

  SpscRing() noexcept = default;

  SpscRing(const SpscRing&)            = delete;
  SpscRing& operator=(const SpscRing&) = delete;

  /**
   * @brief Push by const reference (producer side).
   * @return false if ring is full.
   */
  bool push(const T& v) noexcept(std::is_nothrow_copy_assignable_v<T>) {
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    const std::size_t n = (t + 1) & kMask;
    if (n == head_.load(std::memory_order_acquire)) {
      return false; // full
    }
    buf_[t] = v;
    tail_.store(n, std::memory_order_release);
    return true;
  }

  /**
   * @brief Push by rvalue reference.
   * @return false if ring is full.
   */
  bool push(T&& v) noexcept(std::is_nothrow_move_assignable_v<T>) {
    const std::size_t t = tail_.load(std::memory_order_relaxed);
    const std::size_t n = (t + 1) & kMask;
    if (n == head_.load(std::memory_order_acquire)) {
      return false; // full
    }
    buf_[t] = std::move(v);
    tail_.store(n, std::memory_order_release);
    return true;
  }

  /**
   * @brief Pop one element (consumer side).
   * @return false if ring is empty.
   */
  bool pop(T& out) noexcept(std::is_nothrow_move_assignable_v<T>) {
    const std::size_t h = head_.load(std::memory_order_relaxed);
    if (h == tail_.load(std::memory_order_acquire)) {
      return false; // empty
    }
    out = std::move(buf_[h]);
    head_.store((h + 1) & kMask, std::memory_order_release);
    return true;
  }

  /// @brief True if ring is empty (observer).
  bool empty() const noexcept {
    return head_.load(std::memory_order_acquire) ==
           tail_.load(std::memory_order_acquire);
  }

  /// @brief True if ring is full (observer).
  bool full() const noexcept {
    const auto t = tail_.load(std::memory_order_acquire);
    return ((t + 1) & kMask) == head_.load(std::memory_order_acquire);
  }

  /// @brief Slot count N; at most N - 1 elements are held at once.
  static constexpr std::size_t capacity() noexcept { return N; }

  /// @brief Approximate size (not linearizable across threads).
  std::size_t approx_size() const noexcept {
    const auto t = tail_.load(std::memory_order_acquire);
    const auto h = head_.load(std::memory_order_acquire);
    return (t + N - h) & kMask;
  }

private:
  static constexpr std::size_t kMask = N - 1;

  // Producer/consumer indices on separate cache lines (avoid false sharing)
  alignas(kCacheLine) std::atomic<std::size_t> head_{0}; ///< Consumer index
  alignas(kCacheLine) std::atomic<std::size_t> tail_{0}; ///< Producer index

  alignas(kCacheLine) std::array<T, N> buf_{};           ///< Inline slots
};

} // namespace flem::mem
