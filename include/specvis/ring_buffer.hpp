#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <memory>
#include <span>
#include <type_traits>

namespace specvis {

/// Single-producer single-consumer lock-free sample ring.
///
/// The PortAudio callback pushes without blocking; the analysis thread either
/// drains it in order or grabs the newest window with latest(). The producer
/// only ever writes outside the readable range, so the consumer may copy that
/// range without further synchronization.
template <typename T>
    requires std::is_trivially_copyable_v<T>
class RingBuffer {
public:
    /// Capacity is rounded up to the next power of two.
    explicit RingBuffer(std::size_t min_capacity)
        : capacity_{round_up_pow2(min_capacity)},
          mask_{capacity_ - 1},
          slots_{std::make_unique<T[]>(capacity_)} {}

    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;
    RingBuffer(RingBuffer&&) = delete;
    RingBuffer& operator=(RingBuffer&&) = delete;

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

    /// Readable element count. Safe from either side.
    [[nodiscard]] std::size_t size() const noexcept {
        return head_.load(std::memory_order_acquire) - tail_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::size_t available() const noexcept { return capacity_ - size(); }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }
    [[nodiscard]] bool full() const noexcept { return size() == capacity_; }

    // Producer side.

    bool try_push(const T& value) noexcept { return try_push(std::span<const T>{&value, 1}) == 1; }

    /// Pushes as much of data as fits. Returns the number written.
    std::size_t try_push(std::span<const T> data) noexcept {
        const auto head = head_.load(std::memory_order_relaxed);
        const auto free = capacity_ - (head - tail_.load(std::memory_order_acquire));
        const auto count = std::min(free, data.size());
        copy_in(head, data.first(count));
        head_.store(head + count, std::memory_order_release);
        return count;
    }

    // Consumer side.

    bool try_pop(T& out) noexcept { return try_pop(std::span<T>{&out, 1}) == 1; }

    std::size_t try_pop(std::span<T> out) noexcept { return discard(peek(out)); }

    /// Copies the oldest elements without consuming them.
    std::size_t peek(std::span<T> out) const noexcept {
        const auto tail = tail_.load(std::memory_order_relaxed);
        const auto count = std::min(head_.load(std::memory_order_acquire) - tail, out.size());
        copy_out(tail, out.first(count));
        return count;
    }

    /// Copies the newest min(size(), out.size()) elements, oldest first, and
    /// drops everything older than them. The copied elements stay readable so
    /// consecutive calls can produce overlapping windows.
    std::size_t latest(std::span<T> out) noexcept {
        const auto head = head_.load(std::memory_order_acquire);
        const auto count = std::min(head - tail_.load(std::memory_order_relaxed), out.size());
        copy_out(head - count, out.first(count));
        tail_.store(head - count, std::memory_order_release);
        return count;
    }

    /// Drops up to count of the oldest elements. Returns the number dropped.
    std::size_t discard(std::size_t count) noexcept {
        const auto tail = tail_.load(std::memory_order_relaxed);
        const auto dropped = std::min(head_.load(std::memory_order_acquire) - tail, count);
        tail_.store(tail + dropped, std::memory_order_release);
        return dropped;
    }

    void clear() noexcept {
        tail_.store(head_.load(std::memory_order_acquire), std::memory_order_release);
    }

private:
    // Both copies split at the end of the storage at most once.
    void copy_in(std::size_t position, std::span<const T> data) noexcept {
        const auto offset = position & mask_;
        const auto first = std::min(data.size(), capacity_ - offset);
        std::copy_n(data.begin(), first, slots_.get() + offset);
        std::copy(data.begin() + first, data.end(), slots_.get());
    }

    void copy_out(std::size_t position, std::span<T> out) const noexcept {
        const auto offset = position & mask_;
        const auto first = std::min(out.size(), capacity_ - offset);
        std::copy_n(slots_.get() + offset, first, out.begin());
        std::copy_n(slots_.get(), out.size() - first, out.begin() + first);
    }

    static constexpr std::size_t round_up_pow2(std::size_t n) noexcept {
        std::size_t p = 1;
        while (p < n) {
            p <<= 1;
        }
        return p;
    }

    // Fixed 64 bytes: GCC warns about hardware_destructive_interference_size.
    static constexpr std::size_t kCacheLine = 64;

    const std::size_t capacity_;
    const std::size_t mask_;
    std::unique_ptr<T[]> slots_;

    alignas(kCacheLine) std::atomic<std::size_t> head_{0};
    alignas(kCacheLine) std::atomic<std::size_t> tail_{0};
};

}  // namespace specvis
