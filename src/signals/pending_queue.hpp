#pragma once
#include <array>
#include <atomic>
#include <csignal>
#include <cstddef>
#include <vector>

namespace sigq {

// FIFO of signal numbers holding each number at most once.
//
// push() is async-signal-safe and is meant to be called from a signal handler.
// Every other mutator must run with the producing signals blocked on the
// calling thread, so it never interleaves with push().
class PendingQueue {
public:
    // at most one entry per signal number
    static constexpr std::size_t capacity = NSIG;

    // Appends signo unless it is already queued. Returns false only when the
    // queue is full or signo is out of range.
    bool push(int signo) noexcept;

    bool contains(int signo) const noexcept;
    bool empty() const noexcept { return size_.load(std::memory_order_acquire) == 0; }
    std::size_t size() const noexcept { return size_.load(std::memory_order_acquire); }

    // Removes and returns the oldest entry. Throws std::out_of_range when empty.
    int pop();

    // Removes signo wherever it sits, keeping the order of the others.
    bool remove(int signo) noexcept;

    // Removes everything, oldest first.
    std::vector<int> drain();

private:
    static_assert(std::atomic<std::size_t>::is_always_lock_free);

    std::array<int, capacity> slots_{};
    std::atomic<std::size_t> size_{0};
};

} // namespace sigq
