#include "pending_queue.hpp"
#include <stdexcept>

namespace sigq {

bool PendingQueue::push(int signo) noexcept
{
    if (signo <= 0 || static_cast<std::size_t>(signo) >= capacity)
        return false;
    if (contains(signo))
        return true;

    const std::size_t size = size_.load(std::memory_order_relaxed);
    if (size == capacity)
        return false;

    slots_[size] = signo;
    // publish the slot before the new size becomes visible to readers
    size_.store(size + 1, std::memory_order_release);
    return true;
}


bool PendingQueue::contains(int signo) const noexcept
{
    const std::size_t size = size_.load(std::memory_order_acquire);
    for (std::size_t i = 0; i < size; ++i)
        if (slots_[i] == signo)
            return true;
    return false;
}


int PendingQueue::pop()
{
    const std::size_t size = size_.load(std::memory_order_acquire);
    if (size == 0)
        throw std::out_of_range("pending signal queue is empty");

    const int signo = slots_[0];
    for (std::size_t i = 1; i < size; ++i)
        slots_[i - 1] = slots_[i];
    size_.store(size - 1, std::memory_order_release);
    return signo;
}


bool PendingQueue::remove(int signo) noexcept
{
    const std::size_t size = size_.load(std::memory_order_acquire);
    std::size_t kept = 0;
    for (std::size_t i = 0; i < size; ++i)
        if (slots_[i] != signo)
            slots_[kept++] = slots_[i];

    size_.store(kept, std::memory_order_release);
    return kept != size;
}


std::vector<int> PendingQueue::drain()
{
    const std::size_t size = size_.load(std::memory_order_acquire);
    std::vector<int> result(slots_.begin(), slots_.begin() + static_cast<std::ptrdiff_t>(size));
    size_.store(0, std::memory_order_release);
    return result;
}

} // namespace sigq
