#pragma once

#include <atomic>
#include <concepts>
#include <thread>

namespace fhosts {

template <typename T>
concept lockable = requires(T a) {
    { a.lock() } -> std::same_as<void>;
    { a.unlock() } -> std::same_as<void>;
};

/**
 * @brief 轻量自旋锁，临界区只做链表/表项操作。
 */
struct SpinLock {
    std::atomic_flag locked = ATOMIC_FLAG_INIT;

public:
    void lock()
    {
        unsigned spins = 0;
        while (locked.test_and_set(std::memory_order_acquire)) {
            if (++spins > 64) {
                std::this_thread::yield();
                spins = 0;
            }
        }
    }
    void unlock() { locked.clear(std::memory_order_release); }
};

} // namespace fhosts
