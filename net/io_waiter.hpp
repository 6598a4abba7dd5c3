// io_waiter.hpp - worknode that resumes a coroutine parked on fd readiness
#pragma once
#include "workqueue.hpp"
#include <coroutine>

namespace fhosts::net {

/**
 * @brief reactor 登记的等待者。就绪、出错、注销或超时后被投递回执行队列，
 * 由 resume_cb 在 worker 线程上恢复 h。
 */
struct io_waiter_base : worknode {
    std::coroutine_handle<> h;
    bool                    timed_out { false }; ///< 因截止时间到达而唤醒

    static void resume_cb(struct worknode* node)
    {
        auto* waiter = static_cast<io_waiter_base*>(node);
        if (waiter->h)
            waiter->h.resume();
    }
};

} // namespace fhosts::net
