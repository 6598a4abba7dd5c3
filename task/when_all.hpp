#pragma once

#include "task.hpp"
#include <atomic>
#include <coroutine>
#include <cstddef>
#include <tuple>

namespace fhosts {

struct WhenAllCtlBlock {
    std::atomic<std::size_t> count;
    std::coroutine_handle<>  previous {};
};

/**
 * @brief 同时启动若干 void 子任务，全部完成后恢复调用方。
 *
 * 计数多留一份给 await_suspend 自己：子任务可能在别的 worker 线程上提前结束，
 * 只有最后一个递减者负责恢复调用方。
 * 用法： co_await when_all(t1, t2);
 */
template <class... Ts> struct WhenAllAwaiter {
    static_assert(sizeof...(Ts) > 0, "when_all requires at least one task");
    WhenAllCtlBlock    ctl { sizeof...(Ts) + 1, {} };
    std::tuple<Ts&...> tasks;

    explicit WhenAllAwaiter(Ts&... ts) : tasks(ts...) { }

    static void on_completed(Promise_base& base) noexcept
    {
        auto* c = static_cast<WhenAllCtlBlock*>(base.mUserData);
        if (c->count.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            c->previous.resume();
        }
    }

    bool                    await_ready() const noexcept { return false; }
    std::coroutine_handle<> await_suspend(std::coroutine_handle<> h) noexcept
    {
        ctl.previous = h;
        std::apply(
            [this](auto&... t) {
                (([this](auto& child) {
                     auto hchild = child.get();
                     if (!hchild) {
                         ctl.count.fetch_sub(1, std::memory_order_acq_rel);
                         return;
                     }
                     auto& p        = hchild.promise();
                     p.mPrevious    = std::noop_coroutine();
                     p.mUserData    = &ctl;
                     p.mOnCompleted = &on_completed;
                     hchild.resume();
                 })(t),
                 ...);
            },
            tasks);
        if (ctl.count.fetch_sub(1, std::memory_order_acq_rel) == 1)
            return h;
        return std::noop_coroutine();
    }
    void await_resume() const noexcept { }
};

template <class... Ts> WhenAllAwaiter<Ts...> when_all(Ts&... ts)
{
    return WhenAllAwaiter<Ts...>(ts...);
}

} // namespace fhosts
