#pragma once

#include "task.hpp"
#include "workqueue.hpp"
#include <coroutine>

namespace fhosts {

/**
 * @brief 可投递到 workqueue 的 promise 基类：promise 自身就是一个 worknode。
 */
template <lockable lock> struct Work_promise_base : worknode {
    virtual ~Work_promise_base() = default;

    workqueue<lock>* _excutor = nullptr;

    void post(workqueue<lock>* wq)
    {
        _excutor = wq;
        func     = wk_cb;
        if (wq) {
            wq->post(*this);
        }
    }

    static void wk_cb(struct worknode* work)
    {
        auto* promise = static_cast<Work_promise_base*>(work);
        promise->resume_on_executor();
    }

    Work_promise_base& operator=(Work_promise_base&&) = delete;

protected:
    virtual void resume_on_executor() = 0;
};

template <lockable lock, class T = void> struct Work_Promise : Promise<T>, Work_promise_base<lock> {
    auto get_return_object() { return std::coroutine_handle<Work_Promise>::from_promise(*this); }

    void return_value(T&& ret) { Promise<T>::return_value(std::move(ret)); }

    void return_value(T const& ret) { Promise<T>::return_value(ret); }

protected:
    void resume_on_executor() override
    {
        auto coro = std::coroutine_handle<Work_Promise>::from_promise(*this);
        if (!coro.done())
            coro.resume();
    }
};

template <lockable lock> struct Work_Promise<lock, void> : Promise<void>, Work_promise_base<lock> {
    auto get_return_object() { return std::coroutine_handle<Work_Promise>::from_promise(*this); }

    void return_void() noexcept { }

protected:
    void resume_on_executor() override
    {
        auto coro = std::coroutine_handle<Work_Promise>::from_promise(*this);
        if (!coro.done())
            coro.resume();
    }
};

/**
 * @brief 将 Task 交给 executor 运行并放弃所有权。
 *
 * 协程帧在 final_suspend 时自行释放；完成通知通过 mOnCompleted/mUserData 注册。
 */
template <lockable lock, class T> static inline void post_to(Task<T, Work_Promise<lock, T>>& tk, workqueue<lock>& executor)
{
    auto& promise = tk.mCoroutine.promise();
    INIT_LIST_HEAD(&promise.ws_node);
    promise.mReclaim = true;
    tk.detach(); // 放弃所有权，防止局部变量销毁时析构Task
    promise.post(&executor);
}

} // namespace fhosts
