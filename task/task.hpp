#pragma once

#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

namespace fhosts {

struct Promise_base {
    using on_completed_t = void (*)(Promise_base&);

    auto initial_suspend() noexcept { return std::suspend_always(); }

    struct FinalAwaiter {
        Promise_base*           self;
        bool                    await_ready() const noexcept { return false; }
        std::coroutine_handle<> await_suspend(std::coroutine_handle<> h) const noexcept
        {
            // 回调可能恢复父协程并销毁本帧，之后只能使用局部变量。
            auto previous     = self->mPrevious;
            auto on_completed = self->mOnCompleted;
            auto reclaim      = self->mReclaim;
            if (on_completed) {
                on_completed(*self);
            }
            if (reclaim) {
                h.destroy();
                return std::noop_coroutine();
            }
            return previous ? previous : std::noop_coroutine();
        }
        void await_resume() const noexcept { }
    };

    auto final_suspend() noexcept { return FinalAwaiter { this }; }

    void unhandled_exception() noexcept { mException = std::current_exception(); }

    std::coroutine_handle<> mPrevious {};
    on_completed_t          mOnCompleted { nullptr };
    void*                   mUserData { nullptr }; // for generic control blocks
    bool                    mReclaim { false };    // detached frame frees itself at final suspend
    std::exception_ptr      mException {};
};

template <class T> struct Promise : Promise_base {

    void return_value(T&& ret) { mResult.emplace(std::move(ret)); }

    void return_value(T const& ret) { mResult.emplace(ret); }

    T result()
    {
        if (mException) [[unlikely]] {
            std::rethrow_exception(mException);
        }
        return std::move(*mResult);
    }

    auto get_return_object() { return std::coroutine_handle<Promise>::from_promise(*this); }

    std::optional<T> mResult;

    Promise& operator=(Promise&&) = delete;
};

template <> struct Promise<void> : Promise_base {
    void return_void() noexcept { }

    void result()
    {
        if (mException) [[unlikely]] {
            std::rethrow_exception(mException);
        }
    }

    auto get_return_object() { return std::coroutine_handle<Promise>::from_promise(*this); }

    Promise& operator=(Promise&&) = delete;
};

template <class T = void, class P = Promise<T>> struct [[nodiscard]] Task {
    using promise_type = P;

    Task(std::coroutine_handle<promise_type> coroutine = nullptr) noexcept : mCoroutine(coroutine) { }

    Task(Task&& that) noexcept : mCoroutine(that.mCoroutine) { that.mCoroutine = nullptr; }

    Task& operator=(Task&& that) noexcept
    {
        std::swap(mCoroutine, that.mCoroutine);
        return *this;
    }

    ~Task()
    {
        if (mCoroutine)
            mCoroutine.destroy();
    }

    std::coroutine_handle<promise_type> detach() noexcept { return std::exchange(mCoroutine, nullptr); }

    std::coroutine_handle<promise_type> get() const noexcept { return mCoroutine; }

    struct Awaiter {
        bool await_ready() const noexcept { return false; }

        std::coroutine_handle<promise_type> await_suspend(std::coroutine_handle<> coroutine) const noexcept
        {
            promise_type& promise = mCoroutine.promise();
            promise.mPrevious     = coroutine;
            return mCoroutine;
        }

        T await_resume() const { return mCoroutine.promise().result(); }

        std::coroutine_handle<promise_type> mCoroutine;
    };

    auto operator co_await() const noexcept { return Awaiter(mCoroutine); }

    std::coroutine_handle<promise_type> mCoroutine;
};

} // namespace fhosts
