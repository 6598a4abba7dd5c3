// fd_wait.hpp - generic awaiters for fd readiness (read/write)
#pragma once
#include "epoll_reactor.hpp"
#include "io_waiter.hpp"
#include <chrono>
#include <sys/epoll.h>

namespace fhosts::net {

enum class wait_event : uint32_t { read = EPOLLIN, write = EPOLLOUT };

/**
 * @brief 挂起协程直到 fd 可读/可写（或出错、挂断、超时）。
 *
 * await_resume 返回 false 表示因截止时间到达而被唤醒。
 */
template <lockable lock> struct fd_wait_awaiter : io_waiter_base {
    epoll_reactor<lock>&                         reactor;
    int                                          fd;
    uint32_t                                     mask;
    typename epoll_reactor<lock>::clock::time_point deadline {};

    fd_wait_awaiter(epoll_reactor<lock>& r, int f, wait_event ev) : reactor(r), fd(f), mask(static_cast<uint32_t>(ev))
    {
    }
    bool await_ready() const noexcept { return false; }
    void await_suspend(std::coroutine_handle<> h)
    {
        this->h = h;
        reactor.add_waiter(fd, mask, this, deadline);
    }
    bool await_resume() const noexcept { return !this->timed_out; }
};

template <lockable lock> inline fd_wait_awaiter<lock> fd_wait_read(epoll_reactor<lock>& reactor, int fd)
{
    return fd_wait_awaiter<lock>(reactor, fd, wait_event::read);
}

template <lockable lock> inline fd_wait_awaiter<lock> fd_wait_write(epoll_reactor<lock>& reactor, int fd)
{
    return fd_wait_awaiter<lock>(reactor, fd, wait_event::write);
}

/**
 * @brief 带截止时间的写等待，用于非阻塞 connect。
 */
template <lockable lock>
inline fd_wait_awaiter<lock>
fd_wait_write_until(epoll_reactor<lock>& reactor, int fd, typename epoll_reactor<lock>::clock::time_point deadline)
{
    fd_wait_awaiter<lock> aw(reactor, fd, wait_event::write);
    aw.deadline = deadline;
    return aw;
}

} // namespace fhosts::net
