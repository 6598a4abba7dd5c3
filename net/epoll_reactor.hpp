// epoll_reactor.hpp - epoll based reactor managing fd waiters
#pragma once
#include "io_waiter.hpp"
#include "log.hpp"
#include "workqueue.hpp"
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <sys/epoll.h>
#include <thread>
#include <unistd.h>
#include <unordered_map>
#include <vector>

namespace fhosts::net {

/**
 * @brief 单线程 epoll 反应器：登记 fd 上的等待者，就绪后把等待者投递回执行队列。
 *
 * 采用水平触发；每个等待者只被唤醒一次，唤醒后即从表中移除，
 * 无等待者的 fd 会从 epoll 中删除，因此不会出现空转。
 */
template <lockable lock> class epoll_reactor {
public:
    using clock = std::chrono::steady_clock;

    explicit epoll_reactor(workqueue<lock>& exec) : _exec(exec)
    {
        _epfd = ::epoll_create1(EPOLL_CLOEXEC);
        if (_epfd < 0)
            throw std::runtime_error(std::string("epoll_create1 failed: ") + std::strerror(errno));
        _running.store(true, std::memory_order_relaxed);
        _thr = std::thread([this] { this->run_loop(); });
    }
    epoll_reactor(const epoll_reactor&)            = delete;
    epoll_reactor& operator=(const epoll_reactor&) = delete;
    ~epoll_reactor()
    {
        _running.store(false, std::memory_order_relaxed);
        if (_thr.joinable())
            _thr.join();
        if (_epfd >= 0)
            ::close(_epfd);
    }

    workqueue<lock>& exec() { return _exec; }

    void add_fd(int fd)
    {
        std::scoped_lock<lock> lk(_lk);
        if (_fds.find(fd) == _fds.end())
            _fds.emplace(fd, fd_state {});
    }

    /**
     * @brief 登记一个等待者；fd 无效或 epoll_ctl 失败时立即投递，由调用方重试系统调用得到真实错误。
     * @param deadline 非零时为截止时间，到期后置 timed_out 并唤醒。
     */
    void add_waiter(int fd, uint32_t evmask, io_waiter_base* waiter, clock::time_point deadline = {})
    {
        waiter->func      = &io_waiter_base::resume_cb;
        waiter->timed_out = false;
        INIT_LIST_HEAD(&waiter->ws_node);
        if (fd < 0) {
            _exec.post(*waiter);
            return;
        }
        bool failed = false;
        {
            std::scoped_lock<lock> lk(_lk);
            auto&                  st = _fds[fd];
            st.waiters.push_back({ evmask, waiter, deadline });
            if (deadline != clock::time_point {})
                ++_deadline_waiters;
            if (!update_fd_interest_unlocked(fd, st)) {
                st.waiters.pop_back();
                if (deadline != clock::time_point {})
                    --_deadline_waiters;
                failed = true;
            }
        }
        if (failed) {
            FHOSTS_LOG_DEBUG("[reactor] epoll_ctl failed for fd=%d: %s", fd, std::strerror(errno));
            _exec.post(*waiter);
        }
    }

    /**
     * @brief 注销 fd 并唤醒其上所有等待者。须在 close(fd) 之前调用。
     */
    void remove_fd(int fd)
    {
        std::vector<waiter_item> to_resume;
        {
            std::scoped_lock<lock> lk(_lk);
            auto                   it = _fds.find(fd);
            if (it != _fds.end()) {
                to_resume.swap(it->second.waiters);
                if (it->second.interest != 0)
                    ::epoll_ctl(_epfd, EPOLL_CTL_DEL, fd, nullptr);
                _fds.erase(it);
            }
            for (auto& wi : to_resume) {
                if (wi.deadline != clock::time_point {})
                    --_deadline_waiters;
            }
        }
        for (auto& wi : to_resume) {
            _exec.post(*wi.waiter); // 把 waiter 投递回主 workqueue
        }
    }

private:
    struct waiter_item {
        uint32_t          mask;
        io_waiter_base*   waiter;
        clock::time_point deadline;
    };
    struct fd_state {
        std::vector<waiter_item> waiters;
        uint32_t                 interest { 0 };
    };

    bool update_fd_interest_unlocked(int fd, fd_state& st)
    {
        uint32_t new_interest = 0;
        for (auto& wi : st.waiters)
            new_interest |= wi.mask;
        if (new_interest == 0) {
            if (st.interest != 0)
                ::epoll_ctl(_epfd, EPOLL_CTL_DEL, fd, nullptr);
            st.interest = 0;
            return true;
        }
        epoll_event ev {};
        ev.data.fd = fd;
        ev.events  = new_interest | EPOLLERR | EPOLLHUP;
        int op     = st.interest == 0 ? EPOLL_CTL_ADD : EPOLL_CTL_MOD;
        int rc     = ::epoll_ctl(_epfd, op, fd, &ev);
        if (rc < 0 && op == EPOLL_CTL_ADD && errno == EEXIST)
            rc = ::epoll_ctl(_epfd, EPOLL_CTL_MOD, fd, &ev);
        else if (rc < 0 && op == EPOLL_CTL_MOD && errno == ENOENT)
            rc = ::epoll_ctl(_epfd, EPOLL_CTL_ADD, fd, &ev);
        if (rc < 0) {
            st.interest = 0;
            return false;
        }
        st.interest = new_interest;
        return true;
    }

    void expire_deadlines(std::vector<waiter_item>& to_resume)
    {
        auto                   now = clock::now();
        std::scoped_lock<lock> lk(_lk);
        if (_deadline_waiters == 0)
            return;
        for (auto& [fd, st] : _fds) {
            auto& vec     = st.waiters;
            auto  new_end = std::remove_if(vec.begin(), vec.end(), [&](waiter_item& wi) {
                if (wi.deadline != clock::time_point {} && wi.deadline <= now) {
                    wi.waiter->timed_out = true;
                    to_resume.push_back(wi);
                    --_deadline_waiters;
                    return true;
                }
                return false;
            });
            if (new_end != vec.end()) {
                vec.erase(new_end, vec.end());
                update_fd_interest_unlocked(fd, st);
            }
        }
    }

    void run_loop()
    {
        constexpr int            MAX_EVENTS = 64;
        std::vector<epoll_event> evs(MAX_EVENTS);
        std::vector<waiter_item> to_resume;
        while (_running.load(std::memory_order_relaxed)) {
            int n = ::epoll_wait(_epfd, evs.data(), MAX_EVENTS, 50);
            if (n < 0) {
                if (errno == EINTR)
                    continue;
                FHOSTS_LOG_ERROR("[reactor] epoll_wait failed: %s", std::strerror(errno));
                break;
            }
            to_resume.clear();
            for (int i = 0; i < n; ++i) {
                int                    fd    = evs[i].data.fd;
                uint32_t               flags = evs[i].events;
                std::scoped_lock<lock> lk(_lk);
                auto                   it = _fds.find(fd);
                if (it == _fds.end())
                    continue;
                auto& st      = it->second;
                auto& vec     = st.waiters;
                auto  new_end = std::remove_if(vec.begin(), vec.end(), [&](waiter_item& wi) {
                    if ((flags & wi.mask) || (flags & (EPOLLERR | EPOLLHUP))) {
                        if (wi.deadline != clock::time_point {})
                            --_deadline_waiters;
                        to_resume.push_back(wi);
                        return true;
                    }
                    return false;
                });
                vec.erase(new_end, vec.end());
                update_fd_interest_unlocked(fd, st);
            }
            expire_deadlines(to_resume);
            for (auto& wi : to_resume)
                _exec.post(*wi.waiter);
        }
    }

    int                               _epfd { -1 };
    std::atomic_bool                  _running { false };
    std::thread                       _thr;  // 绑定的 IO 线程
    workqueue<lock>&                  _exec; // 主 workqueue，用于恢复协程
    lock                              _lk;
    std::unordered_map<int, fd_state> _fds;
    size_t                            _deadline_waiters { 0 };
};

} // namespace fhosts::net
