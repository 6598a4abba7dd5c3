/**
 * @file tcp_listener.hpp
 * @brief TCP 监听器封装，提供 bind+listen 与协程化 accept。
 */
#pragma once

#include "epoll_reactor.hpp"
#include "fd_wait.hpp"
#include "worker.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <unistd.h>

namespace fhosts::net {

/**
 * @brief accept 致命错误返回值（监听 socket 已关闭或出现不可恢复错误）。
 */
inline constexpr int k_accept_fatal = -2;

template <lockable lock> class fd_workqueue;

template <lockable lock> class tcp_listener {
public:
    tcp_listener(const tcp_listener&)            = delete;
    tcp_listener& operator=(const tcp_listener&) = delete;
    ~tcp_listener() { close(); }

    /**
     * @brief 绑定并监听。
     * @param host 监听地址，IPv4 或 IPv6 字面量；空串表示 0.0.0.0。
     * @param port 端口，0 表示由内核分配。
     * @throws std::runtime_error 地址非法或 bind/listen 失败，消息带 strerror。
     */
    void bind_listen(const std::string& host, uint16_t port, int backlog = 128)
    {
        close();
        sockaddr_storage ss {};
        socklen_t        len = 0;
        if (host.empty()) {
            auto* v4            = reinterpret_cast<sockaddr_in*>(&ss);
            v4->sin_family      = AF_INET;
            v4->sin_port        = htons(port);
            v4->sin_addr.s_addr = INADDR_ANY;
            len                 = sizeof(sockaddr_in);
        } else if (auto* v4 = reinterpret_cast<sockaddr_in*>(&ss); ::inet_pton(AF_INET, host.c_str(), &v4->sin_addr) == 1) {
            v4->sin_family = AF_INET;
            v4->sin_port   = htons(port);
            len            = sizeof(sockaddr_in);
        } else if (auto* v6 = reinterpret_cast<sockaddr_in6*>(&ss);
                   ::inet_pton(AF_INET6, host.c_str(), &v6->sin6_addr) == 1) {
            v6->sin6_family = AF_INET6;
            v6->sin6_port   = htons(port);
            len             = sizeof(sockaddr_in6);
        } else {
            throw std::runtime_error("invalid listen address " + host);
        }

        int fd = ::socket(ss.ss_family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (fd < 0)
            throw std::runtime_error(std::string("socket failed: ") + std::strerror(errno));
        int opt = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
        if (::bind(fd, reinterpret_cast<sockaddr*>(&ss), len) < 0) {
            int err = errno;
            ::close(fd);
            throw std::runtime_error("listen tcp " + host + ":" + std::to_string(port) + ": bind: " + std::strerror(err));
        }
        if (::listen(fd, backlog) < 0) {
            int err = errno;
            ::close(fd);
            throw std::runtime_error(std::string("listen failed: ") + std::strerror(err));
        }
        _fd = fd;
        _reactor->add_fd(_fd);
    }

    /** @brief 实际绑定的端口（bind 到 0 时由内核分配）。 */
    uint16_t local_port() const
    {
        sockaddr_storage ss {};
        socklen_t        len = sizeof(ss);
        if (_fd < 0 || ::getsockname(_fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0)
            return 0;
        if (ss.ss_family == AF_INET6)
            return ntohs(reinterpret_cast<sockaddr_in6*>(&ss)->sin6_port);
        return ntohs(reinterpret_cast<sockaddr_in*>(&ss)->sin_port);
    }

    /**
     * @brief 异步等待一个新连接。
     * @return 新连接 fd（非阻塞），或 k_accept_fatal。
     */
    Task<int, Work_Promise<lock, int>> accept()
    {
        for (;;) {
            int fd = ::accept4(_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
            if (fd >= 0)
                co_return fd;
            int err = errno;
            if (err == EINTR || err == ECONNABORTED)
                continue;
            if (err == EAGAIN || err == EWOULDBLOCK) {
                co_await fd_wait_read(*_reactor, _fd);
                continue;
            }
            if (err == EMFILE || err == ENFILE) {
                FHOSTS_LOG_WARN("[listener] accept: %s", std::strerror(err));
            }
            co_return k_accept_fatal;
        }
    }

    /** @brief 唤醒挂起的 accept，使其返回 k_accept_fatal；fd 仍由 close 释放。 */
    void shutdown()
    {
        if (_fd >= 0)
            ::shutdown(_fd, SHUT_RDWR);
    }

    void close()
    {
        if (_fd >= 0) {
            _reactor->remove_fd(_fd);
            ::close(_fd);
            _fd = -1;
        }
    }

    int native_handle() const { return _fd; }

private:
    friend class fd_workqueue<lock>;
    explicit tcp_listener(epoll_reactor<lock>& reactor) : _reactor(&reactor) { }

    epoll_reactor<lock>* _reactor { nullptr };
    int                  _fd { -1 };
};

} // namespace fhosts::net
