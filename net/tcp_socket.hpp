#pragma once

/**
 * @file tcp_socket.hpp
 * @brief 非阻塞 TCP socket 协程原语：connect/recv/send_all 与半关闭、强制中止。
 */

#include "epoll_reactor.hpp"
#include "fd_wait.hpp"
#include "worker.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <string>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

namespace fhosts::net {

template <lockable lock> class fd_workqueue;

/**
 * @brief 把 sockaddr 格式化为 "ip:port"（IPv6 带方括号）。
 */
inline std::string format_sockaddr(const sockaddr* addr)
{
    char ip[INET6_ADDRSTRLEN] {};
    if (addr->sa_family == AF_INET) {
        auto* v4 = reinterpret_cast<const sockaddr_in*>(addr);
        ::inet_ntop(AF_INET, &v4->sin_addr, ip, sizeof(ip));
        return std::string(ip) + ":" + std::to_string(ntohs(v4->sin_port));
    }
    if (addr->sa_family == AF_INET6) {
        auto* v6 = reinterpret_cast<const sockaddr_in6*>(addr);
        ::inet_ntop(AF_INET6, &v6->sin6_addr, ip, sizeof(ip));
        return "[" + std::string(ip) + "]:" + std::to_string(ntohs(v6->sin6_port));
    }
    return "unknown";
}

/**
 * @brief reactor 驱动的 TCP 连接。
 *
 * 所有异步操作返回负的 errno 表示失败，不抛异常。
 * 同一时刻每个方向最多一个协程在收/发；另一个协程可通过 shutdown_tx/abort 唤醒它们，
 * 但 close 只能由持有者在没有挂起操作时调用。
 */
template <lockable lock> class tcp_socket {
public:
    tcp_socket()                             = delete;
    tcp_socket(const tcp_socket&)            = delete;
    tcp_socket& operator=(const tcp_socket&) = delete;
    tcp_socket(tcp_socket&& o) noexcept : _reactor(o._reactor), _fd(std::exchange(o._fd, -1)) { }
    tcp_socket& operator=(tcp_socket&& o) noexcept
    {
        if (this != &o) {
            close();
            _reactor = o._reactor;
            _fd      = std::exchange(o._fd, -1);
        }
        return *this;
    }
    ~tcp_socket() { close(); }

    int              native_handle() const { return _fd; }
    bool             is_open() const { return _fd >= 0; }
    workqueue<lock>& exec() { return _reactor->exec(); }

    /**
     * @brief 按地址族创建非阻塞 socket 并登记到 reactor。
     * @return 0 成功，失败返回负 errno。
     */
    int open(int family)
    {
        close();
        int fd = ::socket(family, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
        if (fd < 0)
            return -errno;
        _fd = fd;
        _reactor->add_fd(_fd);
        int one = 1;
        ::setsockopt(_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        return 0;
    }

    /**
     * @brief 发起异步连接；socket 须已 open 且地址族一致。
     * @param timeout 0 表示不设截止时间。
     * @return 0 成功；-ETIMEDOUT 超时；其他负 errno 表示失败。
     */
    Task<int, Work_Promise<lock, int>> connect(const sockaddr* addr, socklen_t len, std::chrono::milliseconds timeout)
    {
        if (_fd < 0)
            co_return -EBADF;
        int r = ::connect(_fd, addr, len);
        if (r == 0)
            co_return 0;
        if (errno != EINPROGRESS)
            co_return -errno;

        typename epoll_reactor<lock>::clock::time_point deadline {};
        if (timeout.count() > 0)
            deadline = epoll_reactor<lock>::clock::now() + timeout;
        bool ready = co_await fd_wait_write_until(*_reactor, _fd, deadline);
        if (!ready)
            co_return -ETIMEDOUT;

        int       err  = 0;
        socklen_t elen = sizeof(err);
        if (::getsockopt(_fd, SOL_SOCKET, SO_ERROR, &err, &elen) != 0)
            co_return -errno;
        co_return err == 0 ? 0 : -err;
    }

    /**
     * @brief 读取至多 len 字节。
     * @return >0 读到的字节数；0 对端关闭；<0 负 errno。
     */
    Task<ssize_t, Work_Promise<lock, ssize_t>> recv(void* buf, size_t len)
    {
        for (;;) {
            ssize_t n = ::recv(_fd, buf, len, MSG_DONTWAIT);
            if (n >= 0)
                co_return n;
            if (errno == EINTR)
                continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK)
                co_return -errno;
            co_await fd_wait_read(*_reactor, _fd);
        }
    }

    /**
     * @brief 发送全部数据。
     * @return 成功返回 len；失败返回负 errno。
     */
    Task<ssize_t, Work_Promise<lock, ssize_t>> send_all(const void* buf, size_t len)
    {
        const char* p    = static_cast<const char*>(buf);
        size_t      sent = 0;
        while (sent < len) {
            ssize_t n = ::send(_fd, p + sent, len - sent, MSG_DONTWAIT | MSG_NOSIGNAL);
            if (n > 0) {
                sent += static_cast<size_t>(n);
                continue;
            }
            if (n < 0 && errno == EINTR)
                continue;
            if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)
                co_return -errno;
            co_await fd_wait_write(*_reactor, _fd);
        }
        co_return static_cast<ssize_t>(sent);
    }

    Task<ssize_t, Work_Promise<lock, ssize_t>> send_all(const std::string& data)
    {
        co_return co_await send_all(data.data(), data.size());
    }

    /** @brief 关闭写方向，对端读到 EOF。 */
    void shutdown_tx()
    {
        if (_fd >= 0)
            ::shutdown(_fd, SHUT_WR);
    }

    /** @brief 双向关闭，唤醒所有挂起的收发。fd 保持打开，由持有者 close。 */
    void abort()
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

    std::string peer_address() const
    {
        sockaddr_storage ss {};
        socklen_t        len = sizeof(ss);
        if (_fd < 0 || ::getpeername(_fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0)
            return "unknown";
        return format_sockaddr(reinterpret_cast<sockaddr*>(&ss));
    }

private:
    friend class fd_workqueue<lock>;
    explicit tcp_socket(epoll_reactor<lock>& reactor) : _reactor(&reactor) { }
    tcp_socket(int fd, epoll_reactor<lock>& reactor) : _reactor(&reactor), _fd(fd)
    {
        int flags = ::fcntl(_fd, F_GETFL, 0);
        if (flags >= 0)
            ::fcntl(_fd, F_SETFL, flags | O_NONBLOCK);
        _reactor->add_fd(_fd);
    }

    epoll_reactor<lock>* _reactor { nullptr };
    int                  _fd { -1 };
};

} // namespace fhosts::net
