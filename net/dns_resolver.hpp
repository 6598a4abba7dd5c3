#pragma once

#include "lock.hpp"
#include "worker.hpp"

#include <cstdint>
#include <memory>
#include <netinet/in.h>
#include <string>
#include <sys/socket.h>
#include <vector>

namespace fhosts::net::dns {

struct endpoint {
    sockaddr_storage addr {};
    socklen_t        len { 0 };
};

struct resolve_result {
    bool                  success { false };
    int                   error_code { 0 };
    std::string           error_message;
    std::vector<endpoint> endpoints; ///< getaddrinfo 返回顺序
};

/**
 * @brief 后台线程池执行 getaddrinfo，完成后把等待的协程投递回 workqueue。
 *
 * 析构时会等待已提交的查询全部完成。
 */
class async_resolver {
public:
    explicit async_resolver(size_t worker_count = 0);
    ~async_resolver();

    Task<resolve_result, Work_Promise<SpinLock, resolve_result>>
    resolve(workqueue<SpinLock>& exec, const std::string& host, uint16_t port);

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace fhosts::net::dns
