#pragma once

#include "control_message.hpp"
#include "dns_resolver.hpp"
#include "fd_base.hpp"
#include "lock.hpp"
#include "mapping_store.hpp"
#include "proxy_config.hpp"
#include "session_registry.hpp"
#include "tcp_socket.hpp"
#include "worker.hpp"

#include <cstdint>
#include <string>

namespace fhosts {

using NetFdWorkqueue = net::fd_workqueue<SpinLock>;
using TcpSocket      = net::tcp_socket<SpinLock>;
using ProxyTask      = Task<void, Work_Promise<SpinLock, void>>;

/**
 * @brief 连接协程共享的引擎状态，由 ProxyEngine 持有并以引用传入。
 */
struct ProxyContext {
    NetFdWorkqueue&           fdwq;
    net::dns::async_resolver& resolver;
    MappingStore&             mappings;
    SessionRegistry&          sessions;
    EventSink&                events;
    const ProxyConfig&        config;
};

/**
 * @brief 单个客户端连接的标识。
 */
struct SessionRef {
    uint64_t    id { 0 };
    std::string peer_id; ///< 日志前缀，如 "#12 127.0.0.1:53422"
};

} // namespace fhosts
