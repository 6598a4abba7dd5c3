#pragma once

#include "proxy_context.hpp"
#include "tcp_listener.hpp"

#include <atomic>
#include <string>

namespace fhosts {

using TcpListener = net::tcp_listener<SpinLock>;

/**
 * @brief 单个客户端连接：解析首个请求，CONNECT 交给隧道，其余交给 HTTP 转发。
 *
 * client 的 fd 已由接收循环登记到 sessions；结束时注销并关闭 client，
 * 最后一步从 sessions 中移除该会话。
 */
ProxyTask handle_proxy_connection(ProxyContext& ctx, TcpSocket client, SessionRef session);

/**
 * @brief 接收循环：每个连接派生一个独立协程，直到 stopping 被置位或监听 socket 关闭。
 */
ProxyTask proxy_server(ProxyContext& ctx, TcpListener& listener, std::atomic_bool& stopping);

} // namespace fhosts
