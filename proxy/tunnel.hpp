#pragma once

#include "proxy_context.hpp"

#include <string>

namespace fhosts {

struct PipeOutcome {
    std::string label;
    std::string status { "pending" };
    uint64_t    bytes { 0 };
    bool        had_error { false };
};

/**
 * @brief 单向转发 src -> dst，直到 src 关闭或出错。
 *
 * src 正常 EOF 时关闭 dst 的写方向；任一侧出错时中止 dst，使反向的转发协程也能退出。
 */
ProxyTask pipe_data(TcpSocket& src, TcpSocket& dst, std::string flow_desc, PipeOutcome& outcome, bool trace_packets);

/**
 * @brief 处理 CONNECT：替换目标主机、连接上游、回复 200 并双向转发。
 *
 * @param authority CONNECT 请求目标 "host:port"；无法拆分时整体作为 host，端口 443。
 * @param leftover  客户端在请求头之后已经发出的隧道数据。
 */
ProxyTask handle_connect(ProxyContext&      ctx,
                         const SessionRef&  session,
                         TcpSocket&         client,
                         const std::string& authority,
                         std::string        leftover);

} // namespace fhosts
