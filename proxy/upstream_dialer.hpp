#pragma once

#include "proxy_context.hpp"

#include <cstdint>
#include <string>

namespace fhosts {

struct DialResult {
    int         rc { 0 };  ///< 0 成功，否则负 errno / EAI 错误
    std::string address;   ///< 实际连接（或最后尝试）的 ip:port
    std::string error;     ///< 失败描述，形如 "dial tcp 1.2.3.4:443: Connection refused"

    explicit operator bool() const { return rc == 0; }
};

/**
 * @brief 解析 host 并依次尝试各地址直到连接成功。
 *
 * upstream 的 fd 在连接期间登记到会话中，stop 可以中止连接。
 * 成功返回时 fd 仍处于登记状态，调用方用 adopt 形式的 Attachment 接管。
 */
Task<DialResult, Work_Promise<SpinLock, DialResult>>
dial_upstream(ProxyContext& ctx, const SessionRef& session, TcpSocket& upstream, const std::string& host, uint16_t port);

} // namespace fhosts
