#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace fhosts {

inline constexpr uint16_t k_default_proxy_port        = 8899;
inline constexpr size_t   k_default_max_message_bytes = 64u * 1024u * 1024u;
inline constexpr size_t   k_default_max_request_head  = 64u * 1024u;

struct ProxyConfig {
    std::string               host { "127.0.0.1" };
    uint16_t                  port { k_default_proxy_port }; ///< 0 表示由内核分配
    std::chrono::milliseconds connect_timeout { 10000 };      ///< 0 表示不限时
    std::chrono::milliseconds drain_log_interval { 1000 };
    size_t                    max_message_bytes { k_default_max_message_bytes };
    size_t                    max_request_head_bytes { k_default_max_request_head }; ///< 超出回复 431
    int                       threads { 0 };
    bool                      trace_packets { false };
};

} // namespace fhosts
