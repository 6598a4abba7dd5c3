#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace fhosts::net::http {

std::string to_lower(std::string_view input);
bool        iequals(std::string_view a, std::string_view b);

struct UrlParts {
    std::string scheme;
    std::string host;
    uint16_t    port { 0 };
    std::string path;
};

/**
 * @brief 拆分 "host[:port]" / "[v6][:port]"；无端口时使用 default_port。
 * @return 端口非法或 host 为空时返回 false。
 */
bool split_host_port(std::string_view input, uint16_t default_port, std::string& host_out, uint16_t& port_out);

/**
 * @brief 组合 host 与端口，IPv6 字面量加方括号。
 */
std::string join_host_port(std::string_view host, uint16_t port);

/**
 * @brief 解析绝对形式 URL（http://host[:port]/path?query）。
 */
std::optional<UrlParts> parse_url(const std::string& url);

/**
 * @brief 构造带 Connection: close 的最小 HTTP/1.1 响应。
 */
std::string build_http_response(int status_code, std::string_view reason, std::string_view body);

} // namespace fhosts::net::http
