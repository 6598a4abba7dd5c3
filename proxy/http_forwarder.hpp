#pragma once

#include "http1_request.hpp"
#include "proxy_context.hpp"

#include <string>

namespace fhosts {

/**
 * @brief 由请求头构造发往上游的 origin-form 请求头部。
 *
 * 保留原始 header 顺序，去掉 Proxy-Connection/Connection，
 * Host 改写为原始主机名（端口非 80 时附带端口），并追加 Connection: close。
 */
std::string build_upstream_head(const net::http::HttpRequestHead& head, const net::http::UrlParts& url);

/**
 * @brief 处理普通 HTTP 代理请求（绝对形式 URI）。
 *
 * parser 已完成头部解析；请求体边收边转发，响应原样回传直到上游关闭。
 */
ProxyTask handle_http(ProxyContext& ctx, const SessionRef& session, TcpSocket& client, net::http::Http1RequestParser& parser);

} // namespace fhosts
