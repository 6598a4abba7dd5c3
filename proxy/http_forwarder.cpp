#include "http_forwarder.hpp"

#include "http_common.hpp"
#include "log.hpp"
#include "tunnel.hpp"
#include "upstream_dialer.hpp"

#include <array>
#include <cstdio>
#include <cstring>

namespace fhosts {

namespace {

    std::string chunk_encode(const std::string& data)
    {
        char size_line[24];
        int  n = std::snprintf(size_line, sizeof(size_line), "%zx\r\n", data.size());
        std::string out;
        out.reserve(static_cast<size_t>(n) + data.size() + 2);
        out.append(size_line, static_cast<size_t>(n));
        out.append(data);
        out.append("\r\n");
        return out;
    }

    Task<void, Work_Promise<SpinLock, void>> respond_bad_gateway(ProxyContext& ctx, TcpSocket& client, std::string error)
    {
        ctx.events.emit(ErrorEvent { "HTTP proxy error: " + error });
        auto response = net::http::build_http_response(502, "Bad Gateway", "Bad Gateway\n");
        (void)co_await client.send_all(response);
    }

} // namespace

std::string build_upstream_head(const net::http::HttpRequestHead& head, const net::http::UrlParts& url)
{
    std::string request;
    request.reserve(head.method.size() + url.path.size() + head.headers.size() * 32 + 64);
    request.append(head.method);
    request.push_back(' ');
    request.append(url.path);
    request.append(" HTTP/");
    request.append(std::to_string(head.http_major));
    request.push_back('.');
    request.append(std::to_string(head.http_minor));
    request.append("\r\n");

    std::string host_value = url.host.find(':') != std::string::npos ? "[" + url.host + "]" : url.host;
    if (url.port != 80)
        host_value += ":" + std::to_string(url.port);

    bool host_written = false;
    for (const auto& entry : head.headers) {
        if (net::http::iequals(entry.name, "proxy-connection") || net::http::iequals(entry.name, "connection"))
            continue;
        if (net::http::iequals(entry.name, "host")) {
            // 只保留一个 Host，取原始主机名
            if (host_written)
                continue;
            host_written = true;
            request.append("Host: ");
            request.append(host_value);
            request.append("\r\n");
            continue;
        }
        request.append(entry.name);
        request.append(": ");
        request.append(entry.value);
        request.append("\r\n");
    }
    if (!host_written) {
        request.append("Host: ");
        request.append(host_value);
        request.append("\r\n");
    }
    request.append("Connection: close\r\n");
    request.append("\r\n");
    return request;
}

ProxyTask handle_http(ProxyContext& ctx, const SessionRef& session, TcpSocket& client, net::http::Http1RequestParser& parser)
{
    const auto& head = parser.request();
    auto        url  = net::http::parse_url(head.target);
    if (!url) {
        FHOSTS_LOG_WARN("[proxy] %s received non-absolute URI: %s", session.peer_id.c_str(), head.target.c_str());
        ctx.sessions.update(session.id, "non-absolute URI");
        auto response = net::http::build_http_response(400, "Bad Request", "Bad Request\n");
        (void)co_await client.send_all(response);
        co_return;
    }

    std::string target_host = ctx.mappings.lookup(url->host);
    if (target_host != url->host) {
        ctx.events.emit(LogEvent { "Proxying HTTP " + url->host + " -> " + target_host });
    }
    FHOSTS_LOG_INFO("[proxy] %s %s %s via %s",
                    session.peer_id.c_str(),
                    head.method.c_str(),
                    head.target.c_str(),
                    net::http::join_host_port(target_host, url->port).c_str());

    auto upstream = ctx.fdwq.make_tcp_socket();
    auto dial     = co_await dial_upstream(ctx, session, upstream, target_host, url->port);
    if (!dial) {
        FHOSTS_LOG_WARN("[proxy] %s upstream connect failed: %s", session.peer_id.c_str(), dial.error.c_str());
        ctx.sessions.update(session.id, head.method + " connect failed " + dial.address);
        co_await respond_bad_gateway(ctx, client, dial.error);
        co_return;
    }
    SessionRegistry::Attachment upstream_attachment(ctx.sessions, session.id, upstream.native_handle(), std::adopt_lock);

    std::string request = build_upstream_head(head, *url);
    if (ssize_t rc = co_await upstream.send_all(request); rc < 0) {
        co_await respond_bad_gateway(ctx, client, "write tcp " + dial.address + ": " + std::strerror(static_cast<int>(-rc)));
        co_return;
    }

    // 请求体：每次解析后把已解码的片段发出去；chunked 请求重新分块
    ctx.sessions.update(session.id, head.method + " sending request body to " + dial.address);
    const bool              chunked = head.chunked;
    std::array<char, 16384> buffer {};
    ssize_t                 body_rc = 0;
    for (;;) {
        std::string body = parser.take_body();
        if (!body.empty()) {
            if (ctx.config.trace_packets)
                FHOSTS_LOG_INFO("[proxy] %s request body bytes=%zu", session.peer_id.c_str(), body.size());
            body_rc = chunked ? co_await upstream.send_all(chunk_encode(body)) : co_await upstream.send_all(body);
            if (body_rc < 0)
                break;
        }
        if (parser.is_message_complete())
            break;

        ssize_t n = co_await client.recv(buffer.data(), buffer.size());
        if (n <= 0) {
            std::string reason;
            if (n < 0 || !parser.finish(&reason) || !parser.is_message_complete()) {
                FHOSTS_LOG_WARN("[proxy] %s client closed before request body completed", session.peer_id.c_str());
                upstream.abort();
                co_return;
            }
            continue;
        }
        std::string reason;
        if (!parser.feed(std::string_view(buffer.data(), static_cast<size_t>(n)), &reason)) {
            FHOSTS_LOG_WARN("[proxy] %s request body parse error: %s", session.peer_id.c_str(), reason.c_str());
            upstream.abort();
            auto response = net::http::build_http_response(400, "Bad Request", "Bad Request\n");
            (void)co_await client.send_all(response);
            co_return;
        }
    }
    if (body_rc >= 0 && chunked) {
        static constexpr std::string_view last_chunk = "0\r\n\r\n";
        body_rc = co_await upstream.send_all(last_chunk.data(), last_chunk.size());
    }
    if (body_rc < 0) {
        std::string error = "write tcp " + dial.address + ": " + std::strerror(static_cast<int>(-body_rc));
        FHOSTS_LOG_WARN("[proxy] %s request body send failed: %s", session.peer_id.c_str(), error.c_str());
        ctx.sessions.update(session.id, head.method + " request body failed " + dial.address);
        upstream.abort();
        co_await respond_bad_gateway(ctx, client, std::move(error));
        co_return;
    }

    // 响应首段单独读取：上游在给出任何响应字节前关闭或出错，按 502 处理
    ctx.sessions.update(session.id, head.method + " awaiting response from " + dial.address);
    ssize_t first = co_await upstream.recv(buffer.data(), buffer.size());
    if (first <= 0) {
        std::string error = "read tcp " + dial.address + ": "
            + (first == 0 ? std::string("EOF before response") : std::string(std::strerror(static_cast<int>(-first))));
        FHOSTS_LOG_WARN("[proxy] %s no response from upstream: %s", session.peer_id.c_str(), error.c_str());
        ctx.sessions.update(session.id, head.method + " no response " + dial.address);
        co_await respond_bad_gateway(ctx, client, std::move(error));
        co_return;
    }
    if (co_await client.send_all(buffer.data(), static_cast<size_t>(first)) < 0) {
        FHOSTS_LOG_DEBUG("[proxy] %s client gone before response was relayed", session.peer_id.c_str());
        upstream.abort();
        co_return;
    }

    // 其余的头部与 body 原样转发，直到上游关闭
    PipeOutcome response_outcome;
    response_outcome.bytes = static_cast<uint64_t>(first);
    co_await pipe_data(upstream, client, session.peer_id + " upstream->client", response_outcome, ctx.config.trace_packets);

    FHOSTS_LOG_INFO("[proxy] %s response closed status=%s bytes=%llu",
                    session.peer_id.c_str(),
                    response_outcome.status.c_str(),
                    static_cast<unsigned long long>(response_outcome.bytes));
    ctx.sessions.update(session.id, head.method + " closed " + response_outcome.status);
    co_return;
}

} // namespace fhosts
