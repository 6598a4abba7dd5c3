#include "proxy_server.hpp"

#include "http1_request.hpp"
#include "http_common.hpp"
#include "http_forwarder.hpp"
#include "log.hpp"
#include "tunnel.hpp"

#include <array>
#include <exception>
#include <utility>

namespace fhosts {

namespace {

    // 读取直到请求头完整；失败时已回复客户端，返回 false
    Task<bool, Work_Promise<SpinLock, bool>>
    read_request_head(ProxyContext& ctx, const SessionRef& session, TcpSocket& client, net::http::Http1RequestParser& parser)
    {
        std::array<char, 8192> buffer {};
        bool                   received_any_data = false;
        size_t                 head_bytes        = 0;
        std::string            error_reason;

        while (!parser.is_headers_complete()) {
            ssize_t n = co_await client.recv(buffer.data(), buffer.size());
            if (n < 0) {
                FHOSTS_LOG_DEBUG("[proxy] %s read error before request completed", session.peer_id.c_str());
                co_return false;
            }
            if (n == 0) {
                if (received_any_data) {
                    (void)parser.finish(&error_reason);
                    FHOSTS_LOG_WARN("[proxy] %s incomplete request %s", session.peer_id.c_str(), error_reason.c_str());
                }
                co_return false;
            }
            received_any_data = true;
            if (!parser.feed(std::string_view(buffer.data(), static_cast<size_t>(n)), &error_reason)) {
                FHOSTS_LOG_WARN("[proxy] %s parse error: %s", session.peer_id.c_str(), error_reason.c_str());
                ctx.sessions.update(session.id, "parse error: " + error_reason);
                auto response = net::http::build_http_response(400, "Bad Request", "Bad Request\n");
                (void)co_await client.send_all(response);
                co_return false;
            }
            head_bytes += static_cast<size_t>(n);
            if (!parser.is_headers_complete() && head_bytes > ctx.config.max_request_head_bytes) {
                FHOSTS_LOG_WARN("[proxy] %s request head exceeds %zu bytes",
                                session.peer_id.c_str(),
                                ctx.config.max_request_head_bytes);
                ctx.sessions.update(session.id, "request head too large");
                auto response = net::http::build_http_response(431,
                                                               "Request Header Fields Too Large",
                                                               "Request Header Fields Too Large\n");
                (void)co_await client.send_all(response);
                co_return false;
            }
        }
        co_return true;
    }

    ProxyTask serve_connection(ProxyContext& ctx, const SessionRef& session, TcpSocket& client)
    {
        net::http::Http1RequestParser parser;
        ctx.sessions.update(session.id, "reading request");
        if (!co_await read_request_head(ctx, session, client, parser))
            co_return;

        const auto& head = parser.request();
        FHOSTS_LOG_DEBUG("[proxy] %s %s %s", session.peer_id.c_str(), head.method.c_str(), head.target.c_str());

        if (head.method == "CONNECT") {
            if (!parser.is_upgraded() || head.target.empty()) {
                auto response = net::http::build_http_response(400, "Bad Request", "Bad Request\n");
                (void)co_await client.send_all(response);
                co_return;
            }
            ctx.sessions.update(session.id, "CONNECT " + head.target);
            co_await handle_connect(ctx, session, client, head.target, parser.take_upgrade_leftover());
            co_return;
        }

        ctx.sessions.update(session.id, head.method + " " + head.target);
        co_await handle_http(ctx, session, client, parser);
    }

} // namespace

ProxyTask handle_proxy_connection(ProxyContext& ctx, TcpSocket client, SessionRef session)
{
    try {
        co_await serve_connection(ctx, session, client);
    } catch (const std::exception& ex) {
        FHOSTS_LOG_ERROR("[proxy] %s connection failed: %s", session.peer_id.c_str(), ex.what());
    }
    ctx.sessions.detach(session.id, client.native_handle());
    client.close();
    FHOSTS_LOG_DEBUG("[proxy] %s closed", session.peer_id.c_str());
    ctx.sessions.close(session.id);
}

ProxyTask proxy_server(ProxyContext& ctx, TcpListener& listener, std::atomic_bool& stopping)
{
    FHOSTS_LOG_INFO("[proxy] listening on %s",
                    net::http::join_host_port(ctx.config.host, listener.local_port()).c_str());

    while (!stopping.load(std::memory_order_acquire)) {
        int fd = co_await listener.accept();
        if (fd == net::k_accept_fatal) {
            if (!stopping.load(std::memory_order_acquire))
                FHOSTS_LOG_ERROR("[proxy] accept fatal error, listener closed");
            break;
        }
        if (fd < 0)
            continue;

        auto socket = ctx.fdwq.adopt_tcp_socket(fd);
        if (stopping.load(std::memory_order_acquire))
            break;

        auto       peer = socket.peer_address();
        SessionRef session;
        session.id      = ctx.sessions.open(peer);
        session.peer_id = "#" + std::to_string(session.id) + " " + peer;
        if (!ctx.sessions.attach(session.id, socket.native_handle())) {
            ctx.sessions.close(session.id);
            break;
        }
        FHOSTS_LOG_DEBUG("[proxy] %s accepted (fd=%d)", session.peer_id.c_str(), fd);

        auto task = handle_proxy_connection(ctx, std::move(socket), std::move(session));
        post_to(task, ctx.fdwq.base());
    }

    FHOSTS_LOG_INFO("[proxy] accept loop finished");
    co_return;
}

} // namespace fhosts
