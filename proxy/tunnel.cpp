#include "tunnel.hpp"

#include "http_common.hpp"
#include "log.hpp"
#include "upstream_dialer.hpp"
#include "when_all.hpp"

#include <array>
#include <cstring>
#include <string_view>

namespace fhosts {

ProxyTask pipe_data(TcpSocket& src, TcpSocket& dst, std::string flow_desc, PipeOutcome& outcome, bool trace_packets)
{
    const char*             flow = flow_desc.c_str();
    std::array<char, 16384> buffer {};
    outcome.label = flow_desc;
    while (true) {
        ssize_t n = co_await src.recv(buffer.data(), buffer.size());
        if (n == 0) {
            FHOSTS_LOG_DEBUG("[proxy] %s closed (EOF) after %llu bytes", flow, static_cast<unsigned long long>(outcome.bytes));
            outcome.status = "eof";
            dst.shutdown_tx();
            break;
        }
        if (n < 0) {
            FHOSTS_LOG_DEBUG("[proxy] %s recv error: %s", flow, std::strerror(static_cast<int>(-n)));
            outcome.status    = std::string("recv_error ") + std::strerror(static_cast<int>(-n));
            outcome.had_error = true;
            dst.abort();
            break;
        }

        if (trace_packets)
            FHOSTS_LOG_INFO("[proxy] %s recv bytes=%lld", flow, static_cast<long long>(n));

        ssize_t sent = co_await dst.send_all(buffer.data(), static_cast<size_t>(n));
        if (sent < 0) {
            FHOSTS_LOG_DEBUG("[proxy] %s send error: %s", flow, std::strerror(static_cast<int>(-sent)));
            outcome.status    = std::string("send_error ") + std::strerror(static_cast<int>(-sent));
            outcome.had_error = true;
            src.abort();
            dst.abort();
            break;
        }
        outcome.bytes += static_cast<uint64_t>(n);
    }
    if (outcome.status == "pending")
        outcome.status = "completed";
    co_return;
}

ProxyTask handle_connect(ProxyContext&      ctx,
                         const SessionRef&  session,
                         TcpSocket&         client,
                         const std::string& authority,
                         std::string        leftover)
{
    std::string host;
    uint16_t    port = 443;
    if (!net::http::split_host_port(authority, 443, host, port)) {
        host = authority;
        port = 443;
    }

    std::string target_host = ctx.mappings.lookup(host);
    std::string target_addr = net::http::join_host_port(target_host, port);
    if (target_host != host) {
        ctx.events.emit(LogEvent { "Tunneling " + authority + " -> " + target_addr });
    }
    FHOSTS_LOG_INFO("[proxy] %s CONNECT %s via %s", session.peer_id.c_str(), authority.c_str(), target_addr.c_str());

    auto upstream = ctx.fdwq.make_tcp_socket();
    auto dial     = co_await dial_upstream(ctx, session, upstream, target_host, port);
    if (!dial) {
        FHOSTS_LOG_WARN("[proxy] %s CONNECT upstream failed %s: %s",
                        session.peer_id.c_str(),
                        target_addr.c_str(),
                        dial.error.c_str());
        ctx.events.emit(ErrorEvent { "Failed to connect to " + target_addr + ": " + dial.error });
        ctx.sessions.update(session.id, "connect failed " + target_addr);
        auto response = net::http::build_http_response(502, "Bad Gateway", "Bad Gateway\n");
        (void)co_await client.send_all(response);
        co_return;
    }
    SessionRegistry::Attachment upstream_attachment(ctx.sessions, session.id, upstream.native_handle(), std::adopt_lock);

    static constexpr std::string_view established = "HTTP/1.1 200 Connection Established\r\n\r\n";
    if (co_await client.send_all(established.data(), established.size()) < 0) {
        FHOSTS_LOG_INFO("[proxy] %s tunnel closed status=client_write_failed", session.peer_id.c_str());
        co_return;
    }

    if (!leftover.empty()) {
        if (co_await upstream.send_all(leftover) < 0) {
            FHOSTS_LOG_INFO("[proxy] %s tunnel closed status=upstream_write_failed", session.peer_id.c_str());
            co_return;
        }
    }

    ctx.sessions.update(session.id, "forwarding CONNECT " + target_addr);

    PipeOutcome client_to_upstream_outcome;
    PipeOutcome upstream_to_client_outcome;
    auto        client_to_upstream = pipe_data(client,
                                        upstream,
                                        session.peer_id + " client->upstream",
                                        client_to_upstream_outcome,
                                        ctx.config.trace_packets);
    auto        upstream_to_client = pipe_data(upstream,
                                        client,
                                        session.peer_id + " upstream->client",
                                        upstream_to_client_outcome,
                                        ctx.config.trace_packets);
    co_await when_all(client_to_upstream, upstream_to_client);

    bool tunnel_error = client_to_upstream_outcome.had_error || upstream_to_client_outcome.had_error;
    FHOSTS_LOG_INFO("[proxy] %s tunnel closed status=%s client->upstream=%s(%llu) upstream->client=%s(%llu)",
                    session.peer_id.c_str(),
                    tunnel_error ? "error" : "completed",
                    client_to_upstream_outcome.status.c_str(),
                    static_cast<unsigned long long>(client_to_upstream_outcome.bytes),
                    upstream_to_client_outcome.status.c_str(),
                    static_cast<unsigned long long>(upstream_to_client_outcome.bytes));
    ctx.sessions.update(session.id, std::string("closed ") + (tunnel_error ? "error" : "completed"));
    co_return;
}

} // namespace fhosts
