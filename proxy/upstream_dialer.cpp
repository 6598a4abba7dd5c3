#include "upstream_dialer.hpp"

#include "http_common.hpp"
#include "log.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace fhosts {

Task<DialResult, Work_Promise<SpinLock, DialResult>>
dial_upstream(ProxyContext& ctx, const SessionRef& session, TcpSocket& upstream, const std::string& host, uint16_t port)
{
    DialResult  result;
    std::string target = net::http::join_host_port(host, port);
    result.address     = target;

    if (ctx.sessions.aborting()) {
        result.rc    = -ECANCELED;
        result.error = "dial tcp " + target + ": proxy stopping";
        co_return result;
    }

    ctx.sessions.update(session.id, "resolving " + target);
    auto dns = co_await ctx.resolver.resolve(ctx.fdwq.base(), host, port);
    if (!dns.success) {
        FHOSTS_LOG_WARN("[proxy] %s DNS resolve failed %s: %s (%d)",
                        session.peer_id.c_str(),
                        target.c_str(),
                        dns.error_message.c_str(),
                        dns.error_code);
        result.rc    = dns.error_code != 0 ? -std::abs(dns.error_code) : -EHOSTUNREACH;
        result.error = "dial tcp: lookup " + host + ": " + dns.error_message;
        co_return result;
    }

    ctx.sessions.update(session.id, "connecting " + target);
    for (const auto& ep : dns.endpoints) {
        const auto* addr = reinterpret_cast<const sockaddr*>(&ep.addr);
        result.address   = net::format_sockaddr(addr);

        int rc = upstream.open(addr->sa_family);
        if (rc != 0) {
            result.rc    = rc;
            result.error = "dial tcp " + result.address + ": socket: " + std::strerror(-rc);
            continue;
        }
        if (!ctx.sessions.attach(session.id, upstream.native_handle())) {
            upstream.close();
            result.rc    = -ECANCELED;
            result.error = "dial tcp " + result.address + ": proxy stopping";
            co_return result;
        }

        rc = co_await upstream.connect(addr, ep.len, ctx.config.connect_timeout);
        if (rc == 0) {
            FHOSTS_LOG_DEBUG("[proxy] %s connected upstream %s", session.peer_id.c_str(), result.address.c_str());
            result.rc = 0;
            result.error.clear();
            co_return result;
        }
        ctx.sessions.detach(session.id, upstream.native_handle());
        result.rc    = rc;
        result.error = "dial tcp " + result.address + ": connect: " + std::strerror(-rc);
        FHOSTS_LOG_DEBUG("[proxy] %s %s", session.peer_id.c_str(), result.error.c_str());
        upstream.close();
        if (ctx.sessions.aborting())
            break;
    }
    co_return result;
}

} // namespace fhosts
