#include "proxy_engine.hpp"
#include "test_support.hpp"

#include <csignal>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <string>

using namespace fhosts;
using fhosts::test::check;
using fhosts::test::RecordingSink;

namespace {

constexpr std::string_view k_established = "HTTP/1.1 200 Connection Established\r\n\r\n";

ProxyConfig test_config()
{
    ProxyConfig config;
    config.port               = 0;
    config.connect_timeout    = std::chrono::milliseconds(2000);
    config.drain_log_interval = std::chrono::milliseconds(200);
    return config;
}

int test_connect_tunnel_to_mapped_host()
{
    int                          failures = 0;
    fhosts::test::LoopbackServer echo(fhosts::test::echo_handler);
    RecordingSink                sink;
    ProxyEngine                  engine(test_config(), sink);
    engine.start({ { "a.test", "127.0.0.1" } });
    uint16_t proxy_port = engine.port();
    failures += check(proxy_port != 0, "proxy started");

    int client = fhosts::test::connect_loopback(proxy_port);
    if (client < 0)
        return failures + check(false, "connect to proxy");

    std::string authority = "a.test:" + std::to_string(echo.port());
    // 请求头后紧跟的隧道数据也要送达上游
    failures += check(fhosts::test::send_all(client,
                                             "CONNECT " + authority + " HTTP/1.1\r\nHost: " + authority
                                                 + "\r\n\r\nearly-"),
                      "send CONNECT");
    auto reply = fhosts::test::recv_until_contains(client, "\r\n\r\n");
    failures += check(reply.rfind(k_established, 0) == 0, "proxy answers 200 Connection Established");

    failures += check(fhosts::test::send_all(client, "bytes"), "send tunnel payload");
    std::string echoed = reply.substr(std::min(reply.size(), k_established.size()));
    echoed += fhosts::test::recv_until(client, [&](const std::string& s) { return echoed.size() + s.size() >= 11; });
    failures += check(echoed == "early-bytes", "tunnel relays bytes in both directions");

    // 客户端半关闭后隧道整体结束
    ::shutdown(client, SHUT_WR);
    auto tail = fhosts::test::recv_until_close(client, std::chrono::seconds(3));
    failures += check(tail.empty(), "tunnel closes after both sides finish");
    ::close(client);

    failures += check(sink.wait_for("log"), "substitution is reported as a log event");
    LogEvent log;
    failures += check(sink.last(log)
                          && log.message == "Tunneling " + authority + " -> 127.0.0.1:" + std::to_string(echo.port()),
                      "log event names the authority and the substituted address");
    failures += check(echo.accepted() == 1, "upstream saw exactly one connection");

    engine.stop();
    return failures;
}

int test_connect_unmapped_host_is_not_reported()
{
    int                          failures = 0;
    fhosts::test::LoopbackServer echo(fhosts::test::echo_handler);
    RecordingSink                sink;
    ProxyEngine                  engine(test_config(), sink);
    engine.start({ { "other.test", "10.255.255.1" } });

    int client = fhosts::test::connect_loopback(engine.port());
    if (client < 0)
        return check(false, "connect to proxy");
    std::string authority = "127.0.0.1:" + std::to_string(echo.port());
    failures += check(fhosts::test::send_all(client, "CONNECT " + authority + " HTTP/1.1\r\n\r\n"), "send CONNECT");
    auto reply = fhosts::test::recv_until_contains(client, "\r\n\r\n");
    failures += check(reply.rfind(k_established, 0) == 0, "unmapped host is tunnelled directly");
    ::close(client);

    engine.stop();
    failures += check(sink.count("log") == 0, "no log event without substitution");
    return failures;
}

int test_connect_failure_returns_502()
{
    int           failures = 0;
    RecordingSink sink;
    ProxyEngine   engine(test_config(), sink);
    engine.start({ { "down.test", "127.0.0.1" } });

    uint16_t dead_port = fhosts::test::unused_loopback_port();
    int      client    = fhosts::test::connect_loopback(engine.port());
    if (client < 0)
        return check(false, "connect to proxy");
    std::string authority = "down.test:" + std::to_string(dead_port);
    failures += check(fhosts::test::send_all(client, "CONNECT " + authority + " HTTP/1.1\r\n\r\n"), "send CONNECT");
    auto reply = fhosts::test::recv_until_close(client);
    failures += check(reply.rfind("HTTP/1.1 502 Bad Gateway\r\n", 0) == 0, "unreachable upstream yields 502");
    ::close(client);

    failures += check(sink.wait_for("error"), "connect failure is reported");
    ErrorEvent error;
    std::string expected_prefix = "Failed to connect to 127.0.0.1:" + std::to_string(dead_port) + ": ";
    failures += check(sink.last(error) && error.message.rfind(expected_prefix, 0) == 0,
                      "error names the substituted address");
    engine.stop();
    return failures;
}

int test_stop_aborts_open_tunnel()
{
    int failures = 0;
    // 上游不主动关闭：只读不写，直到对端断开
    fhosts::test::LoopbackServer silent([](int fd) {
        char buf[256];
        while (::recv(fd, buf, sizeof(buf), 0) > 0) { }
    });
    RecordingSink sink;
    ProxyEngine   engine(test_config(), sink);
    engine.start({ { "idle.test", "127.0.0.1" } });

    int client = fhosts::test::connect_loopback(engine.port());
    if (client < 0)
        return check(false, "connect to proxy");
    std::string authority = "idle.test:" + std::to_string(silent.port());
    failures += check(fhosts::test::send_all(client, "CONNECT " + authority + " HTTP/1.1\r\n\r\n"), "send CONNECT");
    auto reply = fhosts::test::recv_until_contains(client, "\r\n\r\n");
    failures += check(reply.rfind(k_established, 0) == 0, "tunnel established");

    engine.stop();
    failures += check(engine.sessions().active() == 0, "stop drains the open tunnel");
    auto tail = fhosts::test::recv_until_close(client, std::chrono::seconds(2));
    failures += check(tail.empty(), "client sees the tunnel closed");
    ::close(client);
    return failures;
}

int test_update_keeps_established_tunnel()
{
    int                          failures = 0;
    fhosts::test::LoopbackServer echo(fhosts::test::echo_handler);
    RecordingSink                sink;
    ProxyEngine                  engine(test_config(), sink);
    engine.start({ { "moving.test", "127.0.0.1" } });

    int client = fhosts::test::connect_loopback(engine.port());
    if (client < 0)
        return check(false, "connect to proxy");
    std::string authority = "moving.test:" + std::to_string(echo.port());
    failures += check(fhosts::test::send_all(client, "CONNECT " + authority + " HTTP/1.1\r\n\r\n"), "send CONNECT");
    auto reply = fhosts::test::recv_until_contains(client, "\r\n\r\n");
    failures += check(reply.rfind(k_established, 0) == 0, "tunnel established");

    // 已建立的隧道不随映射更新而改道
    engine.update_mappings({ { "moving.test", "192.0.2.1" } });
    failures += check(fhosts::test::send_all(client, "still-here"), "send after update");
    auto echoed = fhosts::test::recv_until_contains(client, "still-here");
    failures += check(echoed == "still-here", "established tunnel keeps its upstream after an update");
    ::shutdown(client, SHUT_WR);
    (void)fhosts::test::recv_until_close(client, std::chrono::seconds(3));
    ::close(client);
    engine.stop();
    return failures;
}

int test_malformed_request()
{
    int           failures = 0;
    RecordingSink sink;
    ProxyEngine   engine(test_config(), sink);
    engine.start({});

    int client = fhosts::test::connect_loopback(engine.port());
    if (client < 0)
        return check(false, "connect to proxy");
    failures += check(fhosts::test::send_all(client, "NOT A REQUEST\r\n\r\n"), "send garbage");
    auto reply = fhosts::test::recv_until_close(client);
    failures += check(reply.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0, "malformed request yields 400");
    ::close(client);
    engine.stop();
    return failures;
}

} // namespace

int main()
{
    std::signal(SIGPIPE, SIG_IGN);
    int failures = 0;
    failures += test_connect_tunnel_to_mapped_host();
    failures += test_connect_unmapped_host_is_not_reported();
    failures += test_connect_failure_returns_502();
    failures += test_stop_aborts_open_tunnel();
    failures += test_update_keeps_established_tunnel();
    failures += test_malformed_request();
    return fhosts::test::finish("tunnel_test", failures);
}
