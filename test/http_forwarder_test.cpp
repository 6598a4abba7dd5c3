#include "proxy_engine.hpp"
#include "test_support.hpp"

#include <csignal>
#include <unistd.h>

#include <mutex>
#include <string>
#include <thread>

using namespace fhosts;
using fhosts::test::check;
using fhosts::test::RecordingSink;

namespace {

ProxyConfig test_config()
{
    ProxyConfig config;
    config.port               = 0;
    config.connect_timeout    = std::chrono::milliseconds(2000);
    config.drain_log_interval = std::chrono::milliseconds(200);
    return config;
}

/**
 * @brief 记录收到的原始请求，读到 terminator 后回一个固定响应并关闭。
 */
struct RecordingUpstream {
    std::mutex  mutex;
    std::string received;
    std::string terminator;

    fhosts::test::LoopbackServer::Handler handler()
    {
        return [this](int fd) {
            auto request = fhosts::test::recv_until(fd, [this](const std::string& s) {
                return s.find(terminator) != std::string::npos;
            });
            {
                std::lock_guard<std::mutex> lock(mutex);
                received = request;
            }
            fhosts::test::send_all(fd, "HTTP/1.1 200 OK\r\nContent-Length: 8\r\nX-Upstream: yes\r\n\r\nupstream");
        };
    }

    std::string snapshot()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return received;
    }
};

int test_forward_with_substitution()
{
    int               failures = 0;
    RecordingUpstream upstream;
    upstream.terminator = "\r\n\r\nbody";
    fhosts::test::LoopbackServer server(upstream.handler());

    RecordingSink sink;
    ProxyEngine   engine(test_config(), sink);
    engine.start({ { "site.test", "127.0.0.1" } });

    int client = fhosts::test::connect_loopback(engine.port());
    if (client < 0)
        return check(false, "connect to proxy");

    std::string authority = "site.test:" + std::to_string(server.port());
    std::string request   = "POST http://" + authority + "/path?q=1 HTTP/1.1\r\n"
                          "Host: " + authority + "\r\n"
                          "Proxy-Connection: keep-alive\r\n"
                          "X-Client: 1\r\n"
                          "Content-Length: 4\r\n\r\n"
                          "body";
    failures += check(fhosts::test::send_all(client, request), "send request");
    auto response = fhosts::test::recv_until_close(client);
    ::close(client);

    failures += check(response.rfind("HTTP/1.1 200 OK\r\n", 0) == 0, "upstream status relayed");
    failures += check(response.find("X-Upstream: yes\r\n") != std::string::npos, "upstream headers relayed");
    failures += check(response.size() >= 8 && response.compare(response.size() - 8, 8, "upstream") == 0,
                      "upstream body relayed");

    auto seen = upstream.snapshot();
    failures += check(seen.rfind("POST /path?q=1 HTTP/1.1\r\n", 0) == 0, "upstream receives origin-form request");
    failures += check(seen.find("Host: " + authority + "\r\n") != std::string::npos,
                      "Host header keeps the original hostname");
    failures += check(seen.find("Proxy-Connection") == std::string::npos, "Proxy-Connection is stripped");
    failures += check(seen.find("X-Client: 1\r\n") != std::string::npos, "end-to-end headers forwarded");
    failures += check(seen.find("Connection: close\r\n") != std::string::npos, "upstream connection is closed after use");
    failures += check(seen.size() >= 4 && seen.compare(seen.size() - 4, 4, "body") == 0, "request body forwarded");

    failures += check(sink.wait_for("log"), "substitution reported");
    LogEvent log;
    failures += check(sink.last(log) && log.message == "Proxying HTTP site.test -> 127.0.0.1", "log event text");
    engine.stop();
    return failures;
}

int test_streamed_chunked_body()
{
    int               failures = 0;
    RecordingUpstream upstream;
    upstream.terminator = "0\r\n\r\n";
    fhosts::test::LoopbackServer server(upstream.handler());

    RecordingSink sink;
    ProxyEngine   engine(test_config(), sink);
    engine.start({ { "chunk.test", "127.0.0.1" } });

    int client = fhosts::test::connect_loopback(engine.port());
    if (client < 0)
        return check(false, "connect to proxy");

    std::string authority = "chunk.test:" + std::to_string(server.port());
    failures += check(fhosts::test::send_all(client,
                                             "PUT http://" + authority + "/up HTTP/1.1\r\n"
                                                 "Host: " + authority + "\r\n"
                                                 "Transfer-Encoding: chunked\r\n\r\n"
                                                 "5\r\nhello\r\n"),
                      "send head and first chunk");
    // 第二块延迟发送：请求体应边收边转发
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    failures += check(fhosts::test::send_all(client, "6\r\n world\r\n0\r\n\r\n"), "send remaining chunks");

    auto response = fhosts::test::recv_until_close(client);
    ::close(client);
    failures += check(response.rfind("HTTP/1.1 200 OK\r\n", 0) == 0, "chunked request answered");

    auto seen = upstream.snapshot();
    failures += check(seen.find("Transfer-Encoding: chunked\r\n") != std::string::npos, "chunked framing kept");
    failures += check(seen.find("5\r\nhello\r\n") != std::string::npos, "first chunk forwarded");
    failures += check(seen.find("6\r\n world\r\n") != std::string::npos, "second chunk forwarded");
    failures += check(seen.size() >= 5 && seen.compare(seen.size() - 5, 5, "0\r\n\r\n") == 0, "terminating chunk sent");
    engine.stop();
    return failures;
}

int test_origin_form_rejected()
{
    int           failures = 0;
    RecordingSink sink;
    ProxyEngine   engine(test_config(), sink);
    engine.start({});

    int client = fhosts::test::connect_loopback(engine.port());
    if (client < 0)
        return check(false, "connect to proxy");
    failures += check(fhosts::test::send_all(client, "GET /index.html HTTP/1.1\r\nHost: a.test\r\n\r\n"), "send request");
    auto response = fhosts::test::recv_until_close(client);
    ::close(client);
    failures += check(response.rfind("HTTP/1.1 400 Bad Request\r\n", 0) == 0, "origin-form request yields 400");
    engine.stop();
    return failures;
}

int test_unreachable_upstream()
{
    int           failures = 0;
    RecordingSink sink;
    ProxyEngine   engine(test_config(), sink);
    uint16_t      dead_port = fhosts::test::unused_loopback_port();
    engine.start({ { "gone.test", "127.0.0.1" } });

    int client = fhosts::test::connect_loopback(engine.port());
    if (client < 0)
        return check(false, "connect to proxy");
    std::string authority = "gone.test:" + std::to_string(dead_port);
    failures += check(fhosts::test::send_all(client,
                                             "GET http://" + authority + "/ HTTP/1.1\r\nHost: " + authority + "\r\n\r\n"),
                      "send request");
    auto response = fhosts::test::recv_until_close(client);
    ::close(client);
    failures += check(response.rfind("HTTP/1.1 502 Bad Gateway\r\n", 0) == 0, "dial failure yields 502");

    failures += check(sink.wait_for("error"), "dial failure reported");
    ErrorEvent error;
    failures += check(sink.last(error) && error.message.rfind("HTTP proxy error: ", 0) == 0, "error message prefix");
    engine.stop();
    return failures;
}

int test_mapping_update_applies_to_new_requests()
{
    int               failures = 0;
    RecordingUpstream upstream;
    upstream.terminator = "\r\n\r\n";
    fhosts::test::LoopbackServer server(upstream.handler());

    RecordingSink sink;
    ProxyEngine   engine(test_config(), sink);
    engine.start({ { "late.test", "127.0.0.2" } });
    // 在请求之前改写映射，新请求使用新表
    engine.update_mappings({ { "late.test", "127.0.0.1" } });

    int client = fhosts::test::connect_loopback(engine.port());
    if (client < 0)
        return check(false, "connect to proxy");
    std::string authority = "late.test:" + std::to_string(server.port());
    failures += check(fhosts::test::send_all(client,
                                             "GET http://" + authority + "/ HTTP/1.1\r\nHost: " + authority + "\r\n\r\n"),
                      "send request");
    auto response = fhosts::test::recv_until_close(client);
    ::close(client);
    failures += check(response.rfind("HTTP/1.1 200 OK\r\n", 0) == 0, "request routed through the updated mapping");
    failures += check(server.accepted() == 1, "upstream reached at the new address");
    engine.stop();
    return failures;
}

int test_upstream_closes_without_response()
{
    int                          failures = 0;
    fhosts::test::LoopbackServer server([](int fd) {
        // 读完请求头后直接关闭，不给任何响应
        (void)fhosts::test::recv_until(fd, [](const std::string& s) { return s.find("\r\n\r\n") != std::string::npos; });
    });

    RecordingSink sink;
    ProxyEngine   engine(test_config(), sink);
    engine.start({ { "silent.test", "127.0.0.1" } });

    int client = fhosts::test::connect_loopback(engine.port());
    if (client < 0)
        return check(false, "connect to proxy");
    std::string authority = "silent.test:" + std::to_string(server.port());
    failures += check(fhosts::test::send_all(client,
                                             "GET http://" + authority + "/ HTTP/1.1\r\nHost: " + authority + "\r\n\r\n"),
                      "send request");
    auto response = fhosts::test::recv_until_close(client);
    ::close(client);
    failures += check(response.rfind("HTTP/1.1 502 Bad Gateway\r\n", 0) == 0, "empty upstream reply yields 502");
    failures += check(server.accepted() == 1, "upstream was dialed");

    failures += check(sink.wait_for("error"), "missing response reported");
    ErrorEvent error;
    failures += check(sink.last(error) && error.message.rfind("HTTP proxy error: ", 0) == 0, "error message prefix");
    failures += check(sink.count("error") == 1, "reported once");
    engine.stop();
    return failures;
}

int test_oversized_request_head()
{
    int           failures = 0;
    RecordingSink sink;
    ProxyConfig   config = test_config();
    config.max_request_head_bytes = 1024;
    ProxyEngine engine(config, sink);
    engine.start({});

    int client = fhosts::test::connect_loopback(engine.port());
    if (client < 0)
        return check(false, "connect to proxy");
    // 头部永不结束，总长度刚好超过上限一个字节
    std::string head = "GET http://big.test/ HTTP/1.1\r\nX-Fill: ";
    head.append(config.max_request_head_bytes + 1 - head.size(), 'a');
    failures += check(fhosts::test::send_all(client, head), "send oversized head");
    auto response = fhosts::test::recv_until_close(client);
    ::close(client);
    failures += check(response.rfind("HTTP/1.1 431 ", 0) == 0, "oversized head yields 431");
    failures += check(sink.count("error") == 0, "no error event for rejected head");
    engine.stop();
    return failures;
}

} // namespace

int main()
{
    std::signal(SIGPIPE, SIG_IGN);
    int failures = 0;
    failures += test_forward_with_substitution();
    failures += test_streamed_chunked_body();
    failures += test_origin_form_rejected();
    failures += test_unreachable_upstream();
    failures += test_mapping_update_applies_to_new_requests();
    failures += test_upstream_closes_without_response();
    failures += test_oversized_request_head();
    return fhosts::test::finish("http_forwarder_test", failures);
}
