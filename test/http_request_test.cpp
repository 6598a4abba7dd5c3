#include "http1_request.hpp"
#include "http_common.hpp"
#include "http_forwarder.hpp"
#include "test_support.hpp"

#include <string>

using namespace fhosts;
using namespace fhosts::net::http;
using fhosts::test::check;

namespace {

int test_split_host_port()
{
    int         failures = 0;
    std::string host;
    uint16_t    port = 0;

    failures += check(split_host_port("example.com:8443", 443, host, port) && host == "example.com" && port == 8443,
                      "host:port splits");
    failures += check(split_host_port("example.com", 443, host, port) && host == "example.com" && port == 443,
                      "missing port uses default");
    failures += check(split_host_port("[::1]:9000", 443, host, port) && host == "::1" && port == 9000,
                      "bracketed IPv6 splits");
    failures += check(split_host_port("[2001:db8::1]", 80, host, port) && host == "2001:db8::1" && port == 80,
                      "bracketed IPv6 without port");
    failures += check(!split_host_port("example.com:99999", 443, host, port), "port overflow rejected");
    failures += check(!split_host_port(":443", 443, host, port), "empty host rejected");
    failures += check(!split_host_port("", 443, host, port), "empty authority rejected");

    failures += check(join_host_port("10.0.0.1", 443) == "10.0.0.1:443", "join IPv4");
    failures += check(join_host_port("::1", 8080) == "[::1]:8080", "join IPv6 adds brackets");
    return failures;
}

int test_parse_url()
{
    int  failures = 0;
    auto url      = parse_url("http://example.com/a/b?x=1#frag");
    failures += check(url.has_value(), "absolute http URL parses");
    if (url) {
        failures += check(url->host == "example.com" && url->port == 80, "default port 80");
        failures += check(url->path == "/a/b?x=1", "path keeps query and drops fragment");
    }

    auto with_port = parse_url("http://user:pw@api.test:8080");
    failures += check(with_port && with_port->host == "api.test" && with_port->port == 8080 && with_port->path == "/",
                      "userinfo stripped, explicit port, empty path becomes /");

    auto query_only = parse_url("http://a.test?q=1");
    failures += check(query_only && query_only->path == "/?q=1", "query without path gains leading slash");

    auto v6 = parse_url("http://[::1]:81/x");
    failures += check(v6 && v6->host == "::1" && v6->port == 81, "IPv6 host parses");

    failures += check(!parse_url("/relative/path"), "origin-form is not an absolute URL");
    failures += check(!parse_url("https://example.com/"), "https absolute URL is not proxied as HTTP");
    return failures;
}

int test_request_parser()
{
    int                failures = 0;
    Http1RequestParser parser;

    // 分段喂入
    std::string request = "POST http://example.com/upload HTTP/1.1\r\n"
                          "Host: example.com\r\n"
                          "X-Trace: abc\r\n"
                          "Content-Length: 5\r\n\r\n"
                          "hello";
    failures += check(parser.feed(request.substr(0, 20)), "first fragment parses");
    failures += check(!parser.is_headers_complete(), "headers incomplete after first fragment");
    failures += check(parser.feed(request.substr(20)), "remaining bytes parse");
    failures += check(parser.is_headers_complete() && parser.is_message_complete(), "message completes");
    failures += check(parser.request().method == "POST", "method captured");
    failures += check(parser.request().target == "http://example.com/upload", "target captured");
    failures += check(parser.request().headers.size() == 3, "headers captured in order");
    failures += check(parser.request().headers[1].name == "X-Trace", "header name case preserved");
    failures += check(parser.take_body() == "hello", "body captured");
    failures += check(parser.take_body().empty(), "take_body drains");

    parser.reset();
    failures += check(parser.feed("CONNECT a.test:443 HTTP/1.1\r\nHost: a.test:443\r\n\r\n\x16\x03\x01"),
                      "CONNECT parses");
    failures += check(parser.is_upgraded(), "CONNECT switches to upgraded state");
    failures += check(parser.request().target == "a.test:443", "CONNECT authority captured");
    failures += check(parser.take_upgrade_leftover() == "\x16\x03\x01", "tunnel bytes after headers are kept");

    parser.reset();
    failures += check(parser.feed("POST http://a.test/ HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"
                                  "3\r\nabc\r\n0\r\n\r\n"),
                      "chunked request parses");
    failures += check(parser.request().chunked, "chunked flag set");
    failures += check(parser.take_body() == "abc", "chunked body decoded");
    failures += check(parser.is_message_complete(), "chunked message completes");

    parser.reset();
    std::string reason;
    failures += check(!parser.feed("GARBAGE\r\n\r\n", &reason), "invalid request rejected");
    failures += check(parser.has_error() && !reason.empty(), "parse error reported");
    return failures;
}

int test_upstream_head()
{
    int             failures = 0;
    HttpRequestHead head;
    head.method  = "GET";
    head.target  = "http://example.com:8080/p?q=1";
    head.headers = { { "Host", "example.com:8080" },
                     { "Proxy-Connection", "keep-alive" },
                     { "Connection", "keep-alive" },
                     { "Accept", "*/*" },
                     { "host", "duplicate" } };
    auto url     = parse_url(head.target);
    if (!url)
        return check(false, "parse_url for upstream head");

    auto built = build_upstream_head(head, *url);
    failures += check(built.rfind("GET /p?q=1 HTTP/1.1\r\n", 0) == 0, "origin-form request line");
    failures += check(built.find("Host: example.com:8080\r\n") != std::string::npos, "Host keeps original name and port");
    failures += check(built.find("duplicate") == std::string::npos, "only one Host header is forwarded");
    failures += check(built.find("Proxy-Connection") == std::string::npos, "Proxy-Connection dropped");
    failures += check(built.find("keep-alive") == std::string::npos, "client Connection header dropped");
    failures += check(built.find("Accept: */*\r\n") != std::string::npos, "other headers kept");
    failures += check(built.find("Connection: close\r\n\r\n") != std::string::npos, "Connection: close appended");

    HttpRequestHead bare;
    bare.method = "GET";
    bare.target = "http://[::1]/";
    auto v6     = parse_url(bare.target);
    failures += check(v6 && build_upstream_head(bare, *v6).find("Host: [::1]\r\n") != std::string::npos,
                      "missing Host is synthesised with brackets");
    return failures;
}

int test_build_response()
{
    auto resp     = build_http_response(502, "Bad Gateway", "Bad Gateway\n");
    int  failures = 0;
    failures += check(resp.rfind("HTTP/1.1 502 Bad Gateway\r\n", 0) == 0, "status line");
    failures += check(resp.find("Content-Length: 12\r\n") != std::string::npos, "content length");
    failures += check(resp.find("Connection: close\r\n") != std::string::npos, "connection close");
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_split_host_port();
    failures += test_parse_url();
    failures += test_request_parser();
    failures += test_upstream_head();
    failures += test_build_response();
    return fhosts::test::finish("http_request_test", failures);
}
