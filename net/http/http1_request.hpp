#pragma once

#include <llhttp.h>

#include <string>
#include <string_view>
#include <vector>

namespace fhosts::net::http {

struct HeaderEntry {
    std::string name;
    std::string value;
};

/**
 * @brief 代理收到的请求头部，header 保持原始顺序与大小写。
 */
struct HttpRequestHead {
    std::string              method;
    std::string              target;
    std::vector<HeaderEntry> headers;
    int                      http_major { 1 };
    int                      http_minor { 1 };
    bool                     chunked { false };
};

/**
 * @brief 增量式 HTTP/1 请求解析器（llhttp）。
 *
 * 只解析一个请求：消息结束后暂停，后续字节不再解析。
 * 请求体以解码后的片段累积，调用方通过 take_body 取走后转发，无需缓存整个 body。
 * CONNECT 请求头部结束后进入 upgraded 状态，头部之后的剩余字节由 upgrade_leftover 给出。
 */
class Http1RequestParser {
public:
    Http1RequestParser();
    Http1RequestParser(const Http1RequestParser&)            = delete;
    Http1RequestParser& operator=(const Http1RequestParser&) = delete;

    void reset();
    bool feed(std::string_view data, std::string* error_reason = nullptr);
    bool finish(std::string* error_reason = nullptr);

    bool                   is_headers_complete() const { return headers_complete_; }
    bool                   is_message_complete() const { return message_complete_; }
    bool                   is_upgraded() const { return upgraded_; }
    const HttpRequestHead& request() const { return request_; }
    bool                   has_error() const { return has_error_; }
    const std::string&     last_error() const { return error_reason_; }

    /** @brief 取走目前已解码的请求体片段。 */
    std::string take_body();
    /** @brief CONNECT 头部之后客户端已发送的隧道数据。 */
    std::string take_upgrade_leftover();

private:
    static int on_message_begin(llhttp_t* parser);
    static int on_method(llhttp_t* parser, const char* at, size_t length);
    static int on_url(llhttp_t* parser, const char* at, size_t length);
    static int on_header_field(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value(llhttp_t* parser, const char* at, size_t length);
    static int on_header_value_complete(llhttp_t* parser);
    static int on_headers_complete(llhttp_t* parser);
    static int on_body(llhttp_t* parser, const char* at, size_t length);
    static int on_message_complete(llhttp_t* parser);

    void store_header();
    void clear_state();
    bool fail(llhttp_errno_t err, std::string* error_reason);

    llhttp_t          parser_ {};
    llhttp_settings_t settings_ {};
    HttpRequestHead   request_ {};
    std::string       current_field_;
    std::string       current_value_;
    std::string       body_;
    std::string       leftover_;
    bool              headers_complete_ { false };
    bool              message_complete_ { false };
    bool              upgraded_ { false };
    bool              has_error_ { false };
    std::string       error_reason_;
};

} // namespace fhosts::net::http
