#include "http1_request.hpp"

#include <utility>

namespace fhosts::net::http {

Http1RequestParser::Http1RequestParser()
{
    llhttp_settings_init(&settings_);
    settings_.on_message_begin         = &Http1RequestParser::on_message_begin;
    settings_.on_method                = &Http1RequestParser::on_method;
    settings_.on_url                   = &Http1RequestParser::on_url;
    settings_.on_header_field          = &Http1RequestParser::on_header_field;
    settings_.on_header_value          = &Http1RequestParser::on_header_value;
    settings_.on_header_value_complete = &Http1RequestParser::on_header_value_complete;
    settings_.on_headers_complete      = &Http1RequestParser::on_headers_complete;
    settings_.on_body                  = &Http1RequestParser::on_body;
    settings_.on_message_complete      = &Http1RequestParser::on_message_complete;
    llhttp_init(&parser_, HTTP_REQUEST, &settings_);
    parser_.data = this;
    clear_state();
}

void Http1RequestParser::reset()
{
    llhttp_reset(&parser_);
    clear_state();
    has_error_ = false;
    error_reason_.clear();
}

void Http1RequestParser::clear_state()
{
    request_ = HttpRequestHead {};
    current_field_.clear();
    current_value_.clear();
    body_.clear();
    leftover_.clear();
    headers_complete_ = false;
    message_complete_ = false;
    upgraded_         = false;
}

bool Http1RequestParser::fail(llhttp_errno_t err, std::string* error_reason)
{
    has_error_    = true;
    const char* r = llhttp_get_error_reason(&parser_);
    error_reason_ = (r && *r) ? r : llhttp_errno_name(err);
    if (error_reason)
        *error_reason = error_reason_;
    return false;
}

bool Http1RequestParser::feed(std::string_view data, std::string* error_reason)
{
    if (has_error_)
        return false;
    // 单请求语义：完成后多余的字节忽略
    if (message_complete_ || upgraded_)
        return true;

    auto err = llhttp_execute(&parser_, data.data(), data.size());
    switch (err) {
    case HPE_OK:
        return true;
    case HPE_PAUSED:
        return true;
    case HPE_PAUSED_UPGRADE: {
        upgraded_       = true;
        const char* pos = llhttp_get_error_pos(&parser_);
        if (pos && pos >= data.data() && pos <= data.data() + data.size())
            leftover_.assign(pos, static_cast<size_t>(data.data() + data.size() - pos));
        llhttp_resume_after_upgrade(&parser_);
        return true;
    }
    default:
        return fail(err, error_reason);
    }
}

bool Http1RequestParser::finish(std::string* error_reason)
{
    if (has_error_)
        return false;
    if (message_complete_ || upgraded_)
        return true;

    auto err = llhttp_finish(&parser_);
    if (err != HPE_OK)
        return fail(err, error_reason);
    return true;
}

std::string Http1RequestParser::take_body()
{
    return std::exchange(body_, std::string {});
}

std::string Http1RequestParser::take_upgrade_leftover()
{
    return std::exchange(leftover_, std::string {});
}

int Http1RequestParser::on_message_begin(llhttp_t* parser)
{
    auto* self = static_cast<Http1RequestParser*>(parser->data);
    self->clear_state();
    return 0;
}

int Http1RequestParser::on_method(llhttp_t* parser, const char* at, size_t length)
{
    auto* self = static_cast<Http1RequestParser*>(parser->data);
    self->request_.method.append(at, length);
    return 0;
}

int Http1RequestParser::on_url(llhttp_t* parser, const char* at, size_t length)
{
    auto* self = static_cast<Http1RequestParser*>(parser->data);
    self->request_.target.append(at, length);
    return 0;
}

int Http1RequestParser::on_header_field(llhttp_t* parser, const char* at, size_t length)
{
    auto* self = static_cast<Http1RequestParser*>(parser->data);
    if (!self->current_value_.empty())
        self->store_header();
    self->current_field_.append(at, length);
    return 0;
}

int Http1RequestParser::on_header_value(llhttp_t* parser, const char* at, size_t length)
{
    auto* self = static_cast<Http1RequestParser*>(parser->data);
    self->current_value_.append(at, length);
    return 0;
}

int Http1RequestParser::on_header_value_complete(llhttp_t* parser)
{
    auto* self = static_cast<Http1RequestParser*>(parser->data);
    self->store_header();
    return 0;
}

int Http1RequestParser::on_headers_complete(llhttp_t* parser)
{
    auto* self                = static_cast<Http1RequestParser*>(parser->data);
    self->headers_complete_   = true;
    self->request_.http_major = parser->http_major;
    self->request_.http_minor = parser->http_minor;
    self->request_.chunked    = (parser->flags & F_CHUNKED) != 0;
    return 0;
}

int Http1RequestParser::on_body(llhttp_t* parser, const char* at, size_t length)
{
    auto* self = static_cast<Http1RequestParser*>(parser->data);
    self->body_.append(at, length);
    return 0;
}

int Http1RequestParser::on_message_complete(llhttp_t* parser)
{
    auto* self              = static_cast<Http1RequestParser*>(parser->data);
    self->message_complete_ = true;
    // CONNECT 由 llhttp 以 HPE_PAUSED_UPGRADE 交还，其余请求在此暂停
    return parser->upgrade ? 0 : HPE_PAUSED;
}

void Http1RequestParser::store_header()
{
    if (current_field_.empty())
        return;
    request_.headers.push_back(HeaderEntry { std::move(current_field_), std::move(current_value_) });
    current_field_.clear();
    current_value_.clear();
}

} // namespace fhosts::net::http
