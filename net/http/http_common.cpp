#include "http_common.hpp"

#include <cctype>
#include <cstdint>
#include <limits>

namespace {

bool parse_port(std::string_view input, uint16_t& port_out)
{
    if (input.empty() || input.size() > 5)
        return false;

    uint32_t value = 0;
    for (unsigned char ch : input) {
        if (!std::isdigit(ch))
            return false;
        value = value * 10 + static_cast<uint32_t>(ch - '0');
        if (value > std::numeric_limits<uint16_t>::max())
            return false;
    }

    port_out = static_cast<uint16_t>(value);
    return true;
}

} // namespace

namespace fhosts::net::http {

std::string to_lower(std::string_view input)
{
    std::string out;
    out.reserve(input.size());
    for (char ch : input) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return out;
}

bool iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (size_t i = 0; i < a.size(); ++i) {
        unsigned char ca = static_cast<unsigned char>(a[i]);
        unsigned char cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb))
            return false;
    }
    return true;
}

bool split_host_port(std::string_view input, uint16_t default_port, std::string& host_out, uint16_t& port_out)
{
    host_out.clear();
    port_out = default_port;

    if (input.empty())
        return false;

    if (input.front() == '[') {
        auto closing = input.find(']');
        if (closing == std::string_view::npos || closing == 1)
            return false;
        host_out.assign(input.substr(1, closing - 1));
        if (closing + 1 == input.size())
            return true;
        if (input[closing + 1] != ':')
            return false;
        uint16_t port = 0;
        if (!parse_port(input.substr(closing + 2), port))
            return false;
        port_out = port;
        return true;
    }

    auto first_colon = input.find(':');
    auto last_colon  = input.rfind(':');
    if (first_colon != std::string_view::npos && first_colon == last_colon) {
        std::string_view host_part = input.substr(0, first_colon);
        if (host_part.empty())
            return false;
        uint16_t port = 0;
        if (!parse_port(input.substr(first_colon + 1), port))
            return false;
        host_out.assign(host_part);
        port_out = port;
        return true;
    }

    // 无方括号的 IPv6 字面量整体视为 host
    host_out.assign(input);
    return true;
}

std::string join_host_port(std::string_view host, uint16_t port)
{
    std::string out;
    out.reserve(host.size() + 8);
    if (host.find(':') != std::string_view::npos) {
        out.push_back('[');
        out.append(host);
        out.push_back(']');
    } else {
        out.append(host);
    }
    out.push_back(':');
    out.append(std::to_string(port));
    return out;
}

std::optional<UrlParts> parse_url(const std::string& url)
{
    auto scheme_pos = url.find("://");
    if (scheme_pos == std::string::npos)
        return std::nullopt;

    UrlParts result;
    result.scheme = to_lower(url.substr(0, scheme_pos));
    if (result.scheme != "http")
        return std::nullopt;

    size_t authority_start = scheme_pos + 3;
    if (authority_start >= url.size())
        return std::nullopt;

    auto        path_pos  = url.find_first_of("/?#", authority_start);
    std::string authority = path_pos == std::string::npos ? url.substr(authority_start)
                                                          : url.substr(authority_start, path_pos - authority_start);
    if (path_pos == std::string::npos) {
        result.path = "/";
    } else if (url[path_pos] == '/') {
        result.path = url.substr(path_pos);
    } else {
        result.path = "/" + url.substr(path_pos);
    }
    // fragment 不发送给上游
    if (auto hash = result.path.find('#'); hash != std::string::npos)
        result.path.erase(hash);

    // userinfo 不参与路由
    if (auto at = authority.rfind('@'); at != std::string::npos)
        authority.erase(0, at + 1);
    if (authority.empty())
        return std::nullopt;

    if (!split_host_port(authority, 80, result.host, result.port))
        return std::nullopt;
    if (result.host.empty())
        return std::nullopt;

    return result;
}

std::string build_http_response(int status_code, std::string_view reason, std::string_view body)
{
    std::string response;
    response.reserve(128 + body.size());
    response.append("HTTP/1.1 ");
    response.append(std::to_string(status_code));
    response.push_back(' ');
    response.append(reason);
    response.append("\r\n");
    response.append("Content-Type: text/plain; charset=utf-8\r\n");
    response.append("Content-Length: ");
    response.append(std::to_string(body.size()));
    response.append("\r\nConnection: close\r\n\r\n");
    response.append(body);
    return response;
}

} // namespace fhosts::net::http
