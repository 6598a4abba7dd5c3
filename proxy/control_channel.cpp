#include "control_channel.hpp"

#include "log.hpp"

#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace fhosts {

ControlChannel::ControlChannel(int in_fd, int out_fd, size_t max_message_bytes)
    : _in_fd(in_fd), _out_fd(out_fd), _max_message_bytes(max_message_bytes)
{
}

ControlChannel::IoStatus ControlChannel::read_exact(void* buf, size_t len)
{
    auto*  p   = static_cast<char*>(buf);
    size_t got = 0;
    while (got < len) {
        ssize_t n = ::read(_in_fd, p + got, len - got);
        if (n > 0) {
            got += static_cast<size_t>(n);
            continue;
        }
        if (n == 0)
            return IoStatus::Eof;
        if (errno == EINTR)
            continue;
        FHOSTS_LOG_WARN("[control] read failed: %s", std::strerror(errno));
        return IoStatus::Error;
    }
    return IoStatus::Ok;
}

ControlChannel::IoStatus ControlChannel::discard(size_t len)
{
    char buf[8192];
    while (len > 0) {
        size_t chunk = len < sizeof(buf) ? len : sizeof(buf);
        auto   st    = read_exact(buf, chunk);
        if (st != IoStatus::Ok)
            return st;
        len -= chunk;
    }
    return IoStatus::Ok;
}

ControlChannel::ReadResult ControlChannel::read_message()
{
    ReadResult    result;
    unsigned char prefix[4];
    auto          st = read_exact(prefix, sizeof(prefix));
    if (st != IoStatus::Ok) {
        result.status = ReadStatus::Closed;
        result.error  = st == IoStatus::Eof ? "EOF" : "read error";
        return result;
    }

    uint32_t length = decode_frame_length(prefix);
    if (length > _max_message_bytes) {
        // 丢弃超长帧的 body，保持帧边界同步
        if (discard(length) != IoStatus::Ok) {
            result.status = ReadStatus::Closed;
            result.error  = "unexpected EOF";
            return result;
        }
        result.status = ReadStatus::DecodeError;
        result.error  = "message of " + std::to_string(length) + " bytes exceeds limit of "
            + std::to_string(_max_message_bytes);
        return result;
    }

    std::string body(length, '\0');
    if (length > 0 && read_exact(body.data(), length) != IoStatus::Ok) {
        result.status = ReadStatus::Closed;
        result.error  = "unexpected EOF";
        return result;
    }

    auto decoded = decode_command(body);
    if (!decoded) {
        result.status = ReadStatus::DecodeError;
        result.error  = std::move(decoded.error);
        return result;
    }
    result.status  = ReadStatus::Message;
    result.command = std::move(decoded.command);
    return result;
}

bool ControlChannel::write_all(const char* data, size_t len)
{
    size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::write(_out_fd, data + sent, len - sent);
        if (n > 0) {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        FHOSTS_LOG_ERROR("[control] write failed: %s", n < 0 ? std::strerror(errno) : "short write");
        return false;
    }
    return true;
}

bool ControlChannel::emit(const Event& event)
{
    auto frame = encode_frame(encode_event(event));

    std::lock_guard<std::mutex> lock(_write_mutex);
    if (_broken.load(std::memory_order_acquire)) {
        FHOSTS_LOG_DEBUG("[control] channel broken, dropping %s event", event_type_name(event));
        return false;
    }
    if (!write_all(frame.data(), frame.size())) {
        _broken.store(true, std::memory_order_release);
        return false;
    }
    FHOSTS_LOG_DEBUG("[control] sent %s event (%zu bytes)", event_type_name(event), frame.size() - 4);
    return true;
}

} // namespace fhosts
