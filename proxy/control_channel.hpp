#pragma once

#include "control_message.hpp"

#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

namespace fhosts {

/**
 * @brief native messaging 控制通道：阻塞读取 in_fd 上的帧，向 out_fd 写事件帧。
 *
 * 读端只由主循环使用；写端可被任意线程并发调用。
 */
class ControlChannel : public EventSink {
public:
    enum class ReadStatus {
        Message,     ///< command 有效
        DecodeError, ///< 本帧无法解码，可继续读取下一帧
        Closed,      ///< 对端关闭或读错误，通道不可用
    };

    struct ReadResult {
        ReadStatus             status { ReadStatus::Closed };
        std::optional<Command> command;
        std::string            error;
    };

    ControlChannel(int in_fd, int out_fd, size_t max_message_bytes);
    ControlChannel(const ControlChannel&)            = delete;
    ControlChannel& operator=(const ControlChannel&) = delete;

    ReadResult read_message();

    bool emit(const Event& event) override;
    bool broken() const noexcept { return _broken.load(std::memory_order_acquire); }

private:
    enum class IoStatus { Ok, Eof, Error };

    IoStatus read_exact(void* buf, size_t len);
    IoStatus discard(size_t len);
    bool     write_all(const char* data, size_t len);

    int              _in_fd;
    int              _out_fd;
    size_t           _max_message_bytes;
    std::mutex       _write_mutex;
    std::atomic_bool _broken { false };
};

} // namespace fhosts
