#pragma once

#include "mapping_store.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace fhosts {

// ---- inbound commands (field "action") ----
struct StartCommand {
    MappingTable mappings;
};
struct UpdateMappingsCommand {
    MappingTable mappings;
};
struct StopCommand { };
struct PingCommand { };
struct UnknownCommand {
    std::string action;
};

using Command = std::variant<StartCommand, UpdateMappingsCommand, StopCommand, PingCommand, UnknownCommand>;

// ---- outbound events (field "type") ----
struct ReadyEvent { };
struct StartedEvent {
    uint16_t port { 0 };
};
struct StoppedEvent { };
struct MappingsUpdatedEvent {
    size_t count { 0 };
};
struct ErrorEvent {
    std::string message;
};
struct PongEvent { };
struct LogEvent {
    std::string message;
};

using Event
    = std::variant<ReadyEvent, StartedEvent, StoppedEvent, MappingsUpdatedEvent, ErrorEvent, PongEvent, LogEvent>;

/**
 * @brief 命令解码结果：成功时 command 有值，否则 error 给出原因。
 */
struct DecodeResult {
    std::optional<Command> command;
    std::string            error;

    explicit operator bool() const { return command.has_value(); }
};

DecodeResult decode_command(std::string_view body);

std::string          encode_event(const Event& event);
std::optional<Event> decode_event(std::string_view body);

const char* event_type_name(const Event& event);

/**
 * @brief 4 字节小端长度前缀 + body。
 */
std::string encode_frame(std::string_view body);
uint32_t    decode_frame_length(const unsigned char prefix[4]);

/**
 * @brief 事件出口。实现需线程安全：连接协程会在 worker 线程上并发上报。
 * @return false 表示通道已断开，事件被丢弃。
 */
class EventSink {
public:
    virtual ~EventSink()                  = default;
    virtual bool emit(const Event& event) = 0;
};

} // namespace fhosts
