#include "control_message.hpp"

#include <nlohmann/json.hpp>

#include <type_traits>

namespace fhosts {

namespace {

    template <class... Ts> struct overloaded : Ts... {
        using Ts::operator()...;
    };
    template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

    bool read_mappings(const nlohmann::json& root, MappingTable& out, std::string& error)
    {
        auto it = root.find("mappings");
        if (it == root.end() || it->is_null())
            return true;
        if (!it->is_object()) {
            error = "mappings must be an object";
            return false;
        }
        for (auto& [host, target] : it->items()) {
            if (!target.is_string()) {
                error = "mapping for " + host + " must be a string";
                return false;
            }
            out[host] = target.get<std::string>();
        }
        return true;
    }

} // namespace

DecodeResult decode_command(std::string_view body)
{
    DecodeResult   result;
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(body.begin(), body.end());
    } catch (const nlohmann::json::exception& ex) {
        result.error = ex.what();
        return result;
    }
    if (!root.is_object()) {
        result.error = "message is not a JSON object";
        return result;
    }

    std::string action;
    if (auto it = root.find("action"); it != root.end() && !it->is_null()) {
        if (!it->is_string()) {
            result.error = "action must be a string";
            return result;
        }
        action = it->get<std::string>();
    }

    MappingTable mappings;
    if (!read_mappings(root, mappings, result.error))
        return result;

    if (action == "start") {
        result.command = StartCommand { std::move(mappings) };
    } else if (action == "updateMappings") {
        result.command = UpdateMappingsCommand { std::move(mappings) };
    } else if (action == "stop") {
        result.command = StopCommand {};
    } else if (action == "ping") {
        result.command = PingCommand {};
    } else {
        result.command = UnknownCommand { std::move(action) };
    }
    return result;
}

const char* event_type_name(const Event& event)
{
    return std::visit(overloaded {
                          [](const ReadyEvent&) { return "ready"; },
                          [](const StartedEvent&) { return "started"; },
                          [](const StoppedEvent&) { return "stopped"; },
                          [](const MappingsUpdatedEvent&) { return "mappingsUpdated"; },
                          [](const ErrorEvent&) { return "error"; },
                          [](const PongEvent&) { return "pong"; },
                          [](const LogEvent&) { return "log"; },
                      },
                      event);
}

std::string encode_event(const Event& event)
{
    nlohmann::json root { { "type", event_type_name(event) } };
    std::visit(overloaded {
                   [&](const StartedEvent& e) { root["port"] = e.port; },
                   [&](const MappingsUpdatedEvent& e) { root["count"] = e.count; },
                   [&](const ErrorEvent& e) { root["message"] = e.message; },
                   [&](const LogEvent& e) { root["message"] = e.message; },
                   [](const auto&) { },
               },
               event);
    // 控制端未必是严格 UTF-8 生产者，非法字节替换而不是抛异常
    return root.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<Event> decode_event(std::string_view body)
{
    auto root = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (root.is_discarded() || !root.is_object())
        return std::nullopt;
    auto type_it = root.find("type");
    if (type_it == root.end() || !type_it->is_string())
        return std::nullopt;
    const auto type    = type_it->get<std::string>();
    auto       message = root.value("message", std::string {});

    if (type == "ready")
        return ReadyEvent {};
    if (type == "started")
        return StartedEvent { static_cast<uint16_t>(root.value("port", 0)) };
    if (type == "stopped")
        return StoppedEvent {};
    if (type == "mappingsUpdated")
        return MappingsUpdatedEvent { root.value("count", size_t { 0 }) };
    if (type == "error")
        return ErrorEvent { std::move(message) };
    if (type == "pong")
        return PongEvent {};
    if (type == "log")
        return LogEvent { std::move(message) };
    return std::nullopt;
}

std::string encode_frame(std::string_view body)
{
    uint32_t    len = static_cast<uint32_t>(body.size());
    std::string frame;
    frame.reserve(4 + body.size());
    frame.push_back(static_cast<char>(len & 0xFF));
    frame.push_back(static_cast<char>((len >> 8) & 0xFF));
    frame.push_back(static_cast<char>((len >> 16) & 0xFF));
    frame.push_back(static_cast<char>((len >> 24) & 0xFF));
    frame.append(body);
    return frame;
}

uint32_t decode_frame_length(const unsigned char prefix[4])
{
    return static_cast<uint32_t>(prefix[0]) | (static_cast<uint32_t>(prefix[1]) << 8)
        | (static_cast<uint32_t>(prefix[2]) << 16) | (static_cast<uint32_t>(prefix[3]) << 24);
}

} // namespace fhosts
