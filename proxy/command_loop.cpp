#include "command_loop.hpp"

#include "log.hpp"

#include <type_traits>
#include <utility>

namespace fhosts {

LoopAction handle_command(ProxyEngine& engine, EventSink& events, Command command)
{
    return std::visit(
        [&](auto&& cmd) -> LoopAction {
            using T = std::decay_t<decltype(cmd)>;
            if constexpr (std::is_same_v<T, StartCommand>) {
                FHOSTS_LOG_DEBUG("[control] start (%zu mapping(s))", cmd.mappings.size());
                engine.start(std::move(cmd.mappings));
            } else if constexpr (std::is_same_v<T, UpdateMappingsCommand>) {
                FHOSTS_LOG_DEBUG("[control] updateMappings (%zu mapping(s))", cmd.mappings.size());
                engine.update_mappings(std::move(cmd.mappings));
            } else if constexpr (std::is_same_v<T, StopCommand>) {
                FHOSTS_LOG_DEBUG("[control] stop");
                engine.stop();
                return LoopAction::Exit;
            } else if constexpr (std::is_same_v<T, PingCommand>) {
                events.emit(PongEvent {});
            } else {
                FHOSTS_LOG_WARN("[control] unknown action '%s'", cmd.action.c_str());
                events.emit(ErrorEvent { "Unknown action: " + cmd.action });
            }
            return LoopAction::Continue;
        },
        std::move(command));
}

int run_command_loop(ProxyEngine& engine, ControlChannel& channel)
{
    channel.emit(ReadyEvent {});

    for (;;) {
        auto result = channel.read_message();
        switch (result.status) {
        case ControlChannel::ReadStatus::Closed:
            FHOSTS_LOG_INFO("[control] controller disconnected (%s), shutting down", result.error.c_str());
            engine.stop();
            return 0;
        case ControlChannel::ReadStatus::DecodeError:
            FHOSTS_LOG_WARN("[control] skipping malformed message: %s", result.error.c_str());
            continue;
        case ControlChannel::ReadStatus::Message:
            break;
        }
        if (handle_command(engine, channel, std::move(*result.command)) == LoopAction::Exit)
            return 0;
    }
}

} // namespace fhosts
