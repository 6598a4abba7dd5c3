#pragma once

#include "control_channel.hpp"
#include "proxy_engine.hpp"

namespace fhosts {

enum class LoopAction {
    Continue,
    Exit,
};

/**
 * @brief 执行一条控制命令。stop 之后返回 Exit。
 */
LoopAction handle_command(ProxyEngine& engine, EventSink& events, Command command);

/**
 * @brief 控制通道主循环：发送 ready，逐帧处理命令，直到 stop 或通道关闭。
 *
 * 解码失败的帧被跳过；通道关闭时停止代理。
 * @return 进程退出码。
 */
int run_command_loop(ProxyEngine& engine, ControlChannel& channel);

} // namespace fhosts
