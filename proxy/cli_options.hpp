#pragma once

#include "proxy_config.hpp"

#include <spdlog/common.h>

#include <string>

namespace fhosts {

struct CliOptions {
    ProxyConfig               proxy;
    std::string               log_file_path;
    bool                      log_truncate { true };
    spdlog::level::level_enum log_level { spdlog::level::info };
};

/**
 * @brief 解析命令行。浏览器启动 native host 时会附加扩展 origin 等参数，未知参数一律忽略。
 * @throws std::invalid_argument / std::out_of_range 数值参数非法。
 */
CliOptions parse_cli_options(int argc, const char* const argv[]);

} // namespace fhosts
