// log.hpp - spdlog backed diagnostic logging shared by the runtime and the proxy
#pragma once

#include <fmt/printf.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <mutex>
#include <string>
#include <utility>

#ifndef FHOSTS_LOGGER_NAME
#define FHOSTS_LOGGER_NAME "fhosts"
#endif

#ifndef FHOSTS_LOG_PATTERN
#define FHOSTS_LOG_PATTERN "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v"
#endif

namespace fhosts::log {

// stdout 属于 native messaging 控制通道，日志只能写 stderr 或文件。
inline std::shared_ptr<spdlog::logger>& logger_storage()
{
    static std::shared_ptr<spdlog::logger> storage;
    return storage;
}

inline void trim_trailing_newlines(std::string& message)
{
    while (!message.empty() && (message.back() == '\n' || message.back() == '\r')) {
        message.pop_back();
    }
}

// 首次使用可能发生在任意 worker 线程上，创建过程只执行一次
inline spdlog::logger* ensure_logger()
{
    static std::once_flag init_flag;
    auto&                 storage = logger_storage();
    std::call_once(init_flag, [&storage] {
        if (storage)
            return;
        if (auto named = spdlog::get(FHOSTS_LOGGER_NAME)) {
            storage = named;
        } else {
            auto created = spdlog::stderr_color_mt(FHOSTS_LOGGER_NAME);
            created->set_level(spdlog::level::info);
            created->set_pattern(FHOSTS_LOG_PATTERN);
            storage = std::move(created);
        }
        spdlog::set_default_logger(storage);
    });
    return storage.get();
}

inline std::shared_ptr<spdlog::logger> get_logger()
{
    ensure_logger();
    return logger_storage();
}

inline void set_logger(std::shared_ptr<spdlog::logger> logger)
{
    logger_storage() = std::move(logger);
    if (logger_storage())
        spdlog::set_default_logger(logger_storage());
}

inline void set_level(spdlog::level::level_enum level)
{
    if (auto* logger = ensure_logger()) {
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
    }
}

/**
 * @brief 在 stderr 之外追加一个文件 sink。
 *
 * @param path     日志文件路径，父目录需已存在。
 * @param truncate true 表示每次启动清空文件。
 * @throws spdlog::spdlog_ex 文件无法打开时抛出。
 */
inline void configure_file_logging(const std::string& path, bool truncate)
{
    auto* current = ensure_logger();
    auto  file    = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, truncate);
    file->set_pattern(FHOSTS_LOG_PATTERN);

    auto sinks = current->sinks();
    sinks.push_back(std::move(file));
    auto combined = std::make_shared<spdlog::logger>(FHOSTS_LOGGER_NAME, sinks.begin(), sinks.end());
    combined->set_level(current->level());
    combined->flush_on(spdlog::level::warn);
    spdlog::drop(FHOSTS_LOGGER_NAME);
    spdlog::register_logger(combined);
    set_logger(std::move(combined));
}

inline void flush()
{
    if (auto* logger = ensure_logger())
        logger->flush();
}

template <typename... Args> inline void log_message(spdlog::level::level_enum level, const char* fmt, Args&&... args)
{
    if (auto* logger = ensure_logger()) {
        if (!logger->should_log(level))
            return;
        auto message = fmt::sprintf(fmt, std::forward<Args>(args)...);
        trim_trailing_newlines(message);
        logger->log(level, message);
    }
}

template <typename... Args> inline void log_trace(const char* fmt, Args&&... args)
{
    log_message(spdlog::level::trace, fmt, std::forward<Args>(args)...);
}

template <typename... Args> inline void log_debug(const char* fmt, Args&&... args)
{
    log_message(spdlog::level::debug, fmt, std::forward<Args>(args)...);
}

template <typename... Args> inline void log_info(const char* fmt, Args&&... args)
{
    log_message(spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template <typename... Args> inline void log_warn(const char* fmt, Args&&... args)
{
    log_message(spdlog::level::warn, fmt, std::forward<Args>(args)...);
}

template <typename... Args> inline void log_error(const char* fmt, Args&&... args)
{
    log_message(spdlog::level::err, fmt, std::forward<Args>(args)...);
}

template <typename... Args> inline void log_critical(const char* fmt, Args&&... args)
{
    log_message(spdlog::level::critical, fmt, std::forward<Args>(args)...);
}

} // namespace fhosts::log

#define FHOSTS_LOG_TRACE(...)    ::fhosts::log::log_trace(__VA_ARGS__)
#define FHOSTS_LOG_DEBUG(...)    ::fhosts::log::log_debug(__VA_ARGS__)
#define FHOSTS_LOG_INFO(...)     ::fhosts::log::log_info(__VA_ARGS__)
#define FHOSTS_LOG_WARN(...)     ::fhosts::log::log_warn(__VA_ARGS__)
#define FHOSTS_LOG_ERROR(...)    ::fhosts::log::log_error(__VA_ARGS__)
#define FHOSTS_LOG_CRITICAL(...) ::fhosts::log::log_critical(__VA_ARGS__)
