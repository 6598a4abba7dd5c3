#include "cli_options.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>
#include <string>

namespace fhosts {

namespace {

    unsigned long parse_number(const std::string& flag, const char* value, unsigned long max)
    {
        size_t        used   = 0;
        unsigned long parsed = std::stoul(value, &used, 10);
        if (used != std::char_traits<char>::length(value) || parsed > max)
            throw std::out_of_range(flag + ": value out of range: " + value);
        return parsed;
    }

} // namespace

CliOptions parse_cli_options(int argc, const char* const argv[])
{
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--host" && i + 1 < argc) {
            opts.proxy.host = argv[++i];
        } else if (arg == "--port" && i + 1 < argc) {
            opts.proxy.port = static_cast<uint16_t>(parse_number(arg, argv[++i], std::numeric_limits<uint16_t>::max()));
        } else if (arg == "--connect-timeout-ms" && i + 1 < argc) {
            opts.proxy.connect_timeout = std::chrono::milliseconds(
                parse_number(arg, argv[++i], std::numeric_limits<int>::max()));
        } else if (arg == "--max-message-bytes" && i + 1 < argc) {
            opts.proxy.max_message_bytes = parse_number(arg, argv[++i], std::numeric_limits<uint32_t>::max());
        } else if (arg == "--max-request-head-bytes" && i + 1 < argc) {
            opts.proxy.max_request_head_bytes = parse_number(arg, argv[++i], std::numeric_limits<uint32_t>::max());
        } else if (arg == "--threads" && i + 1 < argc) {
            opts.proxy.threads = static_cast<int>(parse_number(arg, argv[++i], 1024));
        } else if (arg == "--log-file" && i + 1 < argc) {
            opts.log_file_path = argv[++i];
        } else if (arg == "--log-truncate") {
            opts.log_truncate = true;
        } else if (arg == "--log-append") {
            opts.log_truncate = false;
        } else if (arg == "--verbose") {
            opts.log_level = spdlog::level::debug;
        } else if (arg == "--quiet") {
            opts.log_level = spdlog::level::warn;
        } else if (arg == "--trace-packets") {
            opts.proxy.trace_packets = true;
        }
    }
    return opts;
}

} // namespace fhosts
