//
// fhosts native messaging host: a local forward proxy that substitutes
// destination hosts for HTTP and CONNECT traffic. The controller talks to it
// over stdin/stdout using length-prefixed JSON frames.

#include "cli_options.hpp"
#include "command_loop.hpp"
#include "control_channel.hpp"
#include "log.hpp"
#include "proxy_engine.hpp"

#include <csignal>
#include <cstdio>
#include <exception>
#include <unistd.h>

int main(int argc, char* argv[])
{
    // stdout 只承载控制帧；写已关闭的管道以 EPIPE 返回而不是终止进程
    std::signal(SIGPIPE, SIG_IGN);

    fhosts::CliOptions options;
    try {
        options = fhosts::parse_cli_options(argc, argv);
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "[fhosts] invalid arguments: %s\n", ex.what());
        return 2;
    }

    if (!options.log_file_path.empty()) {
        try {
            fhosts::log::configure_file_logging(options.log_file_path, options.log_truncate);
        } catch (const std::exception& ex) {
            std::fprintf(stderr,
                         "[fhosts] failed to initialize log file %s: %s\n",
                         options.log_file_path.c_str(),
                         ex.what());
        }
    }
    fhosts::log::set_level(options.log_level);
    if (options.proxy.trace_packets)
        FHOSTS_LOG_INFO("[fhosts] per-packet logging enabled");

    FHOSTS_LOG_INFO("[fhosts] native host started (pid=%d, listen=%s:%u)",
                    static_cast<int>(::getpid()),
                    options.proxy.host.c_str(),
                    static_cast<unsigned>(options.proxy.port));

    fhosts::ControlChannel channel(STDIN_FILENO, STDOUT_FILENO, options.proxy.max_message_bytes);
    int                    rc = 0;
    {
        fhosts::ProxyEngine engine(options.proxy, channel);
        rc = fhosts::run_command_loop(engine, channel);
    }
    FHOSTS_LOG_INFO("[fhosts] exiting with code %d", rc);
    fhosts::log::flush();
    return rc;
}
