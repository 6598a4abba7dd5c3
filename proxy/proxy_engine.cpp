#include "proxy_engine.hpp"

#include "log.hpp"
#include "syswork.hpp"

#include <chrono>
#include <exception>
#include <thread>
#include <utility>

namespace fhosts {

ProxyEngine::ProxyEngine(ProxyConfig config, EventSink& events)
    : _config(std::move(config))
    , _events(events)
    , _fdwq(get_sys_workqueue(_config.threads))
    , _ctx { _fdwq, _resolver, _mappings, _sessions, _events, _config }
{
}

ProxyEngine::~ProxyEngine()
{
    std::lock_guard<std::mutex> lock(_lifecycle_mutex);
    if (_instance)
        stop_locked();
}

void ProxyEngine::on_server_completed(Promise_base& promise)
{
    auto* finished = static_cast<std::atomic_bool*>(promise.mUserData);
    finished->store(true, std::memory_order_release);
}

void ProxyEngine::start(MappingTable mappings)
{
    std::lock_guard<std::mutex> lock(_lifecycle_mutex);
    if (_instance) {
        FHOSTS_LOG_INFO("[engine] start ignored, already listening on port %u", static_cast<unsigned>(_instance->port));
        _events.emit(StartedEvent { _instance->port });
        return;
    }

    _mappings.replace(std::move(mappings));

    auto instance      = std::make_unique<Instance>();
    instance->listener = _fdwq.make_tcp_listener();
    try {
        instance->listener->bind_listen(_config.host, _config.port);
    } catch (const std::exception& ex) {
        FHOSTS_LOG_ERROR("[engine] failed to start proxy: %s", ex.what());
        _events.emit(ErrorEvent { std::string("Failed to start proxy: ") + ex.what() });
        return;
    }
    instance->port = instance->listener->local_port();
    _sessions.reset();

    auto task = proxy_server(_ctx, *instance->listener, instance->stopping);
    {
        auto& promise        = task.get().promise();
        promise.mUserData    = &instance->server_finished;
        promise.mOnCompleted = &ProxyEngine::on_server_completed;
    }
    post_to(task, _fdwq.base());

    FHOSTS_LOG_INFO("[engine] proxy started on %s:%u (%zu mapping(s))",
                    _config.host.c_str(),
                    static_cast<unsigned>(instance->port),
                    _mappings.size());
    uint16_t port = instance->port;
    _instance     = std::move(instance);
    _events.emit(StartedEvent { port });
}

void ProxyEngine::stop()
{
    std::lock_guard<std::mutex> lock(_lifecycle_mutex);
    if (_instance)
        stop_locked();
    else
        FHOSTS_LOG_DEBUG("[engine] stop requested while not running");
    _events.emit(StoppedEvent {});
}

void ProxyEngine::stop_locked()
{
    auto instance = std::move(_instance);
    FHOSTS_LOG_INFO("[engine] stopping proxy on port %u", static_cast<unsigned>(instance->port));

    // 先停接收循环：shutdown 唤醒挂起的 accept，循环退出后才关闭监听 fd
    instance->stopping.store(true, std::memory_order_release);
    instance->listener->shutdown();
    while (!sys_wait_until(instance->server_finished, _config.drain_log_interval)) {
        FHOSTS_LOG_WARN("[engine] waiting for accept loop to exit");
        instance->listener->shutdown();
    }
    instance->listener->close();

    // 再中止所有进行中的连接
    _sessions.abort_all();
    auto last_log = std::chrono::steady_clock::now();
    while (_sessions.active() > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        auto now = std::chrono::steady_clock::now();
        if (now - last_log >= _config.drain_log_interval) {
            _sessions.log_active("shutdown pending");
            _sessions.abort_all();
            last_log = now;
        }
    }
    FHOSTS_LOG_INFO("[engine] proxy stopped");
}

void ProxyEngine::update_mappings(MappingTable mappings)
{
    std::lock_guard<std::mutex> lock(_lifecycle_mutex);
    size_t                      count = mappings.size();
    _mappings.replace(std::move(mappings));
    FHOSTS_LOG_INFO("[engine] mappings updated (%zu)", count);
    _events.emit(MappingsUpdatedEvent { count });
}

bool ProxyEngine::running() const
{
    std::lock_guard<std::mutex> lock(_lifecycle_mutex);
    return _instance != nullptr;
}

uint16_t ProxyEngine::port() const
{
    std::lock_guard<std::mutex> lock(_lifecycle_mutex);
    return _instance ? _instance->port : 0;
}

} // namespace fhosts
