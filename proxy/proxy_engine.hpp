#pragma once

#include "proxy_context.hpp"
#include "proxy_server.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace fhosts {

/**
 * @brief 代理生命周期管理：最多一个运行实例，start/stop/update_mappings 是唯一的变更入口。
 *
 * 所有结果以事件形式交给 EventSink；三个操作在内部互斥串行执行。
 */
class ProxyEngine {
public:
    ProxyEngine(ProxyConfig config, EventSink& events);
    ProxyEngine(const ProxyEngine&)            = delete;
    ProxyEngine& operator=(const ProxyEngine&) = delete;
    ~ProxyEngine();

    /**
     * @brief 已运行时直接回报 started{port}；否则装载映射、监听并启动接收循环。
     * 监听失败回报 error，不创建实例。
     */
    void start(MappingTable mappings);

    /**
     * @brief 关闭监听、中止所有进行中的连接并等待其退出，随后回报 stopped。可重复调用。
     */
    void stop();

    /** @brief 整表替换映射，不论是否运行，回报 mappingsUpdated{count}。 */
    void update_mappings(MappingTable mappings);

    bool     running() const;
    uint16_t port() const;

    MappingStore&      mappings() { return _mappings; }
    SessionRegistry&   sessions() { return _sessions; }
    const ProxyConfig& config() const { return _config; }

private:
    struct Instance {
        std::unique_ptr<TcpListener> listener;
        uint16_t                     port { 0 };
        std::atomic_bool             stopping { false };
        std::atomic_bool             server_finished { false };
    };

    static void on_server_completed(Promise_base& promise);

    void stop_locked();

    ProxyConfig                  _config;
    EventSink&                   _events;
    MappingStore                 _mappings;
    SessionRegistry              _sessions;
    NetFdWorkqueue               _fdwq;
    net::dns::async_resolver     _resolver;
    ProxyContext                 _ctx;
    mutable std::mutex           _lifecycle_mutex;
    std::unique_ptr<Instance>    _instance;
};

} // namespace fhosts
