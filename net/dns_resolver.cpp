#include "dns_resolver.hpp"

#include "log.hpp"
#include "workqueue.hpp"

#include <algorithm>
#include <condition_variable>
#include <cstdio>
#include <cstring>
#include <deque>
#include <mutex>
#include <netdb.h>
#include <thread>
#include <utility>

namespace fhosts::net::dns {

namespace {

    std::string strip_brackets(const std::string& input)
    {
        if (input.size() >= 2 && input.front() == '[' && input.back() == ']')
            return input.substr(1, input.size() - 2);
        return input;
    }

    void resolve_core(const std::string& host, uint16_t port, resolve_result& result)
    {
        result.success    = false;
        result.error_code = 0;
        result.error_message.clear();
        result.endpoints.clear();

        std::string node = strip_brackets(host);
        if (node.empty()) {
            result.error_code    = EAI_NONAME;
            result.error_message = "empty host";
            return;
        }

        addrinfo hints {};
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_protocol = IPPROTO_TCP;
        hints.ai_family   = AF_UNSPEC;

        char service[16] {};
        std::snprintf(service, sizeof(service), "%u", static_cast<unsigned>(port));

        addrinfo* result_list = nullptr;
        int       rc          = ::getaddrinfo(node.c_str(), service, &hints, &result_list);
        if (rc != 0 || !result_list) {
            result.error_code    = rc;
            result.error_message = rc == 0 ? "no such host" : ::gai_strerror(rc);
            if (result_list)
                ::freeaddrinfo(result_list);
            return;
        }

        std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(result_list, ::freeaddrinfo);

        for (auto* ai = result_list; ai; ai = ai->ai_next) {
            if (!ai->ai_addr || ai->ai_addrlen == 0)
                continue;
            if (ai->ai_family != AF_INET && ai->ai_family != AF_INET6)
                continue;
            if (static_cast<size_t>(ai->ai_addrlen) > sizeof(sockaddr_storage))
                continue;
            endpoint ep {};
            std::memcpy(&ep.addr, ai->ai_addr, ai->ai_addrlen);
            ep.len = static_cast<socklen_t>(ai->ai_addrlen);
            result.endpoints.push_back(ep);
        }

        if (result.endpoints.empty()) {
            result.error_code    = EAI_NONAME;
            result.error_message = "no usable address";
            return;
        }
        result.success = true;
    }

} // namespace

struct async_resolver::Impl {
    explicit Impl(size_t worker_count)
    {
        if (worker_count == 0) {
            auto hw      = std::thread::hardware_concurrency();
            worker_count = std::clamp<size_t>(hw, size_t { 2 }, size_t { 8 });
        }
        workers.reserve(worker_count);
        for (size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back([this]() { worker_loop(); });
        }
    }

    ~Impl()
    {
        {
            std::lock_guard<std::mutex> guard(mutex);
            stop = true;
        }
        cv.notify_all();
        for (auto& worker : workers) {
            if (worker.joinable())
                worker.join();
        }
    }

    struct Job : worknode {
        std::string             host;
        uint16_t                port { 0 };
        workqueue<SpinLock>*    exec { nullptr };
        std::coroutine_handle<> continuation;
        resolve_result          result;

        static void run(worknode* node)
        {
            auto* self   = static_cast<Job*>(node);
            auto  handle = std::exchange(self->continuation, std::coroutine_handle<> {});
            if (handle)
                handle.resume();
        }
    };

    void enqueue(Job* job)
    {
        {
            std::lock_guard<std::mutex> guard(mutex);
            queue.push_back(job);
        }
        cv.notify_one();
    }

    void worker_loop()
    {
        for (;;) {
            Job* job = nullptr;
            {
                std::unique_lock<std::mutex> lock(mutex);
                cv.wait(lock, [this]() { return stop || !queue.empty(); });
                if (stop && queue.empty())
                    return;
                job = queue.front();
                queue.pop_front();
            }
            resolve_core(job->host, job->port, job->result);
            FHOSTS_LOG_DEBUG("[dns] %s -> %zu address(es)%s%s",
                             job->host.c_str(),
                             job->result.endpoints.size(),
                             job->result.success ? "" : ", ",
                             job->result.error_message.c_str());
            INIT_LIST_HEAD(&job->ws_node);
            job->func = &Job::run;
            job->exec->post(*job);
        }
    }

    std::vector<std::thread> workers;
    std::mutex               mutex;
    std::condition_variable  cv;
    std::deque<Job*>         queue;
    bool                     stop { false };
};

async_resolver::async_resolver(size_t worker_count) : _impl(std::make_unique<Impl>(worker_count)) { }

async_resolver::~async_resolver() = default;

Task<resolve_result, Work_Promise<SpinLock, resolve_result>>
async_resolver::resolve(workqueue<SpinLock>& exec, const std::string& host, uint16_t port)
{
    // Job 位于本协程帧内，直到被恢复前都不会失效。
    struct Awaitable {
        Impl&     impl;
        Impl::Job job;

        bool await_ready() const noexcept { return false; }
        void await_suspend(std::coroutine_handle<> h)
        {
            job.continuation = h;
            impl.enqueue(&job);
        }
        resolve_result await_resume() { return std::move(job.result); }
    };

    Awaitable aw { *_impl, {} };
    aw.job.host = host;
    aw.job.port = port;
    aw.job.exec = &exec;
    co_return co_await aw;
}

} // namespace fhosts::net::dns
