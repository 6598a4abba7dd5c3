#include "syswork.hpp"
#include "log.hpp"
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace fhosts {

namespace {
    struct executor_wq : workqueue<SpinLock> {
        std::condition_variable_any cv;
        std::atomic_bool            stopping { false };
        std::vector<std::thread>    workers;

        worknode* wait_and_get(struct workqueue& wq)
        {
            for (;;) {
                if (stopping.load(std::memory_order_acquire)) {
                    return nullptr;
                }
                worknode* n = workqueue<SpinLock>::get_work_node(wq);
                if (n) {
                    return n;
                }
                cv.wait(lk, [&]() { return stopping.load(std::memory_order_acquire) || !list_empty(&wq.ws_head); });
            }
        }

    protected:
        worknode* get_work_node(workqueue<SpinLock>& wq) override { return wait_and_get(wq); }

    public:
        executor_wq()
        {
            trig = [](struct workqueue* wq) {
                executor_wq* ewq = static_cast<executor_wq*>(wq);
                ewq->cv.notify_one();
            };
        }

        void start_workers(int n)
        {
            if (n <= 0) {
                unsigned hc = std::thread::hardware_concurrency();
                n           = hc < 2 ? 2 : static_cast<int>(hc);
            }
            if (!workers.empty())
                return;
            workers.reserve(static_cast<size_t>(n));
            for (int i = 0; i < n; ++i) {
                workers.emplace_back([this]() {
                    while (!stopping.load(std::memory_order_acquire)) {
                        (void)this->work_once();
                    }
                });
            }
            FHOSTS_LOG_DEBUG("[syswork] started %d worker threads", n);
        }

        void stop_and_join()
        {
            stopping.store(true, std::memory_order_release);
            cv.notify_all();
            for (auto& t : workers) {
                if (t.joinable())
                    t.join();
            }
            workers.clear();
        }

        ~executor_wq() { stop_and_join(); }
    };

    executor_wq& get_executor()
    {
        static executor_wq exec;
        return exec;
    }

    std::once_flag g_init_flag;
} // namespace

workqueue<SpinLock>& get_sys_workqueue(int threads)
{
    executor_wq& exec = get_executor();
    std::call_once(g_init_flag, [&]() { exec.start_workers(threads); });
    return exec;
}

void sys_wait_until(std::atomic_bool& finished)
{
    while (!finished.load(std::memory_order_acquire)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
}

bool sys_wait_until(std::atomic_bool& finished, std::chrono::milliseconds timeout)
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!finished.load(std::memory_order_acquire)) {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

} // namespace fhosts
