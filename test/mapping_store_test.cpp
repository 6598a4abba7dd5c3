#include "log.hpp"
#include "mapping_store.hpp"
#include "session_registry.hpp"
#include "test_support.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace fhosts;
using fhosts::test::check;

namespace {

// 多个线程同时第一次取日志器，只能创建出同一个实例
int test_concurrent_first_log()
{
    int                          failures = 0;
    constexpr int                thread_count = 8;
    std::atomic_bool             go { false };
    std::vector<spdlog::logger*> seen(thread_count, nullptr);
    std::vector<std::thread>     threads;
    for (int i = 0; i < thread_count; ++i) {
        threads.emplace_back([&, i] {
            while (!go.load())
                std::this_thread::yield();
            seen[i] = fhosts::log::get_logger().get();
            FHOSTS_LOG_DEBUG("[test] logger ready on thread %d", i);
        });
    }
    go.store(true);
    for (auto& t : threads)
        t.join();

    failures += check(seen[0] != nullptr, "logger created");
    for (int i = 1; i < thread_count; ++i)
        failures += check(seen[i] == seen[0], "every thread sees the same logger");
    failures += check(spdlog::get(FHOSTS_LOGGER_NAME).get() == seen[0], "logger registered once");
    return failures;
}

int test_lookup_and_replace()
{
    int          failures = 0;
    MappingStore store;
    failures += check(store.size() == 0, "new store should be empty");
    failures += check(store.lookup("example.com") == "example.com", "unmapped host must be returned unchanged");

    store.replace({ { "example.com", "10.0.0.1" }, { "api.test", "127.0.0.1" } });
    failures += check(store.size() == 2, "replace should install two mappings");
    failures += check(store.lookup("example.com") == "10.0.0.1", "mapped host should be substituted");
    failures += check(store.lookup("api.test") == "127.0.0.1", "second mapping should be substituted");
    failures += check(store.lookup("Example.com") == "Example.com", "lookup is case sensitive");

    // 整表替换：旧条目不残留
    store.replace({ { "other.test", "192.0.2.7" } });
    failures += check(store.size() == 1, "replace should drop previous entries");
    failures += check(store.lookup("example.com") == "example.com", "old mapping must be gone after replace");
    failures += check(store.snapshot().count("other.test") == 1, "snapshot should reflect the current table");

    store.replace({});
    failures += check(store.size() == 0, "empty replace clears the table");
    return failures;
}

int test_concurrent_readers()
{
    MappingStore store;
    store.replace({ { "a.test", "1.1.1.1" } });

    std::atomic_bool  done { false };
    std::atomic_int   bad { 0 };
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!done.load()) {
                auto v = store.lookup("a.test");
                if (v != "1.1.1.1" && v != "2.2.2.2")
                    bad.fetch_add(1);
            }
        });
    }
    for (int i = 0; i < 200; ++i)
        store.replace({ { "a.test", (i % 2) ? "1.1.1.1" : "2.2.2.2" } });
    done.store(true);
    for (auto& t : readers)
        t.join();
    return check(bad.load() == 0, "readers must only observe complete tables");
}

int test_session_registry()
{
    int             failures = 0;
    SessionRegistry registry;
    auto            id = registry.open("127.0.0.1:5555");
    failures += check(registry.active() == 1, "open should register a session");

    int fds[2];
    failures += check(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0, "socketpair");
    {
        SessionRegistry::Attachment attachment(registry, id, fds[0]);
        failures += check(attachment.ok(), "attach should succeed while not aborting");
        registry.update(id, "testing");
        registry.abort_all();
        failures += check(registry.aborting(), "abort_all enters aborting state");

        // shutdown 之后读端立即返回 EOF
        char    c = 0;
        ssize_t n = ::recv(fds[0], &c, 1, 0);
        failures += check(n == 0, "abort_all should shut down attached sockets");

        SessionRegistry::Attachment rejected(registry, id, fds[1]);
        failures += check(!rejected.ok(), "attach must fail while aborting");
    }
    registry.close(id);
    failures += check(registry.active() == 0, "close should remove the session");

    registry.reset();
    failures += check(!registry.aborting(), "reset leaves aborting state");
    auto id2 = registry.open("127.0.0.1:6666");
    failures += check(id2 != id, "session ids are not reused");
    registry.log_active("test");
    registry.close(id2);

    ::close(fds[0]);
    ::close(fds[1]);
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_concurrent_first_log();
    failures += test_lookup_and_replace();
    failures += test_concurrent_readers();
    failures += test_session_registry();
    return fhosts::test::finish("mapping_store_test", failures);
}
