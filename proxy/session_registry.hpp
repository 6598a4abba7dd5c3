#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fhosts {

/**
 * @brief 活动连接登记表。
 *
 * 记录每个连接的对端与当前状态，并持有连接上所有 socket 的 fd，
 * 以便 stop 时通过 shutdown 唤醒并终止它们。fd 必须在 close 之前 detach，
 * 否则 abort_all 可能作用到被复用的 fd 上。
 */
class SessionRegistry {
public:
    SessionRegistry() = default;
    SessionRegistry(const SessionRegistry&)            = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    uint64_t open(std::string client_peer);
    void     update(uint64_t id, std::string state);
    void     close(uint64_t id);

    /** @return false 表示正在终止，调用方应放弃该连接。 */
    bool attach(uint64_t id, int fd);
    void detach(uint64_t id, int fd);

    /** @brief 进入终止状态并 shutdown 所有已登记的 fd。 */
    void abort_all();
    /** @brief 清除终止状态，供下一次 start 使用。 */
    void reset();

    bool   aborting() const;
    size_t active() const;
    void   log_active(std::string_view reason) const;

    /**
     * @brief 在作用域内把 fd 登记到某个连接，析构时注销。
     * 需声明在对应 socket 之后，使其先于 socket 析构。
     */
    class Attachment {
    public:
        Attachment(SessionRegistry& registry, uint64_t id, int fd)
            : _registry(&registry), _id(id), _fd(fd), _ok(registry.attach(id, fd))
        {
        }
        /** @brief 接管一个已经 attach 过的 fd。 */
        Attachment(SessionRegistry& registry, uint64_t id, int fd, std::adopt_lock_t)
            : _registry(&registry), _id(id), _fd(fd), _ok(true)
        {
        }
        Attachment(const Attachment&)            = delete;
        Attachment& operator=(const Attachment&) = delete;
        ~Attachment() { release(); }

        bool ok() const { return _ok; }
        void release()
        {
            if (_registry && _ok)
                _registry->detach(_id, _fd);
            _registry = nullptr;
        }

    private:
        SessionRegistry* _registry;
        uint64_t         _id;
        int              _fd;
        bool             _ok;
    };

private:
    struct SessionInfo {
        std::string                           client_peer;
        std::string                           state;
        std::vector<int>                      fds;
        std::chrono::steady_clock::time_point start_time { std::chrono::steady_clock::now() };
    };

    mutable std::mutex                        _mutex;
    std::unordered_map<uint64_t, SessionInfo> _sessions;
    uint64_t                                  _next_id { 1 };
    bool                                      _aborting { false };
};

} // namespace fhosts
