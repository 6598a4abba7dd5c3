#include "session_registry.hpp"

#include "log.hpp"

#include <algorithm>
#include <sys/socket.h>
#include <utility>

namespace fhosts {

uint64_t SessionRegistry::open(std::string client_peer)
{
    std::lock_guard<std::mutex> lock(_mutex);
    uint64_t                    id = _next_id++;
    SessionInfo                 info;
    info.client_peer = client_peer.empty() ? std::string("(unknown)") : std::move(client_peer);
    info.state       = "awaiting request";
    _sessions.emplace(id, std::move(info));
    return id;
}

void SessionRegistry::update(uint64_t id, std::string state)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto                        it = _sessions.find(id);
    if (it != _sessions.end())
        it->second.state = std::move(state);
}

void SessionRegistry::close(uint64_t id)
{
    std::lock_guard<std::mutex> lock(_mutex);
    _sessions.erase(id);
}

bool SessionRegistry::attach(uint64_t id, int fd)
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (_aborting || fd < 0)
        return false;
    auto it = _sessions.find(id);
    if (it == _sessions.end())
        return false;
    it->second.fds.push_back(fd);
    return true;
}

void SessionRegistry::detach(uint64_t id, int fd)
{
    std::lock_guard<std::mutex> lock(_mutex);
    auto                        it = _sessions.find(id);
    if (it == _sessions.end())
        return;
    auto& fds = it->second.fds;
    fds.erase(std::remove(fds.begin(), fds.end(), fd), fds.end());
}

void SessionRegistry::abort_all()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _aborting = true;
    for (auto& [id, info] : _sessions) {
        for (int fd : info.fds)
            ::shutdown(fd, SHUT_RDWR);
        if (!info.fds.empty())
            FHOSTS_LOG_DEBUG("[sessions] #%llu aborted (%zu socket(s))", static_cast<unsigned long long>(id), info.fds.size());
    }
}

void SessionRegistry::reset()
{
    std::lock_guard<std::mutex> lock(_mutex);
    _aborting = false;
}

bool SessionRegistry::aborting() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _aborting;
}

size_t SessionRegistry::active() const
{
    std::lock_guard<std::mutex> lock(_mutex);
    return _sessions.size();
}

void SessionRegistry::log_active(std::string_view reason) const
{
    std::lock_guard<std::mutex> lock(_mutex);
    if (_sessions.empty()) {
        FHOSTS_LOG_INFO("[proxy] no active sessions pending (%.*s)", static_cast<int>(reason.size()), reason.data());
        return;
    }

    FHOSTS_LOG_INFO("[proxy] %zu active session(s) pending (%.*s)",
                    _sessions.size(),
                    static_cast<int>(reason.size()),
                    reason.data());
    auto now = std::chrono::steady_clock::now();
    for (const auto& [id, info] : _sessions) {
        auto lifetime_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - info.start_time).count();
        FHOSTS_LOG_INFO("[proxy] #%llu client=%s state=%s lifetime_ms=%lld",
                        static_cast<unsigned long long>(id),
                        info.client_peer.c_str(),
                        info.state.c_str(),
                        static_cast<long long>(lifetime_ms));
    }
}

} // namespace fhosts
