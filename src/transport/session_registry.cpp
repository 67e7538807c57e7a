#include "transport/session_registry.hpp"

#include <algorithm>
#include <mutex>

namespace nocturne::transport {

bool SessionRegistry::add(const PeerId& peer, uint16_t mtu) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (sessions_.count(peer) > 0) {
        return false;
    }

    PeerSession session;
    session.id = peer;
    session.mtu = mtu;
    session.connectedAt = std::chrono::steady_clock::now();
    session.lastActivity = session.connectedAt;
    sessions_.emplace(peer, std::move(session));
    return true;
}

bool SessionRegistry::remove(const PeerId& peer) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return sessions_.erase(peer) > 0;
}

bool SessionRegistry::contains(const PeerId& peer) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.count(peer) > 0;
}

std::optional<PeerSession> SessionRegistry::get(const PeerId& peer) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(peer);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool SessionRegistry::update(const PeerId& peer, const Mutator& mutator) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(peer);
    if (it == sessions_.end()) {
        return false;
    }
    mutator(it->second);
    return true;
}

std::vector<PeerId> SessionRegistry::peerIds() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<PeerId> ids;
    ids.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        ids.push_back(entry.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<PeerId> SessionRegistry::subscribers(Channel channel) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<PeerId> ids;
    for (const auto& entry : sessions_) {
        if (entry.second.isSubscribed(channel)) {
            ids.push_back(entry.first);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

std::vector<PeerSession> SessionRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<PeerSession> sessions;
    sessions.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
        sessions.push_back(entry.second);
    }
    std::sort(sessions.begin(), sessions.end(),
              [](const PeerSession& a, const PeerSession& b) { return a.id < b.id; });
    return sessions;
}

size_t SessionRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sessions_.size();
}

void SessionRegistry::touch(const PeerId& peer) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(peer);
    if (it != sessions_.end()) {
        it->second.lastActivity = std::chrono::steady_clock::now();
    }
}

void SessionRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    sessions_.clear();
}

} // namespace nocturne::transport
