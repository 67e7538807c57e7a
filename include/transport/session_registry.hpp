#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "link_types.hpp"
#include "protocol/payloads.hpp"

namespace nocturne::transport {

/**
 * Per-peer connection state. The congestion streak and backoff for the same
 * peer live in the CongestionController.
 */
struct PeerSession {
    PeerId id;
    uint16_t mtu = 23;
    std::set<Channel> subscriptions;
    bool supportsBinaryProtocol = false;
    bool incrementalUpdates = false;
    std::chrono::steady_clock::time_point connectedAt{};
    std::chrono::steady_clock::time_point lastActivity{};

    // Last state published to this peer, used to suppress duplicates
    std::optional<protocol::MediaState> lastSentState;

    // Id of the running transfer per asset class
    std::map<AssetClass, uint64_t> activeTransfers;

    bool isSubscribed(Channel channel) const { return subscriptions.count(channel) > 0; }
};

/**
 * @brief Table of connected peers
 *
 * Readers get snapshots; every mutation goes through update() so the lock
 * is never held outside this class.
 */
class SessionRegistry {
public:
    using Mutator = std::function<void(PeerSession&)>;

    SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /** Returns false if the peer is already registered. */
    bool add(const PeerId& peer, uint16_t mtu);
    bool remove(const PeerId& peer);
    bool contains(const PeerId& peer) const;

    std::optional<PeerSession> get(const PeerId& peer) const;

    /** Applies mutator under the write lock; false for an unknown peer. */
    bool update(const PeerId& peer, const Mutator& mutator);

    std::vector<PeerId> peerIds() const;
    std::vector<PeerId> subscribers(Channel channel) const;
    std::vector<PeerSession> snapshot() const;
    size_t size() const;

    void touch(const PeerId& peer);
    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<PeerId, PeerSession> sessions_;
};

} // namespace nocturne::transport
