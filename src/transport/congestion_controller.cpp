#include "transport/congestion_controller.hpp"
#include "system/logger.hpp"

#include <algorithm>

namespace nocturne::transport {

CongestionController::CongestionController(const QueueSettings& settings)
    : settings_(settings) {
}

void CongestionController::recordSuccess(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = states_[peer];

    state.totalSuccesses++;
    if (state.consecutiveFailures > 0) {
        state.consecutiveFailures--;
    }
    state.backoffMs = state.backoffMs > settings_.backoffDecayMs
        ? state.backoffMs - settings_.backoffDecayMs
        : 0;
}

void CongestionController::recordFailure(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& state = states_[peer];

    state.totalFailures++;
    state.consecutiveFailures++;
    uint64_t scaled = static_cast<uint64_t>(settings_.baseBackoffMs) * state.consecutiveFailures;
    state.backoffMs = static_cast<uint32_t>(std::min<uint64_t>(settings_.maxBackoffMs, scaled));
    state.lastFailure = std::chrono::steady_clock::now();

    Logger::debug("CongestionController: {} failure streak {}, backoff {} ms",
                  peer, state.consecutiveFailures, state.backoffMs);
}

CongestionState CongestionController::stateFor(const PeerId& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(peer);
    return it == states_.end() ? CongestionState() : it->second;
}

std::chrono::milliseconds CongestionController::backoffFor(const PeerId& peer) const {
    return std::chrono::milliseconds(stateFor(peer).backoffMs);
}

std::chrono::steady_clock::time_point CongestionController::readyAt(const PeerId& peer) const {
    CongestionState state = stateFor(peer);
    if (state.backoffMs == 0) {
        return std::chrono::steady_clock::time_point::min();
    }
    return state.lastFailure + std::chrono::milliseconds(state.backoffMs);
}

bool CongestionController::isCongested(const PeerId& peer) const {
    CongestionState state = stateFor(peer);
    return state.consecutiveFailures > 2 || state.backoffMs > 100;
}

ConnectionQuality CongestionController::qualityFor(const PeerId& peer, size_t queuedMessages) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = states_.find(peer);
    CongestionState state = it == states_.end() ? CongestionState() : it->second;
    return classify(state, queuedMessages, settings_);
}

ConnectionQuality CongestionController::classify(const CongestionState& state, size_t queuedMessages,
                                                 const QueueSettings& settings) {
    size_t capacity = settings.urgentCapacity + settings.normalCapacity + settings.bulkCapacity;
    double fill = capacity == 0 ? 0.0 : static_cast<double>(queuedMessages) / static_cast<double>(capacity);

    if (state.consecutiveFailures >= 5 ||
        (state.backoffMs > 0 && state.backoffMs >= settings.maxBackoffMs / 2) || fill >= 0.75) {
        return ConnectionQuality::Poor;
    }
    if (state.consecutiveFailures >= 3 || state.backoffMs > 100 || fill >= 0.5) {
        return ConnectionQuality::Fair;
    }
    if (state.consecutiveFailures > 0 || state.backoffMs > 0 || fill >= 0.2) {
        return ConnectionQuality::Good;
    }
    return ConnectionQuality::Excellent;
}

void CongestionController::removePeer(const PeerId& peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    states_.erase(peer);
}

void CongestionController::updateSettings(const QueueSettings& settings) {
    std::lock_guard<std::mutex> lock(mutex_);
    settings_ = settings;
}

} // namespace nocturne::transport
