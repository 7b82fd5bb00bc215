#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @file NodeHealthCache.h
 * @brief Thread-safe liveness tracker fed by chunk transfers and heartbeats.
 */

namespace chunkvault {

using NodeID = std::string;
using SteadyClock = std::chrono::steady_clock;

/**
 * @brief States reported by the health cache.
 */
enum class NodeState { ALIVE, SUSPECT, DEAD };

const char *nodeStateName(NodeState state);

/**
 * @brief Tracks transfer successes and failures for each node.
 *
 * A node starts ALIVE. One failure makes it SUSPECT and failureThreshold
 * consecutive failures make it DEAD. A DEAD node ignores successes until the
 * cooldown since its last failure has elapsed, then needs successThreshold
 * consecutive successes to come back.
 */
class NodeHealthCache {
public:
    struct StateInfo { NodeState state; SteadyClock::time_point lastChange; };

    NodeHealthCache(std::size_t failureThreshold = 2,
                    std::size_t successThreshold = 1,
                    std::chrono::seconds cooldown = std::chrono::seconds(15));

    /** Get the current state of @p id. Unknown nodes are ALIVE. */
    NodeState state(const NodeID &id) const;

    /** Record a successful transfer or heartbeat from @p id. */
    void recordSuccess(const NodeID &id);

    /** Record a failed transfer to @p id. */
    void recordFailure(const NodeID &id);

    /** Drop all history for @p id. */
    void forget(const NodeID &id);

    /** Return all IDs currently considered ALIVE. */
    std::vector<NodeID> getHealthyNodes() const;

    /** Snapshot of the internal map for diagnostics. */
    std::unordered_map<NodeID, StateInfo> snapshot() const;

private:
    struct Entry {
        NodeState state{NodeState::ALIVE};
        std::size_t failures{0};
        std::size_t successes{0};
        SteadyClock::time_point lastChange{SteadyClock::now()};
        SteadyClock::time_point lastFailure{SteadyClock::now()};
    };

    void publish(const NodeID &id, NodeState state) const;

    mutable std::mutex mutex_;
    std::unordered_map<NodeID, Entry> map_;
    const std::size_t failureThreshold_;
    const std::size_t successThreshold_;
    const std::chrono::seconds cooldown_;
};

} // namespace chunkvault
