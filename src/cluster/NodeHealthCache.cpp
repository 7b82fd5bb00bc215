#include "cluster/NodeHealthCache.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include <algorithm>

namespace chunkvault {

const char *nodeStateName(NodeState state) {
    switch (state) {
        case NodeState::ALIVE: return "ALIVE";
        case NodeState::SUSPECT: return "SUSPECT";
        case NodeState::DEAD: return "DEAD";
    }
    return "UNKNOWN";
}

NodeHealthCache::NodeHealthCache(std::size_t failureTh,
                                 std::size_t successTh,
                                 std::chrono::seconds cooldown)
    : failureThreshold_(std::max<std::size_t>(1, failureTh)),
      successThreshold_(std::max<std::size_t>(1, successTh)),
      cooldown_(cooldown) {}

static int toVal(NodeState s) {
    switch(s) {
        case NodeState::ALIVE: return 1;
        case NodeState::SUSPECT: return 2;
        case NodeState::DEAD: return 3;
    }
    return 0;
}

void NodeHealthCache::publish(const NodeID &id, NodeState state) const {
    MetricsRegistry::instance().setGauge("chunkvault_node_health", toVal(state), {{"node", id}});
    size_t unhealthy = 0;
    for (const auto &kv : map_) {
        if (kv.second.state != NodeState::ALIVE) ++unhealthy;
    }
    MetricsRegistry::instance().setGauge("chunkvault_nodes_unhealthy", static_cast<double>(unhealthy));
}

NodeState NodeHealthCache::state(const NodeID &id) const {
    std::lock_guard<std::mutex> lg(mutex_);
    auto it = map_.find(id);
    if (it == map_.end()) {
        return NodeState::ALIVE;
    }
    return it->second.state;
}

void NodeHealthCache::recordSuccess(const NodeID &id) {
    std::lock_guard<std::mutex> lg(mutex_);
    auto &e = map_[id];
    auto now = SteadyClock::now();
    if (e.state == NodeState::DEAD && (now - e.lastFailure) < cooldown_)
        return;
    e.failures = 0;
    ++e.successes;
    if (e.state != NodeState::ALIVE) {
        if (e.successes >= successThreshold_) {
            Logger::getInstance().log(LogLevel::INFO, "[NodeHealthCache] Node " + id + " " +
                                      nodeStateName(e.state) + " -> ALIVE");
            e.state = NodeState::ALIVE;
            e.successes = 0;
            e.lastChange = now;
        }
    } else {
        e.lastChange = now;
        if (e.successes > successThreshold_) e.successes = successThreshold_;
    }
    publish(id, e.state);
}

void NodeHealthCache::recordFailure(const NodeID &id) {
    std::lock_guard<std::mutex> lg(mutex_);
    auto &e = map_[id];
    auto now = SteadyClock::now();
    e.successes = 0;
    if (e.state == NodeState::DEAD) {
        e.lastFailure = now;
        e.lastChange = now;
        return;
    }
    ++e.failures;
    if (e.failures >= failureThreshold_) {
        e.state = NodeState::DEAD;
        e.failures = 0;
        e.lastChange = now;
        e.lastFailure = now;
        Logger::getInstance().log(LogLevel::WARN, "[NodeHealthCache] Node " + id + " marked DEAD");
        MetricsRegistry::instance().incrementCounter("chunkvault_node_deaths_total", 1.0, {{"node", id}});
    } else {
        e.state = NodeState::SUSPECT;
        e.lastChange = now;
    }
    publish(id, e.state);
}

void NodeHealthCache::forget(const NodeID &id) {
    std::lock_guard<std::mutex> lg(mutex_);
    map_.erase(id);
    MetricsRegistry::instance().setGauge("chunkvault_node_health", 0, {{"node", id}});
}

std::vector<NodeID> NodeHealthCache::getHealthyNodes() const {
    std::lock_guard<std::mutex> lg(mutex_);
    std::vector<NodeID> result;
    result.reserve(map_.size());
    for (const auto &kv : map_) {
        if (kv.second.state == NodeState::ALIVE) {
            result.push_back(kv.first);
        }
    }
    return result;
}

std::unordered_map<NodeID, NodeHealthCache::StateInfo> NodeHealthCache::snapshot() const {
    std::lock_guard<std::mutex> lg(mutex_);
    std::unordered_map<NodeID, StateInfo> res;
    for (const auto &kv : map_) {
        res.emplace(kv.first, StateInfo{kv.second.state, kv.second.lastChange});
    }
    return res;
}

} // namespace chunkvault
