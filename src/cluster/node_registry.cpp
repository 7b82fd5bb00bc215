#include "cluster/node_registry.h"
#include "storage/errors.h"
#include "utilities/logger.h"
#include "utilities/metrics.h"

namespace chunkvault {

NodeRegistry::NodeRegistry(MetadataRepository &repo,
                           const StorageConfig &config)
    : repo_(repo), heartbeatTimeoutSeconds_(config.heartbeatTimeoutSeconds),
      health_(config.nodeFailureThreshold, config.nodeSuccessThreshold,
              std::chrono::seconds(config.nodeDeadCooldownSeconds)) {}

StorageNode NodeRegistry::registerNode(const std::string &name,
                                       const std::string &host, int port,
                                       uint64_t capacity) {
  if (name.empty()) {
    throw InvalidInputError("Node name must not be empty");
  }
  if (host.empty()) {
    throw InvalidInputError("Node host must not be empty");
  }
  if (port < 0 || port > 65535) {
    throw InvalidInputError("Node port out of range: " + std::to_string(port));
  }
  if (capacity == 0) {
    throw InvalidInputError("Node capacity must be positive");
  }

  StorageNode node;
  node.id = generateId();
  node.name = name;
  node.host = host;
  node.port = port;
  node.capacity = capacity;
  node.available = capacity;
  node.isActive = true;
  node.createdAt = std::time(nullptr);
  node.lastHeartbeat = node.createdAt;
  repo_.insertNode(node);

  Logger::getInstance().log(LogLevel::INFO,
                            "[NodeRegistry] Registered node " + name + " (" +
                                node.id + ") at " + node.address() + " with " +
                                humanReadableSize(capacity));
  publishCapacity(node.id);
  return node;
}

bool NodeRegistry::heartbeatFresh(const StorageNode &node,
                                  std::time_t now) const {
  return now - node.lastHeartbeat <=
         static_cast<std::time_t>(heartbeatTimeoutSeconds_);
}

void NodeRegistry::heartbeat(const std::string &nodeId) {
  std::time_t now = std::time(nullptr);
  repo_.touchHeartbeat(nodeId, now);
  health_.recordSuccess(nodeId);

  StorageNode current = node(nodeId);
  if (!current.isActive && current.available > 0 &&
      health_.state(nodeId) != NodeState::DEAD) {
    repo_.setNodeActive(nodeId, true);
    Logger::getInstance().log(LogLevel::INFO, "[NodeRegistry] Node " +
                                                  current.name +
                                                  " reactivated by heartbeat");
  }
}

std::vector<std::string> NodeRegistry::checkForDeadNodes(std::time_t now) {
  std::vector<std::string> deactivated;
  for (const auto &n : repo_.listNodes()) {
    if (!n.isActive) {
      continue;
    }
    bool dead = health_.state(n.id) == NodeState::DEAD;
    if (dead || !heartbeatFresh(n, now)) {
      repo_.setNodeActive(n.id, false);
      deactivated.push_back(n.id);
      Logger::getInstance().log(
          LogLevel::WARN,
          "[NodeRegistry] Node " + n.name + " deactivated: " +
              (dead ? std::string("health checks failed")
                    : "no heartbeat for " +
                          std::to_string(now - n.lastHeartbeat) + "s"));
    }
  }
  return deactivated;
}

void NodeRegistry::recordTransferSuccess(const std::string &nodeId) {
  health_.recordSuccess(nodeId);
}

void NodeRegistry::recordTransferFailure(const std::string &nodeId) {
  health_.recordFailure(nodeId);
  if (health_.state(nodeId) != NodeState::DEAD) {
    return;
  }
  try {
    repo_.setNodeActive(nodeId, false);
    Logger::getInstance().log(LogLevel::WARN,
                              "[NodeRegistry] Node " + nodeId +
                                  " deactivated after repeated transfer "
                                  "failures");
  } catch (const NotFoundError &e) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              std::string("[NodeRegistry] ") + e.what());
  }
}

uint64_t NodeRegistry::reconcileCapacity(const std::string &nodeId) {
  StorageNode before = node(nodeId);
  uint64_t available = repo_.recomputeAvailable(nodeId);
  if (available != before.available) {
    Logger::getInstance().log(
        LogLevel::INFO, "[NodeRegistry] Node " + before.name +
                            " available corrected from " +
                            std::to_string(before.available) + " to " +
                            std::to_string(available));
  }
  if (available > 0 && !before.isActive &&
      heartbeatFresh(before, std::time(nullptr)) &&
      health_.state(nodeId) != NodeState::DEAD) {
    repo_.setNodeActive(nodeId, true);
  }
  publishCapacity(nodeId);
  return available;
}

void NodeRegistry::reconcileAll() {
  for (const auto &n : repo_.listNodes()) {
    reconcileCapacity(n.id);
  }
}

NodeRemoval NodeRegistry::removeNode(const std::string &nodeId) {
  StorageNode current = node(nodeId);
  if (repo_.deleteNode(nodeId)) {
    health_.forget(nodeId);
    MetricsRegistry::instance().setGauge("chunkvault_node_available_bytes", 0,
                                         {{"node", current.name}});
    Logger::getInstance().log(LogLevel::INFO,
                              "[NodeRegistry] Removed node " + current.name);
    return NodeRemoval::Deleted;
  }
  repo_.setNodeActive(nodeId, false);
  Logger::getInstance().log(LogLevel::WARN,
                            "[NodeRegistry] Node " + current.name +
                                " still owns chunks; deactivated instead of "
                                "removed");
  return NodeRemoval::Deactivated;
}

std::vector<StorageNode> NodeRegistry::listNodes(bool includeInactive) const {
  std::vector<StorageNode> out;
  for (auto &n : repo_.listNodes()) {
    if (includeInactive || n.isActive) {
      out.push_back(std::move(n));
    }
  }
  return out;
}

std::vector<Chunk> NodeRegistry::chunksOnNode(const std::string &nodeId) const {
  node(nodeId);
  return repo_.chunksOnNode(nodeId);
}

StorageNode NodeRegistry::node(const std::string &nodeId) const {
  auto found = repo_.findNode(nodeId);
  if (!found) {
    throw NotFoundError("Unknown storage node: " + nodeId);
  }
  return *found;
}

void NodeRegistry::publishCapacity(const std::string &nodeId) const {
  auto found = repo_.findNode(nodeId);
  if (!found) {
    return;
  }
  MetricsRegistry::instance().setGauge(
      "chunkvault_node_available_bytes",
      static_cast<double>(found->available), {{"node", found->name}});
}

} // namespace chunkvault
