/**
 * @file node_registry.h
 * @brief Fleet membership, liveness and capacity bookkeeping for storage
 * nodes.
 */
#pragma once
#ifndef CHUNKVAULT_NODE_REGISTRY_H
#define CHUNKVAULT_NODE_REGISTRY_H

#include "cluster/NodeHealthCache.h"
#include "storage/metadata_repository.h"
#include "utilities/config.hpp"

#include <ctime>
#include <string>
#include <vector>

namespace chunkvault {

/// Outcome of NodeRegistry::removeNode.
enum class NodeRemoval {
  Deleted,    ///< The node owned no live chunks and is gone.
  Deactivated ///< The node still owns chunks and was only deactivated.
};

/**
 * @brief Registers storage nodes and keeps their active flag and available
 * space consistent with heartbeats, transfer outcomes and chunk records.
 *
 * A node is active only while it has free space, has sent a heartbeat within
 * heartbeat_timeout_seconds and is not DEAD in the health cache.
 */
class NodeRegistry {
public:
  NodeRegistry(MetadataRepository &repo, const StorageConfig &config);

  /**
   * @brief Register a new node with available == capacity.
   * @throw InvalidInputError for an empty or duplicate name, an empty host or
   * a zero capacity.
   */
  StorageNode registerNode(const std::string &name, const std::string &host,
                           int port, uint64_t capacity);

  /**
   * @brief Process a heartbeat: refresh lastHeartbeat, count a health
   * success and reactivate the node if it has space and is not DEAD.
   * @throw NotFoundError for an unknown node.
   */
  void heartbeat(const std::string &nodeId);

  /**
   * @brief Deactivate nodes whose heartbeat is older than the timeout or that
   * the health cache reports DEAD.
   * @return Ids of nodes deactivated by this call.
   */
  std::vector<std::string> checkForDeadNodes(std::time_t now);

  void recordTransferSuccess(const std::string &nodeId);

  /// Counts a failure and deactivates the node once it is DEAD.
  void recordTransferFailure(const std::string &nodeId);

  /**
   * @brief Recompute available space from the chunk records.
   *
   * A node that regains space is reactivated if it is otherwise healthy.
   * @return The recomputed available byte count.
   * @throw NotFoundError for an unknown node.
   */
  uint64_t reconcileCapacity(const std::string &nodeId);
  void reconcileAll();

  /**
   * @brief Remove a node, or only deactivate it while it still owns chunks.
   * @throw NotFoundError for an unknown node.
   */
  NodeRemoval removeNode(const std::string &nodeId);

  std::vector<StorageNode> listNodes(bool includeInactive = false) const;
  std::vector<Chunk> chunksOnNode(const std::string &nodeId) const;

  /** @throw NotFoundError for an unknown node. */
  StorageNode node(const std::string &nodeId) const;

  /** Refresh the chunkvault_node_available_bytes gauge for one node. */
  void publishCapacity(const std::string &nodeId) const;

  NodeHealthCache &health() { return health_; }

private:
  bool heartbeatFresh(const StorageNode &node, std::time_t now) const;

  MetadataRepository &repo_;
  unsigned int heartbeatTimeoutSeconds_;
  NodeHealthCache health_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_NODE_REGISTRY_H
