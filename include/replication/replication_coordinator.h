/**
 * @file replication_coordinator.h
 * @brief Writes one chunk to several storage nodes and records the outcome.
 */
#pragma once
#ifndef CHUNKVAULT_REPLICATION_COORDINATOR_H
#define CHUNKVAULT_REPLICATION_COORDINATOR_H

#include "cluster/node_registry.h"
#include "node/object_store.h"
#include "placement/placement_planner.h"
#include "storage/metadata_repository.h"
#include "utilities/config.hpp"

#include <memory>
#include <string>
#include <vector>

namespace chunkvault {

/// Result of replicating one chunk.
struct WriteResult {
  std::string fileId;
  unsigned int ordinal{0};
  std::string checksum;     ///< Digest of the bytes that were sent.
  std::vector<Chunk> chunks; ///< Completed and corrupted replicas kept.
  unsigned int requested{0};
  unsigned int achieved{0}; ///< Replicas that reached completed.
  bool reducedDurability{false};
};

/**
 * @brief Fans a chunk out to the nodes chosen by the placement strategy.
 *
 * Each transfer runs on its own detached worker thread that holds only
 * shared state, so a transfer that overruns node_write_timeout_ms is dropped
 * from the write without being waited on. Objects written by such a late
 * transfer are removed by the worker once it finishes.
 *
 * The first replica to complete becomes primary for its (file, ordinal);
 * capacity is charged per completed replica in the same transaction that
 * completes it.
 */
class ReplicationCoordinator {
public:
  ReplicationCoordinator(MetadataRepository &repo, NodeRegistry &registry,
                         const PlacementStrategy &planner,
                         std::shared_ptr<ObjectStoreClient> client,
                         const StorageConfig &config);

  /**
   * @brief Replicate @p bytes as chunk @p ordinal of @p fileId.
   *
   * @throw InvalidInputError for a bad replication factor or chunk size.
   * @throw NotFoundError if the file does not exist.
   * @throw InsufficientCapacityError if placement fails; nothing is recorded.
   * @throw WriteFailedError if no replica completed; every record created by
   * the attempt is removed.
   */
  WriteResult write(const std::string &fileId, unsigned int ordinal,
                    const std::vector<std::byte> &bytes,
                    unsigned int replicationFactor);

  /// As above, taking ownership of the chunk bytes.
  WriteResult write(const std::string &fileId, unsigned int ordinal,
                    std::shared_ptr<const std::vector<std::byte>> bytes,
                    unsigned int replicationFactor);

private:
  void validate(const File &file, unsigned int ordinal, uint64_t size,
                unsigned int replicationFactor) const;

  MetadataRepository &repo_;
  NodeRegistry &registry_;
  const PlacementStrategy &planner_;
  std::shared_ptr<ObjectStoreClient> client_;
  StorageConfig config_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_REPLICATION_COORDINATOR_H
