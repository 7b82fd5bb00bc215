#pragma once
#ifndef CHUNKVAULT_PLACEMENT_PLANNER_H
#define CHUNKVAULT_PLACEMENT_PLANNER_H

#include "storage/metadata_repository.h"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * @brief Chooses the nodes that receive the replicas of one chunk.
 */
class PlacementStrategy {
public:
  virtual ~PlacementStrategy() = default;

  /**
   * @brief Pick @p replicationFactor distinct nodes able to hold
   * @p chunkSize bytes.
   * @param excludeNodes Node ids that must not be chosen.
   * @throw InvalidInputError if @p replicationFactor is zero.
   * @throw InsufficientCapacityError if too few nodes are eligible.
   */
  virtual std::vector<std::string>
  plan(uint64_t chunkSize, unsigned int replicationFactor,
       const std::set<std::string> &excludeNodes = {}) const = 0;
};

/**
 * @brief Picks the active nodes with the most free space.
 *
 * Ties on available space are broken by ascending node id so the choice is
 * deterministic for a given fleet state. Nothing is reserved: two concurrent
 * plans may pick the same node, and the node registry's reconciliation
 * corrects any overshoot afterwards.
 */
class GreedyCapacityPlanner : public PlacementStrategy {
public:
  explicit GreedyCapacityPlanner(const MetadataRepository &repo);

  std::vector<std::string>
  plan(uint64_t chunkSize, unsigned int replicationFactor,
       const std::set<std::string> &excludeNodes = {}) const override;

  /// Selection over an explicit node list.
  static std::vector<std::string>
  select(std::vector<StorageNode> nodes, uint64_t chunkSize,
         unsigned int replicationFactor,
         const std::set<std::string> &excludeNodes);

private:
  const MetadataRepository &repo_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_PLACEMENT_PLANNER_H
