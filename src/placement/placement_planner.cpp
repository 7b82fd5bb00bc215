#include "placement/placement_planner.h"
#include "storage/errors.h"
#include "utilities/logger.h"

#include <algorithm>

namespace chunkvault {

GreedyCapacityPlanner::GreedyCapacityPlanner(const MetadataRepository &repo)
    : repo_(repo) {}

std::vector<std::string>
GreedyCapacityPlanner::plan(uint64_t chunkSize, unsigned int replicationFactor,
                            const std::set<std::string> &excludeNodes) const {
  return select(repo_.listNodes(), chunkSize, replicationFactor, excludeNodes);
}

std::vector<std::string>
GreedyCapacityPlanner::select(std::vector<StorageNode> nodes,
                              uint64_t chunkSize,
                              unsigned int replicationFactor,
                              const std::set<std::string> &excludeNodes) {
  if (replicationFactor < 1) {
    throw InvalidInputError("Replication factor must be at least 1");
  }

  nodes.erase(std::remove_if(nodes.begin(), nodes.end(),
                             [&](const StorageNode &n) {
                               return !n.isActive || n.available < chunkSize ||
                                      excludeNodes.count(n.id) > 0;
                             }),
              nodes.end());

  if (nodes.size() < replicationFactor) {
    std::string msg = "Need " + std::to_string(replicationFactor) +
                      " nodes with " + std::to_string(chunkSize) +
                      " bytes free, only " + std::to_string(nodes.size()) +
                      " eligible";
    Logger::getInstance().log(LogLevel::WARN, "[Placement] " + msg);
    throw InsufficientCapacityError(msg, nodes.size(), replicationFactor);
  }

  std::sort(nodes.begin(), nodes.end(),
            [](const StorageNode &a, const StorageNode &b) {
              if (a.available != b.available)
                return a.available > b.available;
              return a.id < b.id;
            });

  std::vector<std::string> chosen;
  chosen.reserve(replicationFactor);
  for (unsigned int i = 0; i < replicationFactor; ++i) {
    chosen.push_back(nodes[i].id);
  }
  return chosen;
}

} // namespace chunkvault
