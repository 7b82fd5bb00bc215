#include "replication/replication_coordinator.h"
#include "storage/errors.h"
#include "utilities/checksum.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <thread>

namespace chunkvault {

namespace {

enum class TransferStatus { Stored, Mismatch, Failed };

struct TransferOutcome {
  size_t index{0};
  TransferStatus status{TransferStatus::Failed};
  std::string storedChecksum;
  std::string error;
  double seconds{0};
};

// Shared between the coordinator and its transfer workers. Workers never
// touch anything else, so they may outlive the write call.
struct CompletionQueue {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<TransferOutcome> done;
  std::vector<bool> abandoned;
};

struct TransferJob {
  size_t index{0};
  std::string address;
  std::string key;
  std::string expectedChecksum;
  bool verify{true};
};

void runTransfer(std::shared_ptr<ObjectStoreClient> client,
                 std::shared_ptr<const std::vector<std::byte>> data,
                 std::shared_ptr<CompletionQueue> queue, TransferJob job) {
  auto start = std::chrono::steady_clock::now();
  TransferOutcome outcome;
  outcome.index = job.index;
  bool written = false;
  try {
    client->putObject(job.address, job.key, *data);
    written = true;
    if (job.verify) {
      auto stored = client->getObject(job.address, job.key);
      if (!stored) {
        outcome.status = TransferStatus::Failed;
        outcome.error = "object missing after write";
      } else {
        outcome.storedChecksum = digestBytes(*stored);
        outcome.status = outcome.storedChecksum == job.expectedChecksum
                             ? TransferStatus::Stored
                             : TransferStatus::Mismatch;
      }
    } else {
      outcome.storedChecksum = job.expectedChecksum;
      outcome.status = TransferStatus::Stored;
    }
  } catch (const std::exception &e) {
    outcome.status = TransferStatus::Failed;
    outcome.error = e.what();
  }
  outcome.seconds = std::chrono::duration<double>(
                        std::chrono::steady_clock::now() - start)
                        .count();

  bool abandoned = false;
  {
    std::lock_guard<std::mutex> lock(queue->mutex);
    abandoned = queue->abandoned[job.index];
    if (!abandoned) {
      queue->done.push_back(outcome);
    }
  }
  if (abandoned) {
    if (written) {
      try {
        client->deleteObject(job.address, job.key);
      } catch (const std::exception &e) {
        Logger::getInstance().log(LogLevel::WARN,
                                  "[ReplicationCoordinator] Could not remove "
                                  "late object " +
                                      job.key + " from " + job.address + ": " +
                                      e.what());
      }
    }
    return;
  }
  queue->cv.notify_one();
}

void countReplica(const char *result, double seconds) {
  auto &metrics = MetricsRegistry::instance();
  metrics.incrementCounter("chunkvault_replica_writes_total", 1.0,
                           {{"result", result}});
  metrics.observe("chunkvault_replica_write_seconds", seconds);
}

} // namespace

ReplicationCoordinator::ReplicationCoordinator(
    MetadataRepository &repo, NodeRegistry &registry,
    const PlacementStrategy &planner,
    std::shared_ptr<ObjectStoreClient> client, const StorageConfig &config)
    : repo_(repo), registry_(registry), planner_(planner),
      client_(std::move(client)), config_(config) {}

void ReplicationCoordinator::validate(const File &file, unsigned int ordinal,
                                      uint64_t size,
                                      unsigned int replicationFactor) const {
  if (replicationFactor < 1 ||
      replicationFactor > config_.maxReplicationFactor) {
    throw InvalidInputError(
        "Replication factor " + std::to_string(replicationFactor) +
        " outside [1, " + std::to_string(config_.maxReplicationFactor) + "]");
  }
  if (size > config_.maxChunkSize) {
    throw InvalidInputError("Chunk of " + std::to_string(size) +
                            " bytes exceeds max_chunk_size " +
                            std::to_string(config_.maxChunkSize));
  }
  if (size == 0 && !(ordinal == 0 && file.size == 0)) {
    throw InvalidInputError("Zero-length chunk " + std::to_string(ordinal) +
                            " of non-empty file " + file.id);
  }
}

WriteResult ReplicationCoordinator::write(const std::string &fileId,
                                          unsigned int ordinal,
                                          const std::vector<std::byte> &bytes,
                                          unsigned int replicationFactor) {
  return write(fileId, ordinal,
               std::make_shared<const std::vector<std::byte>>(bytes),
               replicationFactor);
}

WriteResult ReplicationCoordinator::write(
    const std::string &fileId, unsigned int ordinal,
    std::shared_ptr<const std::vector<std::byte>> bytes,
    unsigned int replicationFactor) {
  auto file = repo_.findFile(fileId);
  if (!file) {
    throw NotFoundError("Unknown file: " + fileId);
  }
  validate(*file, ordinal, bytes->size(), replicationFactor);

  WriteResult result;
  result.fileId = fileId;
  result.ordinal = ordinal;
  result.requested = replicationFactor;
  result.checksum = digestBytes(*bytes);

  // Nodes that already hold a live replica of this chunk cannot take another.
  std::set<std::string> exclude;
  for (const auto &c : repo_.chunksForKey(fileId, ordinal)) {
    if (c.status != ChunkStatus::Deleted) {
      exclude.insert(c.nodeId);
    }
  }
  std::vector<std::string> targets =
      planner_.plan(bytes->size(), replicationFactor, exclude);

  const std::string tag =
      "[ReplicationCoordinator] " + fileId + "#" + std::to_string(ordinal);

  std::vector<Chunk> records;
  std::vector<TransferJob> jobs;
  std::time_t now = std::time(nullptr);
  for (const auto &nodeId : targets) {
    auto node = repo_.findNode(nodeId);
    if (!node) {
      Logger::getInstance().log(LogLevel::WARN,
                                tag + " planned node " + nodeId +
                                    " disappeared before the write");
      continue;
    }
    Chunk chunk;
    chunk.id = generateId();
    chunk.fileId = fileId;
    chunk.nodeId = nodeId;
    chunk.ordinal = ordinal;
    chunk.objectKey = makeObjectKey(fileId, ordinal, chunk.id);
    chunk.size = bytes->size();
    chunk.checksum = result.checksum;
    chunk.status = ChunkStatus::Uploading;
    chunk.createdAt = now;
    chunk.updatedAt = now;
    try {
      repo_.insertChunk(chunk);
    } catch (const InvalidInputError &e) {
      // Lost a race with a concurrent writer for the same node.
      Logger::getInstance().log(LogLevel::WARN, tag + " skipping node " +
                                                    nodeId + ": " + e.what());
      continue;
    }

    TransferJob job;
    job.index = records.size();
    job.address = node->address();
    job.key = chunk.objectKey;
    job.expectedChecksum = result.checksum;
    job.verify = config_.verifyAfterWrite;
    jobs.push_back(std::move(job));
    records.push_back(std::move(chunk));
  }

  auto queue = std::make_shared<CompletionQueue>();
  queue->abandoned.assign(records.size(), false);
  for (const auto &job : jobs) {
    std::thread(runTransfer, client_, bytes, queue, job).detach();
  }

  std::vector<bool> handled(records.size(), false);
  std::vector<std::string> corruptedIds;
  unsigned int completed = 0;
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(config_.nodeWriteTimeoutMs);

  size_t pending = records.size();
  while (pending > 0) {
    TransferOutcome outcome;
    {
      std::unique_lock<std::mutex> lock(queue->mutex);
      if (!queue->cv.wait_until(lock, deadline,
                                [&] { return !queue->done.empty(); })) {
        for (size_t i = 0; i < handled.size(); ++i) {
          if (!handled[i])
            queue->abandoned[i] = true;
        }
        break;
      }
      outcome = std::move(queue->done.front());
      queue->done.pop_front();
    }
    --pending;
    handled[outcome.index] = true;
    const Chunk &record = records[outcome.index];
    std::time_t finished = std::time(nullptr);

    switch (outcome.status) {
    case TransferStatus::Stored: {
      repo_.completeReplica(record.id, outcome.storedChecksum, finished);
      if (completed == 0) {
        auto keyLock = repo_.lockChunkKey(fileId, ordinal);
        repo_.designatePrimary(record.id);
      }
      ++completed;
      registry_.recordTransferSuccess(record.nodeId);
      registry_.publishCapacity(record.nodeId);
      countReplica("completed", outcome.seconds);
      break;
    }
    case TransferStatus::Mismatch:
      repo_.recordVerification(record.id, outcome.storedChecksum, finished,
                               true);
      registry_.publishCapacity(record.nodeId);
      corruptedIds.push_back(record.id);
      Logger::getInstance().log(LogLevel::WARN,
                                tag + " replica on node " + record.nodeId +
                                    " read back with digest " +
                                    outcome.storedChecksum + ", expected " +
                                    result.checksum);
      countReplica("corrupted", outcome.seconds);
      break;
    case TransferStatus::Failed:
      repo_.deleteChunk(record.id);
      registry_.recordTransferFailure(record.nodeId);
      Logger::getInstance().log(LogLevel::WARN, tag + " write to node " +
                                                    record.nodeId +
                                                    " failed: " +
                                                    outcome.error);
      countReplica("failed", outcome.seconds);
      break;
    }
  }

  for (size_t i = 0; i < records.size(); ++i) {
    if (handled[i])
      continue;
    repo_.deleteChunk(records[i].id);
    registry_.recordTransferFailure(records[i].nodeId);
    Logger::getInstance().log(
        LogLevel::WARN, tag + " write to node " + records[i].nodeId +
                            " timed out after " +
                            std::to_string(config_.nodeWriteTimeoutMs) + "ms");
    countReplica("timeout",
                 static_cast<double>(config_.nodeWriteTimeoutMs) / 1000.0);
  }

  if (completed == 0) {
    for (const auto &id : corruptedIds) {
      auto chunk = repo_.findChunk(id);
      if (!chunk)
        continue;
      repo_.deleteChunk(id);
      auto node = repo_.findNode(chunk->nodeId);
      if (!node)
        continue;
      repo_.adjustAvailable(node->id, static_cast<int64_t>(chunk->size));
      registry_.publishCapacity(node->id);
      try {
        client_->deleteObject(node->address(), chunk->objectKey);
      } catch (const ObjectStoreError &e) {
        Logger::getInstance().log(LogLevel::WARN,
                                  tag + " could not remove corrupted object " +
                                      chunk->objectKey + ": " + e.what());
      }
    }
    MetricsRegistry::instance().incrementCounter(
        "chunkvault_write_failures_total");
    std::string msg = "No replica of chunk " + std::to_string(ordinal) +
                      " of file " + fileId + " could be written";
    Logger::getInstance().log(LogLevel::ERROR, "[ReplicationCoordinator] " +
                                                   msg);
    throw WriteFailedError(msg, fileId, ordinal);
  }

  for (const auto &record : records) {
    if (auto chunk = repo_.findChunk(record.id)) {
      result.chunks.push_back(*chunk);
    }
  }
  result.achieved = completed;
  if (completed < replicationFactor) {
    result.reducedDurability = true;
    MetricsRegistry::instance().incrementCounter(
        "chunkvault_reduced_durability_total");
    Logger::getInstance().log(LogLevel::WARN,
                              tag + " reduced durability: " +
                                  std::to_string(completed) + " of " +
                                  std::to_string(replicationFactor) +
                                  " replicas written");
  } else {
    Logger::getInstance().log(LogLevel::DEBUG,
                              tag + " written to " + std::to_string(completed) +
                                  " nodes");
  }
  return result;
}

} // namespace chunkvault
