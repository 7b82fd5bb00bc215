#include "files/file_service.h"
#include "storage/errors.h"
#include "utilities/checksum.hpp"
#include "utilities/chunker.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <deque>
#include <future>
#include <map>
#include <set>

namespace chunkvault {

FileService::FileService(MetadataRepository &repo, NodeRegistry &registry,
                         ReplicationCoordinator &coordinator,
                         std::shared_ptr<ObjectStoreClient> client,
                         const StorageConfig &config)
    : repo_(repo), registry_(registry), coordinator_(coordinator),
      client_(std::move(client)), config_(config) {}

UploadResult FileService::upload(std::istream &source,
                                 const UploadRequest &request) {
  if (request.name.empty()) {
    throw InvalidInputError("File name must not be empty");
  }
  uint64_t chunkSize =
      request.chunkSize ? request.chunkSize : config_.chunkSize;
  unsigned int replicas = request.replicationFactor
                              ? request.replicationFactor
                              : config_.replicationFactor;
  validateChunkSize(chunkSize, config_.chunkAlignment, config_.maxChunkSize);
  if (replicas > config_.maxReplicationFactor) {
    throw InvalidInputError("Replication factor " + std::to_string(replicas) +
                            " exceeds max_replication_factor " +
                            std::to_string(config_.maxReplicationFactor));
  }

  std::streampos start = source.tellg();
  if (start == std::streampos(-1)) {
    throw InvalidInputError("Upload source for " + request.name +
                            " is not seekable");
  }
  uint64_t size = 0;
  std::string checksum = digestStream(source, &size);
  source.clear();
  source.seekg(start);
  if (!source) {
    throw InvalidInputError("Upload source for " + request.name +
                            " could not be rewound");
  }

  UploadResult result;
  std::time_t now = std::time(nullptr);
  auto existing =
      repo_.findFileByIdentity(request.name, checksum, request.owner);
  if (existing && !existing->isDeleted) {
    Logger::getInstance().log(LogLevel::INFO,
                              "[FileService] " + request.name +
                                  " already stored as " + existing->id);
    result.file = *existing;
    result.deduplicated = true;
    return result;
  }

  bool created = false;
  File file;
  if (existing) {
    // Same content was deleted earlier: drop its old chunks and rewrite.
    collectGarbage(existing->id);
    file = *existing;
    file.size = size;
    file.contentType = request.contentType;
  } else {
    file.id = generateId();
    file.name = request.name;
    file.size = size;
    file.checksum = checksum;
    file.contentType = request.contentType;
    file.owner = request.owner;
    file.createdAt = now;
    file.updatedAt = now;
    if (!repo_.insertFile(file)) {
      auto winner =
          repo_.findFileByIdentity(request.name, checksum, request.owner);
      if (winner && !winner->isDeleted) {
        result.file = *winner;
        result.deduplicated = true;
        return result;
      }
      throw InvalidInputError("Conflicting upload in progress for " +
                              request.name);
    }
    created = true;
  }

  Logger::getInstance().log(LogLevel::INFO,
                            "[FileService] Uploading " + request.name + " (" +
                                file.id + ", " + humanReadableSize(size) +
                                ") in chunks of " + std::to_string(chunkSize) +
                                " x" + std::to_string(replicas));

  const size_t parallelism = std::max(1u, config_.uploadParallelism);
  std::deque<std::future<WriteResult>> inflight;
  auto collectOldest = [&]() {
    std::future<WriteResult> next = std::move(inflight.front());
    inflight.pop_front();
    result.chunks.push_back(next.get());
  };

  try {
    ChunkReader reader(source, chunkSize, config_.chunkAlignment,
                       config_.maxChunkSize);
    while (auto piece = reader.next()) {
      auto bytes = std::make_shared<const std::vector<std::byte>>(
          std::move(piece->bytes));
      unsigned int ordinal = piece->ordinal;
      inflight.push_back(std::async(
          std::launch::async, [this, fileId = file.id, ordinal, bytes,
                               replicas]() {
            return coordinator_.write(fileId, ordinal, bytes, replicas);
          }));
      if (inflight.size() >= parallelism) {
        collectOldest();
      }
    }
    while (!inflight.empty()) {
      collectOldest();
    }
    if (reader.bytesRead() != size) {
      throw StreamError("Upload source for " + request.name +
                        " changed between digest and chunking (" +
                        std::to_string(size) + " vs " +
                        std::to_string(reader.bytesRead()) + " bytes)");
    }
  } catch (const std::exception &e) {
    for (auto &pending : inflight) {
      pending.wait();
    }
    Logger::getInstance().log(LogLevel::ERROR, "[FileService] Upload of " +
                                                   request.name +
                                                   " failed: " + e.what());
    collectGarbage(file.id);
    if (created) {
      repo_.deleteFile(file.id);
    }
    throw;
  }

  if (existing) {
    file.isDeleted = false;
    file.deletedAt.reset();
  }
  file.updatedAt = std::time(nullptr);
  repo_.updateFile(file);

  for (const auto &w : result.chunks) {
    result.reducedDurability = result.reducedDurability || w.reducedDurability;
  }
  if (result.reducedDurability) {
    Logger::getInstance().log(LogLevel::WARN,
                              "[FileService] " + request.name +
                                  " stored with reduced durability");
  }
  result.file = file;
  return result;
}

bool FileService::isAvailable(const std::string &fileId) const {
  auto f = repo_.findFile(fileId);
  if (!f || f->isDeleted) {
    return false;
  }
  // One completed replica size per ordinal.
  std::map<unsigned int, uint64_t> complete;
  for (const auto &c : repo_.chunksForFile(fileId)) {
    if (c.status == ChunkStatus::Completed) {
      complete.emplace(c.ordinal, c.size);
    }
  }
  if (complete.empty() || complete.rbegin()->first + 1 != complete.size()) {
    return false;
  }
  // A missing trailing ordinal leaves the sum short of the file size.
  uint64_t total = 0;
  for (const auto &[ordinal, size] : complete) {
    total += size;
  }
  return total == f->size;
}

File FileService::softDelete(const std::string &fileId) {
  File f = file(fileId);
  if (!f.isDeleted) {
    f.isDeleted = true;
    f.deletedAt = std::time(nullptr);
    f.updatedAt = *f.deletedAt;
    repo_.updateFile(f);
    Logger::getInstance().log(LogLevel::INFO,
                              "[FileService] Soft-deleted " + f.name);
  }
  return f;
}

File FileService::undelete(const std::string &fileId) {
  File f = file(fileId);
  if (f.isDeleted) {
    f.isDeleted = false;
    f.deletedAt.reset();
    f.updatedAt = std::time(nullptr);
    repo_.updateFile(f);
    Logger::getInstance().log(LogLevel::INFO,
                              "[FileService] Restored deleted file " + f.name);
  }
  return f;
}

CollectionStats FileService::collectGarbage(const std::string &fileId) {
  file(fileId);
  CollectionStats stats;
  std::set<std::string> affected;
  for (auto chunk : repo_.chunksForFile(fileId)) {
    if (chunk.status == ChunkStatus::Deleted) {
      continue;
    }
    if (auto node = repo_.findNode(chunk.nodeId)) {
      try {
        if (client_->deleteObject(node->address(), chunk.objectKey)) {
          ++stats.objectsRemoved;
        } else {
          ++stats.objectsMissing;
        }
      } catch (const ObjectStoreError &e) {
        ++stats.objectsFailed;
        Logger::getInstance().log(LogLevel::WARN,
                                  "[FileService] Could not remove " +
                                      chunk.objectKey + " from node " +
                                      node->name + ": " + e.what());
      }
      affected.insert(node->id);
    }
    if (chunk.status == ChunkStatus::Completed ||
        chunk.status == ChunkStatus::Corrupted) {
      stats.bytesReclaimed += chunk.size;
    }
    chunk.status = ChunkStatus::Deleted;
    chunk.isPrimary = false;
    chunk.updatedAt = std::time(nullptr);
    repo_.updateChunk(chunk);
    ++stats.chunksCollected;
  }
  for (const auto &nodeId : affected) {
    try {
      registry_.reconcileCapacity(nodeId);
    } catch (const NotFoundError &e) {
      Logger::getInstance().log(LogLevel::DEBUG,
                                std::string("[FileService] ") + e.what());
    }
  }
  if (stats.chunksCollected > 0) {
    Logger::getInstance().log(
        LogLevel::INFO, "[FileService] Collected " +
                            std::to_string(stats.chunksCollected) +
                            " replicas of " + fileId + ", reclaimed " +
                            humanReadableSize(stats.bytesReclaimed));
  }
  return stats;
}

CollectionStats FileService::purge(const std::string &fileId) {
  CollectionStats stats = collectGarbage(fileId);
  repo_.deleteFile(fileId);
  Logger::getInstance().log(LogLevel::INFO,
                            "[FileService] Purged file " + fileId);
  return stats;
}

File FileService::file(const std::string &fileId) const {
  auto f = repo_.findFile(fileId);
  if (!f) {
    throw NotFoundError("Unknown file: " + fileId);
  }
  return *f;
}

std::vector<File> FileService::listFiles(const std::string &owner,
                                         bool includeDeleted) const {
  std::vector<File> out;
  for (auto &f : repo_.listFiles()) {
    if (!owner.empty() && f.owner != owner)
      continue;
    if (f.isDeleted && !includeDeleted)
      continue;
    out.push_back(std::move(f));
  }
  return out;
}

std::vector<File> FileService::largeFiles(uint64_t minBytes) const {
  std::vector<File> out;
  for (auto &f : repo_.listFiles()) {
    if (!f.isDeleted && f.size >= minBytes)
      out.push_back(std::move(f));
  }
  std::stable_sort(out.begin(), out.end(), [](const File &a, const File &b) {
    return a.size > b.size;
  });
  return out;
}

std::vector<Chunk> FileService::chunksOf(const std::string &fileId) const {
  file(fileId);
  return repo_.chunksForFile(fileId);
}

} // namespace chunkvault
