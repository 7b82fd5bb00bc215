#include "storage/memory_metadata_repository.h"
#include "storage/errors.h"
#include "utilities/logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <yaml-cpp/yaml.h>

namespace chunkvault {

namespace {

bool sameKey(const Chunk &a, const std::string &fileId, unsigned int ordinal) {
  return a.fileId == fileId && a.ordinal == ordinal;
}

bool byOrdinalThenNode(const Chunk &a, const Chunk &b) {
  if (a.ordinal != b.ordinal)
    return a.ordinal < b.ordinal;
  return a.nodeId < b.nodeId;
}

template <typename T>
T field(const YAML::Node &node, const char *key, T fallback = T{}) {
  return node[key] ? node[key].as<T>() : fallback;
}

} // namespace

// ---- Storage nodes ----

void MemoryMetadataRepository::insertNode(const StorageNode &node) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (nodes_.count(node.id)) {
    throw InvalidInputError("Node id already registered: " + node.id);
  }
  for (const auto &entry : nodes_) {
    if (entry.second.name == node.name) {
      throw InvalidInputError("Node name already registered: " + node.name);
    }
  }
  if (node.available > node.capacity) {
    throw InvalidInputError("Node available space exceeds capacity: " +
                            node.name);
  }
  nodes_.emplace(node.id, node);
}

std::optional<StorageNode>
MemoryMetadataRepository::findNode(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(id);
  if (it == nodes_.end())
    return std::nullopt;
  return it->second;
}

std::optional<StorageNode>
MemoryMetadataRepository::findNodeByName(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &entry : nodes_) {
    if (entry.second.name == name)
      return entry.second;
  }
  return std::nullopt;
}

std::vector<StorageNode> MemoryMetadataRepository::listNodes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<StorageNode> out;
  out.reserve(nodes_.size());
  for (const auto &entry : nodes_)
    out.push_back(entry.second);
  return out;
}

void MemoryMetadataRepository::touchHeartbeat(const std::string &id,
                                              std::time_t when) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(id);
  if (it == nodes_.end())
    throw NotFoundError("Unknown node: " + id);
  it->second.lastHeartbeat = when;
}

void MemoryMetadataRepository::setNodeActive(const std::string &id,
                                             bool active) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(id);
  if (it == nodes_.end())
    throw NotFoundError("Unknown node: " + id);
  it->second.isActive = active;
}

uint64_t MemoryMetadataRepository::adjustAvailable(const std::string &id,
                                                   int64_t delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(id);
  if (it == nodes_.end())
    throw NotFoundError("Unknown node: " + id);
  return adjustAvailableLocked(it->second, delta);
}

uint64_t MemoryMetadataRepository::adjustAvailableLocked(StorageNode &node,
                                                         int64_t delta) {
  if (delta < 0) {
    uint64_t dec = static_cast<uint64_t>(-(delta + 1)) + 1;
    node.available = dec >= node.available ? 0 : node.available - dec;
  } else {
    uint64_t inc = static_cast<uint64_t>(delta);
    node.available = inc >= node.capacity - node.available
                         ? node.capacity
                         : node.available + inc;
  }
  if (node.available == 0)
    node.isActive = false;
  return node.available;
}

uint64_t MemoryMetadataRepository::usedBytesLocked(
    const std::string &nodeId) const {
  uint64_t used = 0;
  for (const auto &entry : chunks_) {
    const Chunk &c = entry.second;
    // Uploading rows are charged by completeReplica, not here.
    if (c.nodeId == nodeId && (c.status == ChunkStatus::Completed ||
                               c.status == ChunkStatus::Corrupted))
      used += c.size;
  }
  return used;
}

uint64_t MemoryMetadataRepository::recomputeAvailable(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(id);
  if (it == nodes_.end())
    throw NotFoundError("Unknown node: " + id);
  StorageNode &node = it->second;
  uint64_t used = usedBytesLocked(id);
  node.available = used >= node.capacity ? 0 : node.capacity - used;
  if (node.available == 0)
    node.isActive = false;
  return node.available;
}

bool MemoryMetadataRepository::deleteNode(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(id);
  if (it == nodes_.end())
    return false;
  for (const auto &entry : chunks_) {
    if (entry.second.nodeId == id &&
        entry.second.status != ChunkStatus::Deleted) {
      return false;
    }
  }
  // Deleted-status rows are tombstones only; drop them with the node.
  for (auto c = chunks_.begin(); c != chunks_.end();) {
    if (c->second.nodeId == id)
      c = chunks_.erase(c);
    else
      ++c;
  }
  nodes_.erase(it);
  return true;
}

// ---- Files ----

bool MemoryMetadataRepository::insertFile(const File &file) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (files_.count(file.id))
    return false;
  for (const auto &entry : files_) {
    const File &f = entry.second;
    if (f.name == file.name && f.checksum == file.checksum &&
        f.owner == file.owner) {
      return false;
    }
  }
  files_.emplace(file.id, file);
  return true;
}

std::optional<File>
MemoryMetadataRepository::findFile(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = files_.find(id);
  if (it == files_.end())
    return std::nullopt;
  return it->second;
}

std::optional<File> MemoryMetadataRepository::findFileByIdentity(
    const std::string &name, const std::string &checksum,
    const std::string &owner) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &entry : files_) {
    const File &f = entry.second;
    if (f.name == name && f.checksum == checksum && f.owner == owner)
      return f;
  }
  return std::nullopt;
}

std::vector<File> MemoryMetadataRepository::listFiles() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<File> out;
  out.reserve(files_.size());
  for (const auto &entry : files_)
    out.push_back(entry.second);
  std::sort(out.begin(), out.end(), [](const File &a, const File &b) {
    if (a.createdAt != b.createdAt)
      return a.createdAt > b.createdAt;
    return a.id < b.id;
  });
  return out;
}

void MemoryMetadataRepository::updateFile(const File &file) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = files_.find(file.id);
  if (it == files_.end())
    throw NotFoundError("Unknown file: " + file.id);
  it->second = file;
}

bool MemoryMetadataRepository::deleteFile(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = files_.find(id);
  if (it == files_.end())
    return false;
  for (auto c = chunks_.begin(); c != chunks_.end();) {
    if (c->second.fileId == id)
      c = chunks_.erase(c);
    else
      ++c;
  }
  for (auto v = versions_.begin(); v != versions_.end();) {
    if (v->second.fileId == id)
      v = versions_.erase(v);
    else
      ++v;
  }
  files_.erase(it);
  return true;
}

// ---- Chunks ----

void MemoryMetadataRepository::insertChunk(const Chunk &chunk) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!files_.count(chunk.fileId))
    throw InvalidInputError("Chunk references unknown file: " + chunk.fileId);
  if (!nodes_.count(chunk.nodeId))
    throw InvalidInputError("Chunk references unknown node: " + chunk.nodeId);
  if (chunks_.count(chunk.id))
    throw InvalidInputError("Chunk id already exists: " + chunk.id);
  for (const auto &entry : chunks_) {
    const Chunk &c = entry.second;
    if (sameKey(c, chunk.fileId, chunk.ordinal) && c.nodeId == chunk.nodeId &&
        c.status != ChunkStatus::Deleted) {
      throw InvalidInputError("Replica already exists for " + chunk.fileId +
                              "#" + std::to_string(chunk.ordinal) +
                              " on node " + chunk.nodeId);
    }
  }
  chunks_.emplace(chunk.id, chunk);
}

std::optional<Chunk>
MemoryMetadataRepository::findChunk(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = chunks_.find(id);
  if (it == chunks_.end())
    return std::nullopt;
  return it->second;
}

std::vector<Chunk>
MemoryMetadataRepository::chunksForFile(const std::string &fileId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Chunk> out;
  for (const auto &entry : chunks_) {
    if (entry.second.fileId == fileId)
      out.push_back(entry.second);
  }
  std::sort(out.begin(), out.end(), byOrdinalThenNode);
  return out;
}

std::vector<Chunk>
MemoryMetadataRepository::chunksForKey(const std::string &fileId,
                                       unsigned int ordinal) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Chunk> out;
  for (const auto &entry : chunks_) {
    if (sameKey(entry.second, fileId, ordinal))
      out.push_back(entry.second);
  }
  std::sort(out.begin(), out.end(), byOrdinalThenNode);
  return out;
}

std::vector<Chunk>
MemoryMetadataRepository::chunksOnNode(const std::string &nodeId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Chunk> out;
  for (const auto &entry : chunks_) {
    if (entry.second.nodeId == nodeId)
      out.push_back(entry.second);
  }
  return out;
}

std::vector<Chunk> MemoryMetadataRepository::listChunks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Chunk> out;
  out.reserve(chunks_.size());
  for (const auto &entry : chunks_)
    out.push_back(entry.second);
  return out;
}

Chunk &MemoryMetadataRepository::chunkLocked(const std::string &id) {
  auto it = chunks_.find(id);
  if (it == chunks_.end())
    throw NotFoundError("Unknown chunk: " + id);
  return it->second;
}

void MemoryMetadataRepository::updateChunk(const Chunk &chunk) {
  std::lock_guard<std::mutex> lock(mutex_);
  chunkLocked(chunk.id) = chunk;
}

bool MemoryMetadataRepository::deleteChunk(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.erase(id) > 0;
}

Chunk MemoryMetadataRepository::completeReplica(
    const std::string &chunkId, const std::string &storedChecksum,
    std::time_t verifiedAt) {
  std::lock_guard<std::mutex> lock(mutex_);
  Chunk &chunk = chunkLocked(chunkId);
  auto nodeIt = nodes_.find(chunk.nodeId);
  if (nodeIt == nodes_.end())
    throw NotFoundError("Unknown node: " + chunk.nodeId);

  bool charge = chunk.status != ChunkStatus::Completed;
  chunk.status = ChunkStatus::Completed;
  chunk.storedChecksum = storedChecksum;
  chunk.lastVerifiedAt = verifiedAt;
  chunk.updatedAt = verifiedAt;

  if (charge)
    adjustAvailableLocked(nodeIt->second, -static_cast<int64_t>(chunk.size));
  return chunk;
}

void MemoryMetadataRepository::designatePrimary(const std::string &chunkId) {
  std::lock_guard<std::mutex> lock(mutex_);
  Chunk &target = chunkLocked(chunkId);
  for (auto &entry : chunks_) {
    Chunk &c = entry.second;
    if (sameKey(c, target.fileId, target.ordinal))
      c.isPrimary = (c.id == chunkId);
  }
}

Chunk MemoryMetadataRepository::recordVerification(
    const std::string &chunkId, const std::string &storedChecksum,
    std::time_t verifiedAt, bool corrupted) {
  std::lock_guard<std::mutex> lock(mutex_);
  Chunk &chunk = chunkLocked(chunkId);
  chunk.storedChecksum = storedChecksum;
  chunk.lastVerifiedAt = verifiedAt;
  chunk.updatedAt = verifiedAt;
  if (corrupted) {
    // An upload that fails read-back still occupies the node.
    if (chunk.status == ChunkStatus::Uploading) {
      auto nodeIt = nodes_.find(chunk.nodeId);
      if (nodeIt != nodes_.end())
        adjustAvailableLocked(nodeIt->second,
                              -static_cast<int64_t>(chunk.size));
    }
    chunk.status = ChunkStatus::Corrupted;
  }
  return chunk;
}

// ---- Versions ----

FileVersion MemoryMetadataRepository::appendVersion(
    const std::string &fileId, uint64_t size, const std::string &checksum,
    const std::string &createdBy, const std::string &notes,
    std::time_t createdAt) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!files_.count(fileId))
    throw NotFoundError("Unknown file: " + fileId);
  unsigned int highest = 0;
  for (const auto &entry : versions_) {
    if (entry.second.fileId == fileId)
      highest = std::max(highest, entry.second.versionNumber);
  }
  FileVersion v;
  v.id = generateId();
  v.fileId = fileId;
  v.versionNumber = highest + 1;
  v.size = size;
  v.checksum = checksum;
  v.createdAt = createdAt;
  v.createdBy = createdBy;
  v.notes = notes;
  versions_.emplace(v.id, v);
  return v;
}

std::optional<FileVersion>
MemoryMetadataRepository::findVersion(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = versions_.find(id);
  if (it == versions_.end())
    return std::nullopt;
  return it->second;
}

std::vector<FileVersion>
MemoryMetadataRepository::versionsForFile(const std::string &fileId) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<FileVersion> out;
  for (const auto &entry : versions_) {
    if (entry.second.fileId == fileId)
      out.push_back(entry.second);
  }
  std::sort(out.begin(), out.end(),
            [](const FileVersion &a, const FileVersion &b) {
              return a.versionNumber > b.versionNumber;
            });
  return out;
}

// ---- Named locks ----

std::shared_ptr<std::mutex>
MemoryMetadataRepository::namedLock(const std::string &key) {
  std::lock_guard<std::mutex> guard(lockMapMutex_);
  auto it = namedLocks_.find(key);
  if (it == namedLocks_.end()) {
    it = namedLocks_.emplace(key, std::make_shared<std::mutex>()).first;
  }
  return it->second;
}

MetadataRepository::KeyLock
MemoryMetadataRepository::lockChunkKey(const std::string &fileId,
                                       unsigned int ordinal) {
  // Entries are never erased, so the mutex outlives the returned lock.
  return KeyLock(*namedLock("chunk:" + fileId + "#" + std::to_string(ordinal)));
}

MetadataRepository::KeyLock
MemoryMetadataRepository::lockFile(const std::string &fileId) {
  return KeyLock(*namedLock("file:" + fileId));
}

// ---- Snapshot ----

void MemoryMetadataRepository::saveSnapshot(const std::string &path) const {
  YAML::Emitter out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out << YAML::BeginMap;

    out << YAML::Key << "nodes" << YAML::Value << YAML::BeginSeq;
    for (const auto &entry : nodes_) {
      const StorageNode &n = entry.second;
      out << YAML::BeginMap;
      out << YAML::Key << "id" << YAML::Value << n.id;
      out << YAML::Key << "name" << YAML::Value << n.name;
      out << YAML::Key << "host" << YAML::Value << n.host;
      out << YAML::Key << "port" << YAML::Value << n.port;
      out << YAML::Key << "capacity" << YAML::Value << n.capacity;
      out << YAML::Key << "available" << YAML::Value << n.available;
      out << YAML::Key << "is_active" << YAML::Value << n.isActive;
      out << YAML::Key << "last_heartbeat" << YAML::Value
          << static_cast<long long>(n.lastHeartbeat);
      out << YAML::Key << "created_at" << YAML::Value
          << static_cast<long long>(n.createdAt);
      out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "files" << YAML::Value << YAML::BeginSeq;
    for (const auto &entry : files_) {
      const File &f = entry.second;
      out << YAML::BeginMap;
      out << YAML::Key << "id" << YAML::Value << f.id;
      out << YAML::Key << "name" << YAML::Value << f.name;
      out << YAML::Key << "size" << YAML::Value << f.size;
      out << YAML::Key << "checksum" << YAML::Value << f.checksum;
      out << YAML::Key << "content_type" << YAML::Value << f.contentType;
      out << YAML::Key << "owner" << YAML::Value << f.owner;
      out << YAML::Key << "is_deleted" << YAML::Value << f.isDeleted;
      if (f.deletedAt) {
        out << YAML::Key << "deleted_at" << YAML::Value
            << static_cast<long long>(*f.deletedAt);
      }
      out << YAML::Key << "created_at" << YAML::Value
          << static_cast<long long>(f.createdAt);
      out << YAML::Key << "updated_at" << YAML::Value
          << static_cast<long long>(f.updatedAt);
      out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "chunks" << YAML::Value << YAML::BeginSeq;
    for (const auto &entry : chunks_) {
      const Chunk &c = entry.second;
      out << YAML::BeginMap;
      out << YAML::Key << "id" << YAML::Value << c.id;
      out << YAML::Key << "file_id" << YAML::Value << c.fileId;
      out << YAML::Key << "node_id" << YAML::Value << c.nodeId;
      out << YAML::Key << "object_key" << YAML::Value << c.objectKey;
      out << YAML::Key << "ordinal" << YAML::Value << c.ordinal;
      out << YAML::Key << "size" << YAML::Value << c.size;
      out << YAML::Key << "checksum" << YAML::Value << c.checksum;
      out << YAML::Key << "stored_checksum" << YAML::Value << c.storedChecksum;
      out << YAML::Key << "is_primary" << YAML::Value << c.isPrimary;
      out << YAML::Key << "status" << YAML::Value
          << chunkStatusToString(c.status);
      if (c.lastVerifiedAt) {
        out << YAML::Key << "last_verified_at" << YAML::Value
            << static_cast<long long>(*c.lastVerifiedAt);
      }
      out << YAML::Key << "created_at" << YAML::Value
          << static_cast<long long>(c.createdAt);
      out << YAML::Key << "updated_at" << YAML::Value
          << static_cast<long long>(c.updatedAt);
      out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "versions" << YAML::Value << YAML::BeginSeq;
    for (const auto &entry : versions_) {
      const FileVersion &v = entry.second;
      out << YAML::BeginMap;
      out << YAML::Key << "id" << YAML::Value << v.id;
      out << YAML::Key << "file_id" << YAML::Value << v.fileId;
      out << YAML::Key << "version_number" << YAML::Value << v.versionNumber;
      out << YAML::Key << "size" << YAML::Value << v.size;
      out << YAML::Key << "checksum" << YAML::Value << v.checksum;
      out << YAML::Key << "created_at" << YAML::Value
          << static_cast<long long>(v.createdAt);
      out << YAML::Key << "created_by" << YAML::Value << v.createdBy;
      out << YAML::Key << "notes" << YAML::Value << v.notes;
      out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
  }

  std::filesystem::path target(path);
  if (target.has_parent_path()) {
    std::filesystem::create_directories(target.parent_path());
  }
  std::string tmp = path + ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::trunc);
    if (!ofs.is_open()) {
      throw std::runtime_error("Could not open " + tmp + " for writing");
    }
    ofs << out.c_str() << "\n";
    if (!ofs) {
      throw std::runtime_error("Failed writing metadata snapshot " + tmp);
    }
  }
  std::filesystem::rename(tmp, target);
  Logger::getInstance().log(LogLevel::DEBUG,
                            "[MetadataRepository] Saved snapshot to " + path);
}

bool MemoryMetadataRepository::loadSnapshot(const std::string &path) {
  std::lock_guard<std::mutex> lock(mutex_);
  nodes_.clear();
  files_.clear();
  chunks_.clear();
  versions_.clear();
  if (!std::filesystem::exists(path)) {
    return false;
  }

  try {
    YAML::Node doc = YAML::LoadFile(path);
    for (const auto &n : doc["nodes"]) {
      StorageNode node;
      node.id = field<std::string>(n, "id");
      node.name = field<std::string>(n, "name");
      node.host = field<std::string>(n, "host");
      node.port = field<int>(n, "port");
      node.capacity = field<uint64_t>(n, "capacity");
      node.available = field<uint64_t>(n, "available");
      node.isActive = field<bool>(n, "is_active", true);
      node.lastHeartbeat =
          static_cast<std::time_t>(field<long long>(n, "last_heartbeat"));
      node.createdAt =
          static_cast<std::time_t>(field<long long>(n, "created_at"));
      nodes_.emplace(node.id, node);
    }
    for (const auto &f : doc["files"]) {
      File file;
      file.id = field<std::string>(f, "id");
      file.name = field<std::string>(f, "name");
      file.size = field<uint64_t>(f, "size");
      file.checksum = field<std::string>(f, "checksum");
      file.contentType = field<std::string>(f, "content_type");
      file.owner = field<std::string>(f, "owner");
      file.isDeleted = field<bool>(f, "is_deleted");
      if (f["deleted_at"]) {
        file.deletedAt =
            static_cast<std::time_t>(f["deleted_at"].as<long long>());
      }
      file.createdAt =
          static_cast<std::time_t>(field<long long>(f, "created_at"));
      file.updatedAt =
          static_cast<std::time_t>(field<long long>(f, "updated_at"));
      files_.emplace(file.id, file);
    }
    for (const auto &c : doc["chunks"]) {
      Chunk chunk;
      chunk.id = field<std::string>(c, "id");
      chunk.fileId = field<std::string>(c, "file_id");
      chunk.nodeId = field<std::string>(c, "node_id");
      chunk.objectKey = field<std::string>(c, "object_key");
      chunk.ordinal = field<unsigned int>(c, "ordinal");
      chunk.size = field<uint64_t>(c, "size");
      chunk.checksum = field<std::string>(c, "checksum");
      chunk.storedChecksum = field<std::string>(c, "stored_checksum");
      chunk.isPrimary = field<bool>(c, "is_primary");
      chunk.status = chunkStatusFromString(
          field<std::string>(c, "status", "uploading"));
      if (c["last_verified_at"]) {
        chunk.lastVerifiedAt =
            static_cast<std::time_t>(c["last_verified_at"].as<long long>());
      }
      chunk.createdAt =
          static_cast<std::time_t>(field<long long>(c, "created_at"));
      chunk.updatedAt =
          static_cast<std::time_t>(field<long long>(c, "updated_at"));
      chunks_.emplace(chunk.id, chunk);
    }
    for (const auto &v : doc["versions"]) {
      FileVersion version;
      version.id = field<std::string>(v, "id");
      version.fileId = field<std::string>(v, "file_id");
      version.versionNumber = field<unsigned int>(v, "version_number");
      version.size = field<uint64_t>(v, "size");
      version.checksum = field<std::string>(v, "checksum");
      version.createdAt =
          static_cast<std::time_t>(field<long long>(v, "created_at"));
      version.createdBy = field<std::string>(v, "created_by");
      version.notes = field<std::string>(v, "notes");
      versions_.emplace(version.id, version);
    }
  } catch (const YAML::Exception &e) {
    nodes_.clear();
    files_.clear();
    chunks_.clear();
    versions_.clear();
    throw InvalidInputError("Malformed metadata snapshot " + path + ": " +
                            e.what());
  } catch (const InvalidInputError &) {
    nodes_.clear();
    files_.clear();
    chunks_.clear();
    versions_.clear();
    throw;
  }

  Logger::getInstance().log(LogLevel::INFO,
                            "[MetadataRepository] Loaded " +
                                std::to_string(nodes_.size()) + " nodes, " +
                                std::to_string(files_.size()) + " files, " +
                                std::to_string(chunks_.size()) +
                                " chunk replicas from " + path);
  return true;
}

} // namespace chunkvault
