/**
 * @file models.h
 * @brief Entities tracked by the metadata store: storage nodes, files, chunk
 * replicas and file versions.
 */
#pragma once
#ifndef CHUNKVAULT_STORAGE_MODELS_H
#define CHUNKVAULT_STORAGE_MODELS_H

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>

namespace chunkvault {

/**
 * @brief A storage node that holds chunk replicas.
 *
 * Invariant: 0 <= available <= capacity. isActive is derived and goes false
 * when the node runs out of space or fails health checks.
 */
struct StorageNode {
  std::string id;
  std::string name;        ///< Operator-assigned, unique across the fleet.
  std::string host;        ///< Host name, IP, or directory for local nodes.
  int port{0};             ///< 0 for directory-backed nodes.
  uint64_t capacity{0};    ///< Total capacity in bytes.
  uint64_t available{0};   ///< Free space in bytes.
  bool isActive{true};
  std::time_t lastHeartbeat{0};
  std::time_t createdAt{0};

  /** Address handed to the object store client. */
  std::string address() const {
    return port > 0 ? host + ":" + std::to_string(port) : host;
  }
};

/**
 * @brief A logical file. Content lives in its chunks.
 *
 * (name, checksum, owner) is unique across all records, deleted or not.
 */
struct File {
  std::string id;
  std::string name;
  uint64_t size{0};
  std::string checksum; ///< SHA-256 of the whole content, lowercase hex.
  std::string contentType;
  std::string owner;
  bool isDeleted{false};
  std::optional<std::time_t> deletedAt;
  std::time_t createdAt{0};
  std::time_t updatedAt{0};
};

enum class ChunkStatus { Uploading, Completed, Corrupted, Deleted };

const char *chunkStatusToString(ChunkStatus status);
ChunkStatus chunkStatusFromString(const std::string &value);

/**
 * @brief One replica of one chunk of a file, stored on one node.
 *
 * At most one replica per (fileId, ordinal) has isPrimary set, and replicas of
 * the same (fileId, ordinal) live on distinct nodes.
 */
struct Chunk {
  std::string id;
  std::string fileId;
  std::string nodeId;
  std::string objectKey; ///< Node-local key of the stored bytes.
  unsigned int ordinal{0};
  uint64_t size{0};
  std::string checksum;       ///< Digest computed before the write.
  std::string storedChecksum; ///< Digest observed at the last verification.
  bool isPrimary{false};
  ChunkStatus status{ChunkStatus::Uploading};
  std::optional<std::time_t> lastVerifiedAt;
  std::time_t createdAt{0};
  std::time_t updatedAt{0};

  bool isCorrupted() const { return status == ChunkStatus::Corrupted; }
};

/// Immutable snapshot of a file's (size, checksum).
struct FileVersion {
  std::string id;
  std::string fileId;
  unsigned int versionNumber{0};
  uint64_t size{0};
  std::string checksum;
  std::time_t createdAt{0};
  std::string createdBy;
  std::string notes;
};

/** @brief One of "image", "document", "archive" or "other". */
std::string fileCategory(const File &file);

/** @brief Format a byte count as e.g. "1.50 MB". */
std::string humanReadableSize(uint64_t bytes);

/** @brief Generate a random UUID-formatted identifier. */
std::string generateId();

/** @brief Node-local key under which a chunk replica is stored. */
std::string makeObjectKey(const std::string &fileId, unsigned int ordinal,
                          const std::string &chunkId);

} // namespace chunkvault

#endif // CHUNKVAULT_STORAGE_MODELS_H
