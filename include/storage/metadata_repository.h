/**
 * @file metadata_repository.h
 * @brief Transactional access to the metadata store.
 *
 * Every method is atomic with respect to every other method on the same
 * repository. Methods that combine several updates (completeReplica,
 * designatePrimary, recordVerification, adjustAvailable, recomputeAvailable,
 * deleteFile) are single transactions; callers never read-modify-write shared
 * counters themselves.
 */
#pragma once
#ifndef CHUNKVAULT_METADATA_REPOSITORY_H
#define CHUNKVAULT_METADATA_REPOSITORY_H

#include "storage/models.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkvault {

class MetadataRepository {
public:
  using KeyLock = std::unique_lock<std::mutex>;

  virtual ~MetadataRepository() = default;

  // ---- Storage nodes ----

  /** @throw InvalidInputError if the id or name is already registered. */
  virtual void insertNode(const StorageNode &node) = 0;
  virtual std::optional<StorageNode> findNode(const std::string &id) const = 0;
  virtual std::optional<StorageNode>
  findNodeByName(const std::string &name) const = 0;
  virtual std::vector<StorageNode> listNodes() const = 0;

  /** @throw NotFoundError for an unknown node. */
  virtual void touchHeartbeat(const std::string &id, std::time_t when) = 0;
  /** @throw NotFoundError for an unknown node. */
  virtual void setNodeActive(const std::string &id, bool active) = 0;

  /**
   * @brief Atomically add @p delta to a node's available bytes.
   *
   * The result is clamped to [0, capacity]. A node whose available space
   * reaches zero is deactivated in the same transaction.
   * @return The new available value.
   * @throw NotFoundError for an unknown node.
   */
  virtual uint64_t adjustAvailable(const std::string &id, int64_t delta) = 0;

  /**
   * @brief Recompute available = capacity - sum of the node's completed and
   * corrupted chunk sizes, deactivating the node if nothing is left.
   *
   * Uploading rows are not counted; completeReplica charges them.
   * @return The new available value.
   * @throw NotFoundError for an unknown node.
   */
  virtual uint64_t recomputeAvailable(const std::string &id) = 0;

  /**
   * @brief Hard-delete a node.
   * @return false if a non-deleted chunk still references the node.
   */
  virtual bool deleteNode(const std::string &id) = 0;

  // ---- Files ----

  /**
   * @brief Insert a new file record.
   * @return false if (name, checksum, owner) is already taken.
   */
  virtual bool insertFile(const File &file) = 0;
  virtual std::optional<File> findFile(const std::string &id) const = 0;
  virtual std::optional<File>
  findFileByIdentity(const std::string &name, const std::string &checksum,
                     const std::string &owner) const = 0;
  virtual std::vector<File> listFiles() const = 0;
  /** @throw NotFoundError for an unknown file. */
  virtual void updateFile(const File &file) = 0;
  /** Delete a file together with its chunks and versions. */
  virtual bool deleteFile(const std::string &id) = 0;

  // ---- Chunks ----

  /**
   * @throw InvalidInputError if a live replica already exists for the same
   * (file, ordinal, node), or the file or node is unknown.
   */
  virtual void insertChunk(const Chunk &chunk) = 0;
  virtual std::optional<Chunk> findChunk(const std::string &id) const = 0;
  /** Replicas of a file ordered by (ordinal, nodeId). */
  virtual std::vector<Chunk> chunksForFile(const std::string &fileId) const = 0;
  virtual std::vector<Chunk> chunksForKey(const std::string &fileId,
                                          unsigned int ordinal) const = 0;
  virtual std::vector<Chunk> chunksOnNode(const std::string &nodeId) const = 0;
  virtual std::vector<Chunk> listChunks() const = 0;
  /** @throw NotFoundError for an unknown chunk. */
  virtual void updateChunk(const Chunk &chunk) = 0;
  virtual bool deleteChunk(const std::string &id) = 0;

  /**
   * @brief Mark a replica completed and charge its size against its node,
   * as adjustAvailable would.
   * @return The updated chunk.
   * @throw NotFoundError for an unknown chunk.
   */
  virtual Chunk completeReplica(const std::string &chunkId,
                                const std::string &storedChecksum,
                                std::time_t verifiedAt) = 0;

  /**
   * @brief Make @p chunkId the only primary among the replicas of its
   * (file, ordinal), demoting any other.
   * @throw NotFoundError for an unknown chunk.
   */
  virtual void designatePrimary(const std::string &chunkId) = 0;

  /**
   * @brief Record the outcome of a verification pass on one replica.
   *
   * Sets storedChecksum and lastVerifiedAt and, if @p corrupted, moves the
   * status to corrupted. An uploading replica marked corrupted is charged
   * against its node in the same transaction. No other replica is touched.
   * @return The updated chunk.
   */
  virtual Chunk recordVerification(const std::string &chunkId,
                                   const std::string &storedChecksum,
                                   std::time_t verifiedAt, bool corrupted) = 0;

  // ---- Versions ----

  /**
   * @brief Append the next version of a file.
   *
   * The version number is one past the highest existing number for the file.
   * @throw NotFoundError for an unknown file.
   */
  virtual FileVersion appendVersion(const std::string &fileId, uint64_t size,
                                    const std::string &checksum,
                                    const std::string &createdBy,
                                    const std::string &notes,
                                    std::time_t createdAt) = 0;
  virtual std::optional<FileVersion>
  findVersion(const std::string &id) const = 0;
  /** Versions of a file, newest first. */
  virtual std::vector<FileVersion>
  versionsForFile(const std::string &fileId) const = 0;

  // ---- Named locks ----

  /** Lock serialising primary designation for one (file, ordinal). */
  virtual KeyLock lockChunkKey(const std::string &fileId,
                               unsigned int ordinal) = 0;
  /** Lock serialising whole-file operations such as version numbering. */
  virtual KeyLock lockFile(const std::string &fileId) = 0;
};

} // namespace chunkvault

#endif // CHUNKVAULT_METADATA_REPOSITORY_H
