#pragma once
#ifndef CHUNKVAULT_MEMORY_METADATA_REPOSITORY_H
#define CHUNKVAULT_MEMORY_METADATA_REPOSITORY_H

#include "storage/metadata_repository.h"

#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace chunkvault {

/**
 * @brief MetadataRepository kept in process memory.
 *
 * A single mutex guards all tables, which makes every method one transaction.
 * Named locks live in a separate map so that holding one never blocks
 * unrelated metadata access. The whole state can be written to and read back
 * from a YAML snapshot.
 */
class MemoryMetadataRepository : public MetadataRepository {
public:
  MemoryMetadataRepository() = default;

  void insertNode(const StorageNode &node) override;
  std::optional<StorageNode> findNode(const std::string &id) const override;
  std::optional<StorageNode>
  findNodeByName(const std::string &name) const override;
  std::vector<StorageNode> listNodes() const override;
  void touchHeartbeat(const std::string &id, std::time_t when) override;
  void setNodeActive(const std::string &id, bool active) override;
  uint64_t adjustAvailable(const std::string &id, int64_t delta) override;
  uint64_t recomputeAvailable(const std::string &id) override;
  bool deleteNode(const std::string &id) override;

  bool insertFile(const File &file) override;
  std::optional<File> findFile(const std::string &id) const override;
  std::optional<File>
  findFileByIdentity(const std::string &name, const std::string &checksum,
                     const std::string &owner) const override;
  std::vector<File> listFiles() const override;
  void updateFile(const File &file) override;
  bool deleteFile(const std::string &id) override;

  void insertChunk(const Chunk &chunk) override;
  std::optional<Chunk> findChunk(const std::string &id) const override;
  std::vector<Chunk> chunksForFile(const std::string &fileId) const override;
  std::vector<Chunk> chunksForKey(const std::string &fileId,
                                  unsigned int ordinal) const override;
  std::vector<Chunk> chunksOnNode(const std::string &nodeId) const override;
  std::vector<Chunk> listChunks() const override;
  void updateChunk(const Chunk &chunk) override;
  bool deleteChunk(const std::string &id) override;
  Chunk completeReplica(const std::string &chunkId,
                        const std::string &storedChecksum,
                        std::time_t verifiedAt) override;
  void designatePrimary(const std::string &chunkId) override;
  Chunk recordVerification(const std::string &chunkId,
                           const std::string &storedChecksum,
                           std::time_t verifiedAt, bool corrupted) override;

  FileVersion appendVersion(const std::string &fileId, uint64_t size,
                            const std::string &checksum,
                            const std::string &createdBy,
                            const std::string &notes,
                            std::time_t createdAt) override;
  std::optional<FileVersion> findVersion(const std::string &id) const override;
  std::vector<FileVersion>
  versionsForFile(const std::string &fileId) const override;

  KeyLock lockChunkKey(const std::string &fileId,
                       unsigned int ordinal) override;
  KeyLock lockFile(const std::string &fileId) override;

  /**
   * @brief Write every table to a YAML document at @p path.
   *
   * The document is written to a temporary file first and renamed into place.
   * @throw std::runtime_error if the file cannot be written.
   */
  void saveSnapshot(const std::string &path) const;

  /**
   * @brief Replace the current state with the snapshot at @p path.
   * @return false if @p path does not exist; the state is left empty.
   * @throw InvalidInputError if the document is malformed.
   */
  bool loadSnapshot(const std::string &path);

private:
  std::shared_ptr<std::mutex> namedLock(const std::string &key);
  uint64_t usedBytesLocked(const std::string &nodeId) const;
  uint64_t adjustAvailableLocked(StorageNode &node, int64_t delta);
  Chunk &chunkLocked(const std::string &id);

  mutable std::mutex mutex_;
  std::map<std::string, StorageNode> nodes_;
  std::map<std::string, File> files_;
  std::map<std::string, Chunk> chunks_;
  std::map<std::string, FileVersion> versions_;

  std::mutex lockMapMutex_;
  std::unordered_map<std::string, std::shared_ptr<std::mutex>> namedLocks_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_MEMORY_METADATA_REPOSITORY_H
