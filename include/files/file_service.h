/**
 * @file file_service.h
 * @brief Upload and lifecycle operations on whole files.
 */
#pragma once
#ifndef CHUNKVAULT_FILE_SERVICE_H
#define CHUNKVAULT_FILE_SERVICE_H

#include "cluster/node_registry.h"
#include "node/object_store.h"
#include "replication/replication_coordinator.h"
#include "storage/metadata_repository.h"
#include "utilities/config.hpp"

#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace chunkvault {

struct UploadRequest {
  std::string name;
  std::string owner;
  std::string contentType;
  uint64_t chunkSize{0};            ///< 0 selects the configured chunk_size.
  unsigned int replicationFactor{0}; ///< 0 selects replication_factor.
};

struct UploadResult {
  File file;
  bool deduplicated{false}; ///< An identical live file already existed.
  std::vector<WriteResult> chunks;
  bool reducedDurability{false};
};

/// What a garbage collection pass removed.
struct CollectionStats {
  size_t chunksCollected{0};
  size_t objectsRemoved{0};
  size_t objectsMissing{0};
  size_t objectsFailed{0}; ///< Node unreachable; object left behind.
  uint64_t bytesReclaimed{0};
};

/**
 * @brief Drives uploads through the chunker and replication coordinator and
 * manages the file lifecycle (soft delete, collection, purge).
 *
 * Files are deduplicated on (name, checksum, owner). The file record is
 * created before any chunk is written and removed again if the upload fails,
 * so a retry is never short-circuited by a half-written file.
 */
class FileService {
public:
  FileService(MetadataRepository &repo, NodeRegistry &registry,
              ReplicationCoordinator &coordinator,
              std::shared_ptr<ObjectStoreClient> client,
              const StorageConfig &config);

  /**
   * @brief Store the content of @p source as a new file.
   *
   * The stream is read twice: once for the whole-file digest and once to cut
   * chunks, so it must be seekable. At most upload_parallelism chunks are in
   * flight at a time.
   *
   * @throw InvalidInputError for a bad request or a non-seekable stream.
   * @throw StreamError if the stream fails or changes between passes.
   * @throw InsufficientCapacityError, WriteFailedError from the chunk writes;
   * every chunk already written is collected first.
   */
  UploadResult upload(std::istream &source, const UploadRequest &request);

  /** True if the file is live and every ordinal has a completed replica. */
  bool isAvailable(const std::string &fileId) const;

  /** @throw NotFoundError for an unknown file. */
  File softDelete(const std::string &fileId);
  /** @throw NotFoundError for an unknown file. */
  File undelete(const std::string &fileId);

  /**
   * @brief Remove every chunk object of a file from its node, mark the
   * records deleted and recompute capacity of the affected nodes.
   * @throw NotFoundError for an unknown file.
   */
  CollectionStats collectGarbage(const std::string &fileId);

  /** Collect, then delete the file with its chunks and versions. */
  CollectionStats purge(const std::string &fileId);

  /** @throw NotFoundError for an unknown file. */
  File file(const std::string &fileId) const;

  /**
   * @brief Files newest first.
   * @param owner Only files of this owner; empty for all owners.
   */
  std::vector<File> listFiles(const std::string &owner = "",
                              bool includeDeleted = false) const;

  /** Live files of at least @p minBytes, largest first. */
  std::vector<File> largeFiles(uint64_t minBytes) const;

  /** @throw NotFoundError for an unknown file. */
  std::vector<Chunk> chunksOf(const std::string &fileId) const;

private:
  MetadataRepository &repo_;
  NodeRegistry &registry_;
  ReplicationCoordinator &coordinator_;
  std::shared_ptr<ObjectStoreClient> client_;
  StorageConfig config_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_FILE_SERVICE_H
