/**
 * @file file_assembler.h
 * @brief Reconstructs a file from its completed chunk replicas.
 */
#pragma once
#ifndef CHUNKVAULT_FILE_ASSEMBLER_H
#define CHUNKVAULT_FILE_ASSEMBLER_H

#include "cluster/node_registry.h"
#include "node/object_store.h"
#include "storage/metadata_repository.h"
#include "utilities/config.hpp"

#include <memory>
#include <ostream>
#include <vector>

namespace chunkvault {

/**
 * @brief Reads files back from the storage nodes.
 *
 * Before any byte is produced the assembler checks that every ordinal up to
 * the highest one has a completed replica and that those sizes add up to the
 * file size. Each ordinal is fetched from its primary first and then from the
 * other completed replicas in node-id order; replicas that fail to fetch or
 * fail their chunk digest are skipped, and digest failures are recorded as
 * corrupted.
 */
class FileAssembler {
public:
  FileAssembler(MetadataRepository &repo, NodeRegistry &registry,
                std::shared_ptr<ObjectStoreClient> client,
                const StorageConfig &config);

  /**
   * @brief Assemble the whole file in memory and validate it.
   *
   * Nothing is returned unless the whole-file digest matches.
   * @throw NotFoundError if the file is unknown or soft-deleted.
   * @throw IncompleteFileError if an ordinal has no usable replica.
   * @throw IntegrityFailureError if the assembled digest is wrong.
   */
  std::vector<std::byte> readAll(const std::string &fileId);

  /**
   * @brief Write the file to @p out.
   *
   * Files no larger than max_buffered_read_bytes are assembled and validated
   * before anything is written. Larger files are streamed chunk by chunk; in
   * that case IncompleteFileError::bytesDelivered() reports how much was
   * already written, and an IntegrityFailureError is raised only after the
   * last byte. Either error means everything written to @p out is unsafe.
   *
   * @return Number of bytes written.
   * @throw StreamError if @p out fails.
   */
  uint64_t read(const std::string &fileId, std::ostream &out);

private:
  struct ReadPlan {
    File file;
    std::vector<std::vector<Chunk>> replicas; ///< Candidates per ordinal.
  };

  ReadPlan plan(const std::string &fileId) const;
  std::optional<std::vector<std::byte>>
  fetchOrdinal(const std::vector<Chunk> &candidates);
  void streamInto(const ReadPlan &plan, std::ostream &out,
                  uint64_t &delivered);
  std::vector<std::byte> assemble(const ReadPlan &plan);

  MetadataRepository &repo_;
  NodeRegistry &registry_;
  std::shared_ptr<ObjectStoreClient> client_;
  uint64_t maxBufferedReadBytes_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_FILE_ASSEMBLER_H
