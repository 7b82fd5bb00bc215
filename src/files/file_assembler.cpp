#include "files/file_assembler.h"
#include "storage/errors.h"
#include "utilities/checksum.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"

#include <algorithm>
#include <map>

namespace chunkvault {

namespace {

void countRead(const char *result) {
  MetricsRegistry::instance().incrementCounter("chunkvault_file_reads_total",
                                               1.0, {{"result", result}});
}

void checkWholeFile(const File &file, Sha256Hasher &hasher) {
  std::string actual = hasher.finalizeHex();
  if (actual != file.checksum) {
    std::string msg = "File " + file.id + " assembled with digest " + actual +
                      ", expected " + file.checksum;
    Logger::getInstance().log(LogLevel::ERROR, "[FileAssembler] " + msg);
    throw IntegrityFailureError(msg, file.checksum, actual);
  }
}

} // namespace

FileAssembler::FileAssembler(MetadataRepository &repo, NodeRegistry &registry,
                             std::shared_ptr<ObjectStoreClient> client,
                             const StorageConfig &config)
    : repo_(repo), registry_(registry), client_(std::move(client)),
      maxBufferedReadBytes_(config.maxBufferedReadBytes) {}

FileAssembler::ReadPlan FileAssembler::plan(const std::string &fileId) const {
  auto file = repo_.findFile(fileId);
  if (!file || file->isDeleted) {
    throw NotFoundError("File not found: " + fileId);
  }

  std::map<unsigned int, std::vector<Chunk>> byOrdinal;
  for (auto &c : repo_.chunksForFile(fileId)) {
    if (c.status == ChunkStatus::Completed) {
      byOrdinal[c.ordinal].push_back(std::move(c));
    }
  }
  if (byOrdinal.empty()) {
    throw IncompleteFileError("File " + fileId + " has no completed chunks");
  }

  ReadPlan plan;
  plan.file = *file;
  unsigned int highest = byOrdinal.rbegin()->first;
  uint64_t total = 0;
  for (unsigned int ordinal = 0; ordinal <= highest; ++ordinal) {
    auto it = byOrdinal.find(ordinal);
    if (it == byOrdinal.end()) {
      throw IncompleteFileError("File " + fileId + " is missing chunk " +
                                std::to_string(ordinal));
    }
    std::vector<Chunk> &candidates = it->second;
    // Primary first; the rest are already in node-id order.
    std::stable_partition(candidates.begin(), candidates.end(),
                          [](const Chunk &c) { return c.isPrimary; });
    total += candidates.front().size;
    plan.replicas.push_back(std::move(candidates));
  }
  if (total != file->size) {
    throw IncompleteFileError("Chunks of file " + fileId + " hold " +
                              std::to_string(total) + " bytes, expected " +
                              std::to_string(file->size));
  }
  return plan;
}

std::optional<std::vector<std::byte>>
FileAssembler::fetchOrdinal(const std::vector<Chunk> &candidates) {
  for (const auto &chunk : candidates) {
    auto node = repo_.findNode(chunk.nodeId);
    if (!node) {
      continue;
    }
    std::optional<std::vector<std::byte>> data;
    try {
      data = client_->getObject(node->address(), chunk.objectKey);
    } catch (const ObjectStoreError &e) {
      registry_.recordTransferFailure(node->id);
      Logger::getInstance().log(LogLevel::WARN,
                                "[FileAssembler] Node " + node->name +
                                    " failed to serve chunk " + chunk.id +
                                    ": " + e.what());
      continue;
    }
    registry_.recordTransferSuccess(node->id);

    std::string actual = data ? digestBytes(*data) : std::string();
    if (data && actual == chunk.checksum) {
      return data;
    }
    repo_.recordVerification(chunk.id, actual, std::time(nullptr), true);
    Logger::getInstance().log(LogLevel::WARN,
                              "[FileAssembler] Replica " + chunk.id +
                                  " on node " + node->name +
                                  (data ? " failed its digest check"
                                        : " is missing") +
                                  "; marked corrupted");
  }
  return std::nullopt;
}

std::vector<std::byte> FileAssembler::assemble(const ReadPlan &plan) {
  std::vector<std::byte> out;
  out.reserve(plan.file.size);
  Sha256Hasher hasher;
  for (size_t ordinal = 0; ordinal < plan.replicas.size(); ++ordinal) {
    auto data = fetchOrdinal(plan.replicas[ordinal]);
    if (!data) {
      throw IncompleteFileError("No readable replica for chunk " +
                                std::to_string(ordinal) + " of file " +
                                plan.file.id);
    }
    hasher.update(*data);
    out.insert(out.end(), data->begin(), data->end());
  }
  checkWholeFile(plan.file, hasher);
  return out;
}

void FileAssembler::streamInto(const ReadPlan &plan, std::ostream &out,
                               uint64_t &delivered) {
  Sha256Hasher hasher;
  for (size_t ordinal = 0; ordinal < plan.replicas.size(); ++ordinal) {
    auto data = fetchOrdinal(plan.replicas[ordinal]);
    if (!data) {
      throw IncompleteFileError("No readable replica for chunk " +
                                    std::to_string(ordinal) + " of file " +
                                    plan.file.id + " after " +
                                    std::to_string(delivered) +
                                    " bytes were delivered",
                                delivered);
    }
    hasher.update(*data);
    out.write(reinterpret_cast<const char *>(data->data()),
              static_cast<std::streamsize>(data->size()));
    if (!out) {
      throw StreamError("Output stream failed while writing file " +
                        plan.file.id);
    }
    delivered += data->size();
  }
  checkWholeFile(plan.file, hasher);
}

std::vector<std::byte> FileAssembler::readAll(const std::string &fileId) {
  try {
    std::vector<std::byte> bytes = assemble(plan(fileId));
    countRead("ok");
    return bytes;
  } catch (const StorageError &e) {
    countRead(errorCodeName(e.code()));
    Logger::getInstance().log(LogLevel::WARN, "[FileAssembler] Read of " +
                                                  fileId + " failed: " +
                                                  e.what());
    throw;
  }
}

uint64_t FileAssembler::read(const std::string &fileId, std::ostream &out) {
  uint64_t delivered = 0;
  try {
    ReadPlan p = plan(fileId);
    if (p.file.size <= maxBufferedReadBytes_) {
      std::vector<std::byte> bytes = assemble(p);
      out.write(reinterpret_cast<const char *>(bytes.data()),
                static_cast<std::streamsize>(bytes.size()));
      if (!out) {
        throw StreamError("Output stream failed while writing file " + fileId);
      }
      delivered = bytes.size();
    } else {
      streamInto(p, out, delivered);
    }
    countRead("ok");
    return delivered;
  } catch (const StorageError &e) {
    countRead(errorCodeName(e.code()));
    Logger::getInstance().log(LogLevel::WARN,
                              "[FileAssembler] Read of " + fileId +
                                  " failed after " + std::to_string(delivered) +
                                  " bytes: " + e.what());
    throw;
  }
}

} // namespace chunkvault
