#pragma once
#ifndef CHUNKVAULT_STORAGE_ERRORS_H
#define CHUNKVAULT_STORAGE_ERRORS_H

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace chunkvault {

/// Error categories surfaced by the storage core.
enum class ErrorCode {
  InvalidInput,
  InsufficientCapacity,
  WriteFailed,
  IncompleteFile,
  IntegrityFailure,
  CorruptChunk,
  NotFound,
  NodeUnavailable,
  StreamError
};

const char *errorCodeName(ErrorCode code);

/**
 * @brief Base class of every error thrown across a component boundary.
 *
 * Transport and I/O failures are translated into one of these before they
 * leave the component that observed them.
 */
class StorageError : public std::runtime_error {
public:
  StorageError(ErrorCode code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

/// Bad chunk size, replication factor, configuration or stream.
class InvalidInputError : public StorageError {
public:
  explicit InvalidInputError(const std::string &message)
      : StorageError(ErrorCode::InvalidInput, message) {}
};

/// Fewer eligible nodes than the requested replication factor.
class InsufficientCapacityError : public StorageError {
public:
  InsufficientCapacityError(const std::string &message, size_t eligible,
                            size_t requested)
      : StorageError(ErrorCode::InsufficientCapacity, message),
        eligible_(eligible), requested_(requested) {}

  size_t eligible() const noexcept { return eligible_; }
  size_t requested() const noexcept { return requested_; }

private:
  size_t eligible_;
  size_t requested_;
};

/// No replica of a chunk reached the completed state.
class WriteFailedError : public StorageError {
public:
  WriteFailedError(const std::string &message, std::string fileId,
                   unsigned int ordinal)
      : StorageError(ErrorCode::WriteFailed, message),
        fileId_(std::move(fileId)), ordinal_(ordinal) {}

  const std::string &fileId() const noexcept { return fileId_; }
  unsigned int ordinal() const noexcept { return ordinal_; }

private:
  std::string fileId_;
  unsigned int ordinal_;
};

/**
 * @brief A file cannot be assembled because an ordinal has no completed
 * replica.
 *
 * When bytesDelivered() is non-zero the failure happened mid-stream and the
 * bytes already handed to the caller must be treated as unsafe.
 */
class IncompleteFileError : public StorageError {
public:
  IncompleteFileError(const std::string &message, uint64_t bytesDelivered = 0)
      : StorageError(ErrorCode::IncompleteFile, message),
        bytesDelivered_(bytesDelivered) {}

  uint64_t bytesDelivered() const noexcept { return bytesDelivered_; }

private:
  uint64_t bytesDelivered_;
};

/**
 * @brief The assembled stream does not match the file's recorded digest.
 *
 * Raised at end of stream; everything written before it is unsafe.
 */
class IntegrityFailureError : public StorageError {
public:
  IntegrityFailureError(const std::string &message, std::string expected,
                        std::string actual)
      : StorageError(ErrorCode::IntegrityFailure, message),
        expected_(std::move(expected)), actual_(std::move(actual)) {}

  const std::string &expected() const noexcept { return expected_; }
  const std::string &actual() const noexcept { return actual_; }

private:
  std::string expected_;
  std::string actual_;
};

/// A single replica failed digest verification.
class CorruptChunkError : public StorageError {
public:
  CorruptChunkError(const std::string &message, std::string chunkId)
      : StorageError(ErrorCode::CorruptChunk, message),
        chunkId_(std::move(chunkId)) {}

  const std::string &chunkId() const noexcept { return chunkId_; }

private:
  std::string chunkId_;
};

class NotFoundError : public StorageError {
public:
  explicit NotFoundError(const std::string &message)
      : StorageError(ErrorCode::NotFound, message) {}
};

/// The owning node could not be reached for a read.
class NodeUnavailableError : public StorageError {
public:
  NodeUnavailableError(const std::string &message, std::string nodeId)
      : StorageError(ErrorCode::NodeUnavailable, message),
        nodeId_(std::move(nodeId)) {}

  const std::string &nodeId() const noexcept { return nodeId_; }

private:
  std::string nodeId_;
};

/// The caller's source stream failed while being read.
class StreamError : public StorageError {
public:
  explicit StreamError(const std::string &message)
      : StorageError(ErrorCode::StreamError, message) {}
};

} // namespace chunkvault

#endif // CHUNKVAULT_STORAGE_ERRORS_H
