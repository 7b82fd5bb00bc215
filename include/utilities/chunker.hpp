#ifndef CHUNKVAULT_CHUNKER_HPP
#define CHUNKVAULT_CHUNKER_HPP

#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <vector>

namespace chunkvault {

/// Alignment unit chunk sizes must be a multiple of in the default policy.
inline constexpr uint64_t DEFAULT_CHUNK_ALIGNMENT = 4096;

/// One cut of the source stream.
struct ChunkPiece {
  unsigned int ordinal{0};
  std::vector<std::byte> bytes;
};

/**
 * @brief Reject chunk sizes that are zero, unaligned or above @p maxChunkSize.
 * @throw InvalidInputError on violation.
 */
void validateChunkSize(uint64_t chunkSize,
                       uint64_t alignment = DEFAULT_CHUNK_ALIGNMENT,
                       uint64_t maxChunkSize = 0);

/**
 * @brief Lazily splits a byte stream into fixed-size chunks.
 *
 * Every chunk holds exactly chunkSize bytes except the last one, which holds
 * the remainder. An empty source yields a single zero-length chunk at ordinal
 * 0. Only the chunk being returned is resident; the reader cannot be rewound
 * and has to be recreated over a fresh stream to start again.
 */
class ChunkReader {
public:
  /**
   * @param source Stream positioned at the first byte to chunk. Must outlive
   * the reader.
   * @param chunkSize Validated against @p alignment before any read happens.
   * @throw InvalidInputError if the chunk size is invalid.
   */
  ChunkReader(std::istream &source, uint64_t chunkSize,
              uint64_t alignment = DEFAULT_CHUNK_ALIGNMENT,
              uint64_t maxChunkSize = 0);

  /**
   * @brief Cut the next chunk.
   * @return The chunk, or std::nullopt once the source is exhausted.
   * @throw StreamError if the source reports a read failure.
   */
  std::optional<ChunkPiece> next();

  uint64_t chunkSize() const { return chunkSize_; }
  uint64_t bytesRead() const { return bytesRead_; }

private:
  std::istream &source_;
  uint64_t chunkSize_;
  unsigned int nextOrdinal_ = 0;
  uint64_t bytesRead_ = 0;
  bool exhausted_ = false;
};

/** Number of chunks a stream of @p length bytes is cut into. */
uint64_t expectedChunkCount(uint64_t length, uint64_t chunkSize);

} // namespace chunkvault

#endif // CHUNKVAULT_CHUNKER_HPP
