#include "utilities/chunker.hpp"
#include "storage/errors.h"

#include <string>

namespace chunkvault {

void validateChunkSize(uint64_t chunkSize, uint64_t alignment,
                       uint64_t maxChunkSize) {
  if (alignment == 0) {
    throw InvalidInputError("Chunk alignment must be positive");
  }
  if (chunkSize == 0) {
    throw InvalidInputError("Chunk size must be positive");
  }
  if (chunkSize % alignment != 0) {
    throw InvalidInputError("Chunk size " + std::to_string(chunkSize) +
                            " is not a multiple of " +
                            std::to_string(alignment) + " bytes");
  }
  if (maxChunkSize > 0 && chunkSize > maxChunkSize) {
    throw InvalidInputError("Chunk size " + std::to_string(chunkSize) +
                            " exceeds the maximum of " +
                            std::to_string(maxChunkSize) + " bytes");
  }
}

ChunkReader::ChunkReader(std::istream &source, uint64_t chunkSize,
                         uint64_t alignment, uint64_t maxChunkSize)
    : source_(source), chunkSize_(chunkSize) {
  validateChunkSize(chunkSize, alignment, maxChunkSize);
}

std::optional<ChunkPiece> ChunkReader::next() {
  if (exhausted_) {
    return std::nullopt;
  }

  ChunkPiece piece;
  piece.ordinal = nextOrdinal_;
  piece.bytes.resize(static_cast<size_t>(chunkSize_));

  // A single read() may return short on pipes, so keep filling until the
  // chunk is full or the source ends.
  size_t filled = 0;
  while (filled < piece.bytes.size() && source_) {
    source_.read(reinterpret_cast<char *>(piece.bytes.data() + filled),
                 static_cast<std::streamsize>(piece.bytes.size() - filled));
    filled += static_cast<size_t>(source_.gcount());
  }
  if (source_.bad()) {
    throw StreamError("Read error while chunking at offset " +
                      std::to_string(bytesRead_ + filled));
  }
  piece.bytes.resize(filled);
  bytesRead_ += filled;

  if (filled < chunkSize_) {
    exhausted_ = true;
  } else if (source_.peek() == std::char_traits<char>::eof()) {
    // Exact multiple: don't emit a trailing empty chunk.
    exhausted_ = true;
    if (source_.bad()) {
      throw StreamError("Read error while chunking at offset " +
                        std::to_string(bytesRead_));
    }
  }

  if (filled == 0 && nextOrdinal_ > 0) {
    return std::nullopt;
  }
  ++nextOrdinal_;
  return piece;
}

uint64_t expectedChunkCount(uint64_t length, uint64_t chunkSize) {
  if (length == 0) {
    return 1;
  }
  return (length + chunkSize - 1) / chunkSize;
}

} // namespace chunkvault
