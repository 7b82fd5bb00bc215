#ifndef CHUNKVAULT_CHECKSUM_HPP
#define CHUNKVAULT_CHECKSUM_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <sodium.h> // For libsodium SHA-256
#include <span>
#include <string>

namespace chunkvault {

/// Digest size of the SHA-256 checksums used for files and chunks (32 bytes).
inline constexpr size_t DIGEST_SIZE = crypto_hash_sha256_BYTES;

/// Length of a digest rendered as lowercase hex.
inline constexpr size_t DIGEST_HEX_LENGTH = DIGEST_SIZE * 2;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/**
 * @brief Initialise libsodium once per process.
 * @throw std::runtime_error if the library cannot be initialised.
 */
void ensureSodiumInitialized();

/**
 * @brief Incremental SHA-256 over data fed in arbitrary pieces.
 *
 * Nothing is buffered beyond libsodium's internal block state, so the input
 * may be larger than memory.
 */
class Sha256Hasher {
public:
  Sha256Hasher();

  void update(std::span<const std::byte> data);
  void update(const std::byte *data, size_t size);

  /**
   * @brief Finish the digest.
   * @throw std::logic_error if called twice.
   */
  DigestArray finalize();

  /** Finish the digest and render it as lowercase hex. */
  std::string finalizeHex();

  /** Number of bytes fed so far. */
  uint64_t bytesHashed() const { return bytesHashed_; }

private:
  crypto_hash_sha256_state state_;
  uint64_t bytesHashed_ = 0;
  bool finalized_ = false;
};

std::string toHex(const DigestArray &digest);

/** Hex SHA-256 of an in-memory buffer. */
std::string digestBytes(std::span<const std::byte> data);

/**
 * @brief Hex SHA-256 of everything remaining in @p in.
 *
 * The stream is consumed in fixed-size blocks.
 * @param bytesRead If non-null, receives the number of bytes consumed.
 * @throw StreamError if the stream reports a read failure (badbit).
 */
std::string digestStream(std::istream &in, uint64_t *bytesRead = nullptr);

} // namespace chunkvault

#endif // CHUNKVAULT_CHECKSUM_HPP
