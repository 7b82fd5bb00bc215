#include "utilities/checksum.hpp"
#include "storage/errors.h"

#include <mutex>
#include <stdexcept>
#include <vector>

namespace chunkvault {

namespace {
constexpr size_t STREAM_BLOCK_SIZE = 64 * 1024;
std::once_flag sodiumInitFlag;
} // namespace

void ensureSodiumInitialized() {
  std::call_once(sodiumInitFlag, [] {
    // sodium_init() returns -1 on error, 0 on success, 1 if already
    // initialized.
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
  });
}

Sha256Hasher::Sha256Hasher() {
  ensureSodiumInitialized();
  crypto_hash_sha256_init(&state_);
}

void Sha256Hasher::update(std::span<const std::byte> data) {
  update(data.data(), data.size());
}

void Sha256Hasher::update(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error("Cannot update a digest after finalize()");
  }
  if (data && size > 0) {
    crypto_hash_sha256_update(
        &state_, reinterpret_cast<const unsigned char *>(data), size);
    bytesHashed_ += size;
  }
}

DigestArray Sha256Hasher::finalize() {
  if (finalized_) {
    throw std::logic_error("finalize() already called");
  }
  DigestArray digest{};
  crypto_hash_sha256_final(&state_, digest.data());
  finalized_ = true;
  return digest;
}

std::string Sha256Hasher::finalizeHex() { return toHex(finalize()); }

std::string toHex(const DigestArray &digest) {
  std::string hex(DIGEST_HEX_LENGTH + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
  hex.resize(DIGEST_HEX_LENGTH);
  return hex;
}

std::string digestBytes(std::span<const std::byte> data) {
  Sha256Hasher hasher;
  hasher.update(data);
  return hasher.finalizeHex();
}

std::string digestStream(std::istream &in, uint64_t *bytesRead) {
  Sha256Hasher hasher;
  std::vector<char> block(STREAM_BLOCK_SIZE);
  while (in) {
    in.read(block.data(), static_cast<std::streamsize>(block.size()));
    std::streamsize got = in.gcount();
    if (got > 0) {
      hasher.update(reinterpret_cast<const std::byte *>(block.data()),
                    static_cast<size_t>(got));
    }
  }
  if (in.bad()) {
    throw StreamError("Read error while computing stream digest after " +
                      std::to_string(hasher.bytesHashed()) + " bytes");
  }
  if (bytesRead) {
    *bytesRead = hasher.bytesHashed();
  }
  return hasher.finalizeHex();
}

} // namespace chunkvault
