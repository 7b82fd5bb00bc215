#include "storage/models.h"
#include "storage/errors.h"
#include "utilities/checksum.hpp"

#include <array>
#include <cstdio>

namespace chunkvault {

const char *chunkStatusToString(ChunkStatus status) {
  switch (status) {
  case ChunkStatus::Uploading:
    return "uploading";
  case ChunkStatus::Completed:
    return "completed";
  case ChunkStatus::Corrupted:
    return "corrupted";
  case ChunkStatus::Deleted:
    return "deleted";
  }
  return "unknown";
}

ChunkStatus chunkStatusFromString(const std::string &value) {
  if (value == "uploading")
    return ChunkStatus::Uploading;
  if (value == "completed")
    return ChunkStatus::Completed;
  if (value == "corrupted")
    return ChunkStatus::Corrupted;
  if (value == "deleted")
    return ChunkStatus::Deleted;
  throw InvalidInputError("Unknown chunk status: " + value);
}

std::string fileCategory(const File &file) {
  const std::string &ct = file.contentType;
  if (ct.empty()) {
    return "other";
  }
  if (ct.rfind("image/", 0) == 0) {
    return "image";
  }
  for (const char *t : {"text/", "application/pdf", "application/msword",
                        "application/vnd.openxmlformats-"}) {
    if (ct.find(t) != std::string::npos) {
      return "document";
    }
  }
  for (const char *t : {"zip", "rar", "tar", "7z", "gz"}) {
    if (ct.find(t) != std::string::npos) {
      return "archive";
    }
  }
  return "other";
}

std::string humanReadableSize(uint64_t bytes) {
  static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  double size = static_cast<double>(bytes);
  char buf[32];
  for (const char *unit : units) {
    if (size < 1024.0) {
      std::snprintf(buf, sizeof(buf), "%.2f %s", size, unit);
      return buf;
    }
    size /= 1024.0;
  }
  std::snprintf(buf, sizeof(buf), "%.2f PB", size);
  return buf;
}

std::string generateId() {
  ensureSodiumInitialized();
  std::array<unsigned char, 16> raw{};
  randombytes_buf(raw.data(), raw.size());
  // RFC 4122 version 4, variant 1.
  raw[6] = static_cast<unsigned char>((raw[6] & 0x0f) | 0x40);
  raw[8] = static_cast<unsigned char>((raw[8] & 0x3f) | 0x80);

  char hex[33];
  sodium_bin2hex(hex, sizeof(hex), raw.data(), raw.size());
  std::string s(hex, 32);
  return s.substr(0, 8) + "-" + s.substr(8, 4) + "-" + s.substr(12, 4) + "-" +
         s.substr(16, 4) + "-" + s.substr(20, 12);
}

std::string makeObjectKey(const std::string &fileId, unsigned int ordinal,
                          const std::string &chunkId) {
  return fileId + "/" + std::to_string(ordinal) + "/" + chunkId;
}

} // namespace chunkvault
