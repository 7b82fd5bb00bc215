#include "node/directory_object_store.hpp"
#include "storage/models.h"

#include <fstream>
#include <system_error>

namespace chunkvault {

std::filesystem::path
DirectoryObjectStore::objectPath(const std::string &address,
                                 const std::string &key) {
  std::filesystem::path root(address);
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    throw ObjectStoreError("Storage node directory unavailable: " + address);
  }
  std::filesystem::path rel(key);
  if (key.empty() || rel.is_absolute()) {
    throw ObjectStoreError("Invalid object key: '" + key + "'");
  }
  for (const auto &part : rel) {
    if (part == "..") {
      throw ObjectStoreError("Object key escapes node directory: " + key);
    }
  }
  return root / rel;
}

void DirectoryObjectStore::putObject(const std::string &address,
                                     const std::string &key,
                                     const std::vector<std::byte> &data) {
  std::filesystem::path target = objectPath(address, key);
  std::error_code ec;
  std::filesystem::create_directories(target.parent_path(), ec);
  if (ec) {
    throw ObjectStoreError("Cannot create " + target.parent_path().string() +
                           ": " + ec.message());
  }

  std::filesystem::path tmp = target;
  tmp += ".tmp-" + generateId();
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
      throw ObjectStoreError("Cannot open " + tmp.string() + " for writing");
    }
    ofs.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      ofs.close();
      std::filesystem::remove(tmp, ec);
      throw ObjectStoreError("Short write to " + tmp.string());
    }
  }
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    throw ObjectStoreError("Cannot rename object into place at " +
                           target.string() + ": " + ec.message());
  }
}

std::optional<std::vector<std::byte>>
DirectoryObjectStore::getObject(const std::string &address,
                                const std::string &key) {
  std::filesystem::path target = objectPath(address, key);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(target, ec)) {
    return std::nullopt;
  }
  std::ifstream ifs(target, std::ios::binary);
  if (!ifs.is_open()) {
    throw ObjectStoreError("Cannot open " + target.string() + " for reading");
  }
  std::vector<std::byte> data;
  char buf[65536];
  while (ifs.read(buf, sizeof(buf)) || ifs.gcount() > 0) {
    const auto *begin = reinterpret_cast<const std::byte *>(buf);
    data.insert(data.end(), begin, begin + ifs.gcount());
  }
  if (ifs.bad()) {
    throw ObjectStoreError("Read error on " + target.string());
  }
  return data;
}

bool DirectoryObjectStore::deleteObject(const std::string &address,
                                        const std::string &key) {
  std::filesystem::path target = objectPath(address, key);
  std::error_code ec;
  bool removed = std::filesystem::remove(target, ec);
  if (ec) {
    throw ObjectStoreError("Cannot remove " + target.string() + ": " +
                           ec.message());
  }
  return removed;
}

} // namespace chunkvault
