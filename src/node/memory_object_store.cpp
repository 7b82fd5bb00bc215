#include "node/memory_object_store.hpp"

namespace chunkvault {

void MemoryObjectStore::addNode(const std::string &address) {
  std::lock_guard<std::mutex> lock(mutex_);
  nodes_.emplace(address, Objects{});
}

void MemoryObjectStore::removeNode(const std::string &address) {
  std::lock_guard<std::mutex> lock(mutex_);
  nodes_.erase(address);
}

MemoryObjectStore::Objects &
MemoryObjectStore::nodeLocked(const std::string &address) {
  auto it = nodes_.find(address);
  if (it == nodes_.end()) {
    throw ObjectStoreError("Storage node unreachable: " + address);
  }
  return it->second;
}

void MemoryObjectStore::putObject(const std::string &address,
                                  const std::string &key,
                                  const std::vector<std::byte> &data) {
  std::lock_guard<std::mutex> lock(mutex_);
  nodeLocked(address)[key] = data;
}

std::optional<std::vector<std::byte>>
MemoryObjectStore::getObject(const std::string &address,
                             const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  Objects &objects = nodeLocked(address);
  auto it = objects.find(key);
  if (it == objects.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemoryObjectStore::deleteObject(const std::string &address,
                                     const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  return nodeLocked(address).erase(key) > 0;
}

bool MemoryObjectStore::hasObject(const std::string &address,
                                  const std::string &key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(address);
  return it != nodes_.end() && it->second.count(key) > 0;
}

size_t MemoryObjectStore::objectCount(const std::string &address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = nodes_.find(address);
  return it == nodes_.end() ? 0 : it->second.size();
}

bool MemoryObjectStore::corruptObject(const std::string &address,
                                      const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto node = nodes_.find(address);
  if (node == nodes_.end()) {
    return false;
  }
  auto it = node->second.find(key);
  if (it == node->second.end()) {
    return false;
  }
  if (it->second.empty()) {
    it->second.push_back(std::byte{0x01});
  } else {
    it->second[0] ^= std::byte{0xFF};
  }
  return true;
}

} // namespace chunkvault
