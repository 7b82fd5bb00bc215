#ifndef CHUNKVAULT_MEMORY_OBJECT_STORE_HPP
#define CHUNKVAULT_MEMORY_OBJECT_STORE_HPP

#include "node/object_store.h"

#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace chunkvault {

/**
 * @brief ObjectStoreClient that keeps every node's objects in memory.
 *
 * Addresses must be registered with addNode() before use; any other address
 * behaves like an unreachable node.
 */
class MemoryObjectStore : public ObjectStoreClient {
public:
  void addNode(const std::string &address);
  /// Subsequent calls for @p address fail as if the node were down.
  void removeNode(const std::string &address);

  void putObject(const std::string &address, const std::string &key,
                 const std::vector<std::byte> &data) override;
  std::optional<std::vector<std::byte>>
  getObject(const std::string &address, const std::string &key) override;
  bool deleteObject(const std::string &address,
                    const std::string &key) override;

  /** @brief Check if an object exists without going through the transport. */
  bool hasObject(const std::string &address, const std::string &key) const;

  /** @brief Number of objects held for @p address. */
  size_t objectCount(const std::string &address) const;

  /**
   * @brief Flip the first byte of a stored object (or append one if the
   * object is empty).
   * @return false if no such object exists.
   */
  bool corruptObject(const std::string &address, const std::string &key);

private:
  using Objects = std::unordered_map<std::string, std::vector<std::byte>>;

  Objects &nodeLocked(const std::string &address);

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Objects> nodes_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_MEMORY_OBJECT_STORE_HPP
