#ifndef CHUNKVAULT_DIRECTORY_OBJECT_STORE_HPP
#define CHUNKVAULT_DIRECTORY_OBJECT_STORE_HPP

#include "node/object_store.h"

#include <filesystem>

namespace chunkvault {

/**
 * @brief ObjectStoreClient for nodes backed by a local directory.
 *
 * The node address is the directory path and each key maps to a file below
 * it. A node whose directory does not exist is treated as unreachable. Writes
 * go to a temporary file that is renamed into place, so readers never observe
 * a partial object.
 */
class DirectoryObjectStore : public ObjectStoreClient {
public:
  void putObject(const std::string &address, const std::string &key,
                 const std::vector<std::byte> &data) override;
  std::optional<std::vector<std::byte>>
  getObject(const std::string &address, const std::string &key) override;
  bool deleteObject(const std::string &address,
                    const std::string &key) override;

private:
  static std::filesystem::path objectPath(const std::string &address,
                                          const std::string &key);
};

} // namespace chunkvault

#endif // CHUNKVAULT_DIRECTORY_OBJECT_STORE_HPP
