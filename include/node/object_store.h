/**
 * @file object_store.h
 * @brief Client side of the storage-node transport.
 *
 * A storage node is addressed by StorageNode::address() and stores opaque
 * byte objects under node-local keys. Implementations must be safe to call
 * from several threads at once.
 */
#pragma once
#ifndef CHUNKVAULT_OBJECT_STORE_H
#define CHUNKVAULT_OBJECT_STORE_H

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunkvault {

/// Transport-level failure talking to a storage node.
class ObjectStoreError : public std::runtime_error {
public:
  explicit ObjectStoreError(const std::string &message)
      : std::runtime_error(message) {}
};

class ObjectStoreClient {
public:
  virtual ~ObjectStoreClient() = default;

  /**
   * @brief Store @p data under @p key on the node at @p address, replacing
   * any previous object with that key.
   * @throw ObjectStoreError if the node cannot be reached or the write fails.
   */
  virtual void putObject(const std::string &address, const std::string &key,
                         const std::vector<std::byte> &data) = 0;

  /**
   * @brief Fetch the object stored under @p key.
   * @return std::nullopt if the node has no such object.
   * @throw ObjectStoreError if the node cannot be reached.
   */
  virtual std::optional<std::vector<std::byte>>
  getObject(const std::string &address, const std::string &key) = 0;

  /**
   * @brief Remove the object stored under @p key.
   * @return false if there was nothing to remove.
   * @throw ObjectStoreError if the node cannot be reached.
   */
  virtual bool deleteObject(const std::string &address,
                            const std::string &key) = 0;
};

} // namespace chunkvault

#endif // CHUNKVAULT_OBJECT_STORE_H
