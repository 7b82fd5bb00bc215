#pragma once
#ifndef CHUNKVAULT_VERSION_MANAGER_H
#define CHUNKVAULT_VERSION_MANAGER_H

#include "storage/metadata_repository.h"

#include <optional>
#include <string>
#include <vector>

namespace chunkvault {

/**
 * @brief Records and restores (size, checksum) snapshots of files.
 *
 * Versions are metadata only: restoring one does not bring back chunks that
 * have since been collected, and reads of such a file fail with
 * IncompleteFileError.
 */
class VersionManager {
public:
  explicit VersionManager(MetadataRepository &repo);

  /**
   * @brief Record the file's current (size, checksum) as its next version.
   * @throw NotFoundError for an unknown file.
   */
  FileVersion snapshot(const std::string &fileId, const std::string &note,
                       const std::string &actor);

  /**
   * @brief Rewrite the owning file's (size, checksum) from a version.
   *
   * No version is created, removed or renumbered.
   * @return The updated file.
   * @throw NotFoundError for an unknown version or file.
   */
  File restore(const std::string &versionId);

  /** Newest first. @throw NotFoundError for an unknown file. */
  std::vector<FileVersion> listVersions(const std::string &fileId) const;

  std::optional<FileVersion> latestVersion(const std::string &fileId) const;

private:
  MetadataRepository &repo_;
};

} // namespace chunkvault

#endif // CHUNKVAULT_VERSION_MANAGER_H
