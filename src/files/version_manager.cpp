#include "files/version_manager.h"
#include "storage/errors.h"
#include "utilities/logger.h"

#include <ctime>

namespace chunkvault {

VersionManager::VersionManager(MetadataRepository &repo) : repo_(repo) {}

FileVersion VersionManager::snapshot(const std::string &fileId,
                                     const std::string &note,
                                     const std::string &actor) {
  auto lock = repo_.lockFile(fileId);
  auto file = repo_.findFile(fileId);
  if (!file) {
    throw NotFoundError("Unknown file: " + fileId);
  }
  FileVersion version =
      repo_.appendVersion(fileId, file->size, file->checksum, actor, note,
                          std::time(nullptr));
  Logger::getInstance().log(LogLevel::INFO,
                            "[VersionManager] Recorded version " +
                                std::to_string(version.versionNumber) +
                                " of " + file->name + " (" + fileId + ")");
  return version;
}

File VersionManager::restore(const std::string &versionId) {
  auto version = repo_.findVersion(versionId);
  if (!version) {
    throw NotFoundError("Unknown version: " + versionId);
  }
  auto lock = repo_.lockFile(version->fileId);
  auto file = repo_.findFile(version->fileId);
  if (!file) {
    throw NotFoundError("Version " + versionId + " refers to missing file " +
                        version->fileId);
  }
  file->size = version->size;
  file->checksum = version->checksum;
  file->updatedAt = std::time(nullptr);
  repo_.updateFile(*file);
  Logger::getInstance().log(LogLevel::INFO,
                            "[VersionManager] Restored " + file->name +
                                " to version " +
                                std::to_string(version->versionNumber));
  return *file;
}

std::vector<FileVersion>
VersionManager::listVersions(const std::string &fileId) const {
  if (!repo_.findFile(fileId)) {
    throw NotFoundError("Unknown file: " + fileId);
  }
  return repo_.versionsForFile(fileId);
}

std::optional<FileVersion>
VersionManager::latestVersion(const std::string &fileId) const {
  auto versions = repo_.versionsForFile(fileId);
  if (versions.empty()) {
    return std::nullopt;
  }
  return versions.front();
}

} // namespace chunkvault
