#include "utilities/config.hpp"
#include "storage/errors.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <limits>
#include <stdexcept>
#include <type_traits>
#include <yaml-cpp/yaml.h>

namespace chunkvault {

namespace {

std::string envName(const std::string &key) {
  std::string name = "CHUNKVAULT_" + key;
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return name;
}

bool parseBool(const std::string &key, const std::string &raw) {
  std::string v(raw);
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (v == "1" || v == "true" || v == "yes" || v == "on")
    return true;
  if (v == "0" || v == "false" || v == "no" || v == "off")
    return false;
  throw InvalidInputError("Invalid boolean for " + key + ": " + raw);
}

template <typename T>
T parseNumber(const std::string &key, const std::string &raw) {
  try {
    return static_cast<T>(parseUnsigned(
        raw, static_cast<uint64_t>(std::numeric_limits<T>::max())));
  } catch (const InvalidInputError &) {
    throw InvalidInputError("Invalid number for " + key + ": " + raw);
  }
}

// Reads one key from the YAML document and then from the environment.
template <typename T>
void apply(const YAML::Node &doc, const std::string &key, T &target) {
  if (doc.IsMap() && doc[key]) {
    try {
      if constexpr (std::is_same_v<T, bool>) {
        target = doc[key].as<bool>();
      } else {
        target = doc[key].as<T>();
      }
    } catch (const YAML::Exception &e) {
      throw InvalidInputError("Invalid value for config key '" + key +
                              "': " + e.what());
    }
  }
  if (const char *env = std::getenv(envName(key).c_str())) {
    if constexpr (std::is_same_v<T, bool>) {
      target = parseBool(key, env);
    } else if constexpr (std::is_same_v<T, std::string>) {
      target = env;
    } else {
      target = parseNumber<T>(key, env);
    }
  }
}

} // namespace

uint64_t parseUnsigned(const std::string &text, uint64_t max) {
  // stoull accepts a leading sign or whitespace; a count does not.
  if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
    throw InvalidInputError("Invalid number '" + text + "'");
  }
  uint64_t value = 0;
  try {
    size_t consumed = 0;
    value = std::stoull(text, &consumed);
    if (consumed != text.size()) {
      throw InvalidInputError("Invalid number '" + text + "'");
    }
  } catch (const std::logic_error &) {
    throw InvalidInputError("Invalid number '" + text + "'");
  }
  if (value > max) {
    throw InvalidInputError("Number '" + text + "' exceeds " +
                            std::to_string(max));
  }
  return value;
}

uint64_t parseByteSize(const std::string &text) {
  if (text.empty()) {
    throw InvalidInputError("Empty size");
  }
  uint64_t multiplier = 1;
  std::string digits = text;
  char suffix = static_cast<char>(
      std::toupper(static_cast<unsigned char>(text.back())));
  if (std::isalpha(static_cast<unsigned char>(suffix))) {
    digits.pop_back();
    switch (suffix) {
    case 'K':
      multiplier = 1024ULL;
      break;
    case 'M':
      multiplier = 1024ULL * 1024;
      break;
    case 'G':
      multiplier = 1024ULL * 1024 * 1024;
      break;
    case 'T':
      multiplier = 1024ULL * 1024 * 1024 * 1024;
      break;
    default:
      throw InvalidInputError("Unknown size suffix in '" + text + "'");
    }
  }
  return parseUnsigned(digits,
                       std::numeric_limits<uint64_t>::max() / multiplier) *
         multiplier;
}

void StorageConfig::validate() const {
  if (chunkAlignment == 0) {
    throw InvalidInputError("chunk_alignment must be positive");
  }
  if (maxChunkSize == 0 || maxChunkSize % chunkAlignment != 0) {
    throw InvalidInputError(
        "max_chunk_size must be a positive multiple of chunk_alignment");
  }
  if (chunkSize == 0 || chunkSize % chunkAlignment != 0 ||
      chunkSize > maxChunkSize) {
    throw InvalidInputError("chunk_size must be a positive multiple of "
                            "chunk_alignment no larger than max_chunk_size");
  }
  if (maxReplicationFactor == 0) {
    throw InvalidInputError("max_replication_factor must be at least 1");
  }
  if (replicationFactor == 0 || replicationFactor > maxReplicationFactor) {
    throw InvalidInputError(
        "replication_factor must be between 1 and max_replication_factor");
  }
  if (nodeWriteTimeoutMs == 0) {
    throw InvalidInputError("node_write_timeout_ms must be positive");
  }
  if (uploadParallelism == 0) {
    throw InvalidInputError("upload_parallelism must be at least 1");
  }
  if (nodeFailureThreshold == 0 || nodeSuccessThreshold == 0) {
    throw InvalidInputError("node health thresholds must be at least 1");
  }
  if (varDir.empty()) {
    throw InvalidInputError("var_dir must not be empty");
  }
}

StorageConfig loadConfig(const std::string &path) {
  StorageConfig cfg;
  YAML::Node doc;
  if (!path.empty() && std::filesystem::exists(path)) {
    try {
      doc = YAML::LoadFile(path);
    } catch (const YAML::Exception &e) {
      throw InvalidInputError("Failed to parse config file " + path + ": " +
                              e.what());
    }
  }

  apply(doc, "chunk_size", cfg.chunkSize);
  apply(doc, "chunk_alignment", cfg.chunkAlignment);
  apply(doc, "max_chunk_size", cfg.maxChunkSize);
  apply(doc, "replication_factor", cfg.replicationFactor);
  apply(doc, "max_replication_factor", cfg.maxReplicationFactor);
  apply(doc, "node_write_timeout_ms", cfg.nodeWriteTimeoutMs);
  apply(doc, "verify_after_write", cfg.verifyAfterWrite);
  apply(doc, "upload_parallelism", cfg.uploadParallelism);
  apply(doc, "max_buffered_read_bytes", cfg.maxBufferedReadBytes);
  apply(doc, "heartbeat_timeout_seconds", cfg.heartbeatTimeoutSeconds);
  apply(doc, "node_failure_threshold", cfg.nodeFailureThreshold);
  apply(doc, "node_success_threshold", cfg.nodeSuccessThreshold);
  apply(doc, "node_dead_cooldown_seconds", cfg.nodeDeadCooldownSeconds);
  apply(doc, "var_dir", cfg.varDir);
  apply(doc, "log_max_file_size", cfg.logMaxFileSize);
  apply(doc, "log_max_backups", cfg.logMaxBackups);

  std::string level;
  apply(doc, "log_level", level);
  if (!level.empty()) {
    try {
      cfg.logLevel = logLevelFromString(level);
    } catch (const std::invalid_argument &e) {
      throw InvalidInputError(e.what());
    }
  }

  cfg.validate();
  return cfg;
}

StorageConfig loadConfigFromEnvironment() {
  const char *cfg = std::getenv("CHUNKVAULT_CONFIG");
  return loadConfig(cfg ? cfg : DEFAULT_CONFIG_FILE);
}

} // namespace chunkvault
