#pragma once
#ifndef CHUNKVAULT_CONFIG_HPP
#define CHUNKVAULT_CONFIG_HPP

#include "utilities/logger.h"

#include <cstdint>
#include <string>

namespace chunkvault {

/// Name of the config file looked up when CHUNKVAULT_CONFIG is unset.
inline constexpr const char *DEFAULT_CONFIG_FILE = "chunkvault_config.yaml";

/**
 * @brief Runtime options shared by every component.
 *
 * Values come from the YAML file first and from CHUNKVAULT_<KEY> environment
 * variables second, so the environment always wins.
 */
struct StorageConfig {
  uint64_t chunkSize = 1024 * 1024;
  uint64_t chunkAlignment = 4096;
  uint64_t maxChunkSize = 64ULL * 1024 * 1024;
  unsigned int replicationFactor = 2;
  unsigned int maxReplicationFactor = 3;
  unsigned int nodeWriteTimeoutMs = 5000;
  bool verifyAfterWrite = true;
  unsigned int uploadParallelism = 4;
  uint64_t maxBufferedReadBytes = 16ULL * 1024 * 1024;
  unsigned int heartbeatTimeoutSeconds = 30;
  unsigned int nodeFailureThreshold = 2;
  unsigned int nodeSuccessThreshold = 1;
  unsigned int nodeDeadCooldownSeconds = 15;
  std::string varDir = "var/chunkvault";
  LogLevel logLevel = LogLevel::INFO;
  long long logMaxFileSize = 10 * 1024 * 1024;
  int logMaxBackups = 5;

  /**
   * @brief Check cross-field consistency.
   * @throw InvalidInputError describing the first violated rule.
   */
  void validate() const;
};

/**
 * @brief Load configuration from @p path, then apply environment overrides.
 *
 * A missing file yields the defaults. A file that exists but cannot be parsed,
 * or holds a value of the wrong type, is an error.
 * @throw InvalidInputError on parse or validation failure.
 */
StorageConfig loadConfig(const std::string &path);

/** Load from $CHUNKVAULT_CONFIG or DEFAULT_CONFIG_FILE. */
StorageConfig loadConfigFromEnvironment();

/**
 * @brief Parse a decimal count no larger than @p max.
 * @throw InvalidInputError on signs, junk characters or out-of-range values.
 */
uint64_t parseUnsigned(const std::string &text, uint64_t max);

/**
 * @brief Parse a byte count with an optional K/M/G/T suffix (powers of 1024).
 * @throw InvalidInputError if malformed or if the result overflows 64 bits.
 */
uint64_t parseByteSize(const std::string &text);

} // namespace chunkvault

#endif // CHUNKVAULT_CONFIG_HPP
