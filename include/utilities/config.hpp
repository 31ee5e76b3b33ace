#pragma once

#include "cogdedup/chunk_store.hpp"
#include "cogdedup/codec.hpp"
#include "cogdedup/integrity.hpp"
#include "utilities/logger.h"

#include <string>

namespace cogdedup {

struct LoggingConfig {
  /// Empty means <var dir>/logs/cogdedup.log; "-" means console only.
  std::string file;
  LogLevel level = LogLevel::INFO;
  long long max_file_size = 10 * 1024 * 1024;
  int max_backup_files = 5;
};

struct CogdedupConfig {
  SecurityPolicy security;
  CodecOptions codec;
  StoreConfig store;
  LoggingConfig logging;
  /// Empty means storeSnapshotPath().
  std::string snapshot_path;
};

/**
 * @brief Parse a YAML document.
 *
 * Recognised sections: security, chunker, store, codec, logging. Missing
 * keys keep their defaults.
 * @throw YAML::Exception On malformed YAML or mistyped values.
 * @throw std::invalid_argument On out-of-range values.
 */
CogdedupConfig loadConfigFromString(const std::string &yaml);

/// As loadConfigFromString() for a file; YAML::BadFile if unreadable.
CogdedupConfig loadConfig(const std::string &path);

/**
 * @brief Apply COGDEDUP_* environment variables on top of @p config.
 *
 * COGDEDUP_MAX_DELTA_EXPANSION, COGDEDUP_VERIFY_DELTAS,
 * COGDEDUP_MAX_REF_COUNT, COGDEDUP_ZSTD_LEVEL, COGDEDUP_HASH_ALGO,
 * COGDEDUP_LOG_LEVEL.
 */
void applyEnvironmentOverrides(CogdedupConfig &config);

/**
 * @brief Config used by the command line tools.
 *
 * Reads the file named by COGDEDUP_CONFIG, or cogdedup.yaml in the
 * working directory when present, then applies environment overrides.
 */
CogdedupConfig loadRuntimeConfig();

/// @throw std::invalid_argument If any value is out of range.
void validateConfig(const CogdedupConfig &config);

} // namespace cogdedup
