#include "utilities/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace cogdedup {

namespace {

template <typename T>
void readKey(const YAML::Node &section, const char *key, T &out) {
  if (section && section[key]) {
    out = section[key].template as<T>();
  }
}

bool parseBool(const std::string &name, const std::string &value) {
  if (value == "1" || value == "true" || value == "yes" || value == "on")
    return true;
  if (value == "0" || value == "false" || value == "no" || value == "off")
    return false;
  throw std::invalid_argument(name + " must be a boolean, got '" + value + "'");
}

CogdedupConfig fromNode(const YAML::Node &root) {
  CogdedupConfig cfg;

  const YAML::Node security = root["security"];
  readKey(security, "max_ref_count_for_similarity",
          cfg.security.max_ref_count_for_similarity);
  readKey(security, "verify_deltas", cfg.security.verify_deltas);
  readKey(security, "max_delta_expansion", cfg.security.max_delta_expansion);
  readKey(security, "max_chunk_bytes", cfg.security.max_chunk_bytes);

  const YAML::Node chunker = root["chunker"];
  readKey(chunker, "min_size", cfg.codec.chunker.min_size);
  readKey(chunker, "avg_size", cfg.codec.chunker.avg_size);
  readKey(chunker, "max_size", cfg.codec.chunker.max_size);
  readKey(chunker, "window", cfg.codec.chunker.window);

  const YAML::Node codec = root["codec"];
  readKey(codec, "zstd_level", cfg.codec.compression_level);
  readKey(codec, "max_candidates", cfg.codec.max_candidates);

  const YAML::Node store = root["store"];
  if (store && store["hash_algorithm"]) {
    cfg.store.hash_algo =
        parse_hash_algorithm(store["hash_algorithm"].as<std::string>());
  }
  readKey(store, "hot_threshold", cfg.store.hot_threshold);
  readKey(store, "max_warm_chunks", cfg.store.max_warm_chunks);
  readKey(store, "promote_threshold", cfg.store.promote_threshold);
  readKey(store, "cold_compression_level", cfg.store.cold_compression_level);
  readKey(store, "snapshot_path", cfg.snapshot_path);

  const YAML::Node logging = root["logging"];
  readKey(logging, "file", cfg.logging.file);
  if (logging && logging["level"]) {
    cfg.logging.level = parseLogLevel(logging["level"].as<std::string>());
  }
  readKey(logging, "max_file_size", cfg.logging.max_file_size);
  readKey(logging, "max_backup_files", cfg.logging.max_backup_files);

  validateConfig(cfg);
  return cfg;
}

} // namespace

void validateConfig(const CogdedupConfig &cfg) {
  if (cfg.security.max_ref_count_for_similarity == 0) {
    throw std::invalid_argument("max_ref_count_for_similarity must be positive");
  }
  if (!(cfg.security.max_delta_expansion > 0.0)) {
    throw std::invalid_argument("max_delta_expansion must be positive");
  }
  if (cfg.security.max_chunk_bytes == 0) {
    throw std::invalid_argument("max_chunk_bytes must be positive");
  }
  if (cfg.codec.chunker.max_size > cfg.security.max_chunk_bytes) {
    throw std::invalid_argument("chunker.max_size exceeds max_chunk_bytes");
  }
  if (cfg.store.promote_threshold == 0 || cfg.store.hot_threshold == 0) {
    throw std::invalid_argument("store thresholds must be positive");
  }
  if (cfg.codec.max_candidates == 0) {
    throw std::invalid_argument("codec.max_candidates must be positive");
  }
  // Chunker parameters are validated by its constructor.
  Chunker check(cfg.codec.chunker);
  (void)check;
}

CogdedupConfig loadConfigFromString(const std::string &yaml) {
  return fromNode(YAML::Load(yaml));
}

CogdedupConfig loadConfig(const std::string &path) {
  return fromNode(YAML::LoadFile(path));
}

void applyEnvironmentOverrides(CogdedupConfig &cfg) {
  if (const char *env = std::getenv("COGDEDUP_MAX_DELTA_EXPANSION"))
    cfg.security.max_delta_expansion = std::stod(env);
  if (const char *env = std::getenv("COGDEDUP_VERIFY_DELTAS"))
    cfg.security.verify_deltas = parseBool("COGDEDUP_VERIFY_DELTAS", env);
  if (const char *env = std::getenv("COGDEDUP_MAX_REF_COUNT"))
    cfg.security.max_ref_count_for_similarity = std::stoull(env);
  if (const char *env = std::getenv("COGDEDUP_ZSTD_LEVEL"))
    cfg.codec.compression_level = std::stoi(env);
  if (const char *env = std::getenv("COGDEDUP_HASH_ALGO"))
    cfg.store.hash_algo = parse_hash_algorithm(env);
  if (const char *env = std::getenv("COGDEDUP_LOG_LEVEL"))
    cfg.logging.level = parseLogLevel(env);
  validateConfig(cfg);
}

CogdedupConfig loadRuntimeConfig() {
  CogdedupConfig cfg;
  const char *path = std::getenv("COGDEDUP_CONFIG");
  if (path && path[0] != '\0') {
    cfg = loadConfig(path);
  } else if (std::filesystem::exists("cogdedup.yaml")) {
    cfg = loadConfig("cogdedup.yaml");
  }
  applyEnvironmentOverrides(cfg);
  return cfg;
}

} // namespace cogdedup
