#include "cogdedup/byte_codec.hpp"
#include "cogdedup/chunk_io.hpp"
#include "cogdedup/chunk_store.hpp"
#include "cogdedup/codec.hpp"
#include "cogdedup/decode_router.hpp"
#include "cogdedup/errors.hpp"
#include "cogdedup/predictor.hpp"
#include "cogdedup/wire_format.hpp"
#include "utilities/config.hpp"
#include "utilities/logger.h"
#include "utilities/var_dir.hpp"

#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cogdedup;

namespace {

std::vector<std::byte> readFile(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Cannot open " + path);
  }
  std::vector<char> tmp((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
  std::vector<std::byte> data(tmp.size());
  if (!tmp.empty()) {
    std::memcpy(data.data(), tmp.data(), tmp.size());
  }
  return data;
}

void writeFile(const std::string &path, const std::vector<std::byte> &data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Cannot open " + path + " for writing");
  }
  out.write(reinterpret_cast<const char *>(data.data()),
            static_cast<std::streamsize>(data.size()));
  if (!out) {
    throw std::runtime_error("Failed to write " + path);
  }
}

std::string snapshotPath(const CogdedupConfig &cfg) {
  return cfg.snapshot_path.empty() ? storeSnapshotPath() : cfg.snapshot_path;
}

void initLogging(const CogdedupConfig &cfg) {
  std::string file = cfg.logging.file;
  if (file == "-") {
    file = Logger::CONSOLE_ONLY_OUTPUT;
  } else if (file.empty()) {
    std::filesystem::create_directories(logsDir());
    file = logsDir() + "/cogdedup_ctl.log";
  }
  Logger::init(file, cfg.logging.level, cfg.logging.max_file_size,
               cfg.logging.max_backup_files);
}

// Successor table kept beside the store snapshot.
std::string predictorPath(const CogdedupConfig &cfg) {
  return std::filesystem::path(snapshotPath(cfg))
      .replace_extension(".ucpr")
      .string();
}

void loadPredictor(Predictor &predictor, const CogdedupConfig &cfg) {
  const std::string path = predictorPath(cfg);
  if (std::filesystem::exists(path)) {
    predictor.load(path);
  }
}

void loadStore(ChunkStore &store, const CogdedupConfig &cfg) {
  const std::string path = snapshotPath(cfg);
  if (std::filesystem::exists(path)) {
    store.loadSnapshot(path);
  }
}

void saveStore(const ChunkStore &store, const CogdedupConfig &cfg) {
  const std::string path = snapshotPath(cfg);
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent);
  }
  store.saveSnapshot(path);
}

int encodeCommand(const CogdedupConfig &cfg, const std::string &in,
                  const std::string &out) {
  ChunkStore store(cfg.store);
  loadStore(store, cfg);
  Predictor predictor;
  loadPredictor(predictor, cfg);
  Codec codec(cfg.codec);
  auto data = readFile(in);
  EncodeResult result = codec.encode(data, store, cfg.security, &predictor);
  writeFile(out, result.envelope);
  saveStore(store, cfg);
  predictor.save(predictorPath(cfg));

  const auto &s = result.stats;
  std::cout << "Encoded " << s.original_size << " -> " << s.compressed_size
            << " bytes (" << s.ratio() << "x)\n"
            << "chunks=" << s.chunks << " ref=" << s.ref
            << " delta=" << s.delta << " pred_delta=" << s.pred_delta
            << " full=" << s.full << "\n"
            << "integrity " << s.integrity_hash << std::endl;
  return 0;
}

int decodeCommand(const CogdedupConfig &cfg, const std::string &in,
                  const std::string &out,
                  const std::optional<std::string> &expect) {
  ChunkStore store(cfg.store);
  loadStore(store, cfg);
  DecodeRouter router(cfg.codec);
  auto blob = readFile(in);
  auto data = router.decode(blob, store, cfg.security);
  if (expect) {
    std::string const actual = ChunkIO::hash(data, cfg.store.hash_algo).cid;
    if (actual != *expect) {
      throw IntegrityMismatchError(*expect, actual);
    }
  }
  writeFile(out, data);
  std::cout << "Decoded " << blob.size() << " -> " << data.size() << " bytes"
            << std::endl;
  return 0;
}

void printEnvelope(const Envelope &env) {
  std::map<RecordTag, size_t> counts;
  size_t payload = 0;
  for (const auto &record : env.records) {
    ++counts[recordTag(record)];
    if (const auto *full = std::get_if<FullRecord>(&record)) {
      payload += full->compressed.size();
    } else if (const auto *delta = std::get_if<DeltaRecord>(&record)) {
      payload += delta->diff.size();
    } else if (const auto *pred = std::get_if<PredDeltaRecord>(&record)) {
      payload += pred->diff.size();
    }
  }
  std::cout << "  hash " << hash_algorithm_name(env.hash_algo) << ", "
            << env.records.size() << " records, " << payload
            << " payload bytes\n";
  for (const auto &[tag, n] : counts) {
    std::cout << "  " << recordTagName(tag) << "\t" << n << "\n";
  }
}

int inspectCommand(const std::string &in) {
  auto blob = readFile(in);
  FormatFamily const family = DecodeRouter::detect(blob);
  std::cout << in << ": " << formatFamilyName(family) << ", " << blob.size()
            << " bytes" << std::endl;
  if (family == FormatFamily::CognitiveDedup) {
    printEnvelope(parseEnvelope(blob));
  } else if (family == FormatFamily::Stream) {
    ByteReader r(std::span<const std::byte>(blob).subspan(MAGIC_SIZE));
    r.getU8();
    size_t index = 0;
    for (uint64_t len = r.getUvarint(); len != 0; len = r.getUvarint()) {
      std::cout << "segment " << index++ << ": " << len << " bytes\n";
      printEnvelope(parseEnvelope(r.getBytes(len)));
    }
  } else if (family == FormatFamily::Unknown) {
    return 2;
  }
  return 0;
}

int statsCommand(const CogdedupConfig &cfg) {
  ChunkStore store(cfg.store);
  loadStore(store, cfg);
  StoreStats const s = store.stats();
  std::cout << "Chunks\t" << s.chunks << "\n"
            << "Hot\t" << s.hot << "\n"
            << "Warm\t" << s.warm << "\n"
            << "Cold\t" << s.cold << "\n"
            << "Logical bytes\t" << s.logical_bytes << "\n"
            << "Stored bytes\t" << s.stored_bytes << "\n"
            << "References\t" << s.total_references << "\n"
            << "Dedup ratio\t" << s.dedup_ratio << std::endl;
  return 0;
}

int gcCommand(const CogdedupConfig &cfg, bool dryRun) {
  ChunkStore store(cfg.store);
  loadStore(store, cfg);
  auto stats = store.garbageCollect(store.registeredChunks(), dryRun);
  if (!dryRun) {
    saveStore(store, cfg);
  }
  std::cout << "Total chunks: " << stats.totalChunks << "\n"
            << "Reclaimable: " << stats.reclaimableChunks << " ("
            << stats.reclaimableBytes << " bytes)\n"
            << "Freed: " << stats.freedChunks << " (" << stats.freedBytes
            << " bytes)" << std::endl;
  return 0;
}

int fallbackCommand(const CogdedupConfig &cfg, const std::string &in,
                    const std::string &out, const std::string &method) {
  auto data = readFile(in);
  std::vector<std::byte> blob;
  if (method == "zstd") {
    blob = DecodeRouter::encodeRawFallback(data, cfg.codec.compression_level);
  } else if (method == "brotli") {
    blob = DecodeRouter::encodeBrotliFallback(data);
  } else if (method == "bzip2") {
    blob = DecodeRouter::encodeBzip2Fallback(data);
  } else {
    throw std::invalid_argument("Unknown fallback method: " + method);
  }
  writeFile(out, blob);
  std::cout << "Wrote " << printableTag(blob) << " " << data.size() << " -> "
            << blob.size() << " bytes" << std::endl;
  return 0;
}

void usage() {
  std::cout << "Usage: cogdedup_ctl encode <input> <output>\n"
               "       cogdedup_ctl decode <input> <output> [--expect <cid>]\n"
               "       cogdedup_ctl inspect <blob>\n"
               "       cogdedup_ctl fallback <input> <output> [zstd|brotli|bzip2]\n"
               "       cogdedup_ctl stats\n"
               "       cogdedup_ctl gc [--dry-run]\n";
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  const std::string cmd = argv[1];

  CogdedupConfig cfg;
  try {
    cfg = loadRuntimeConfig();
    initLogging(cfg);
  } catch (const std::exception &e) {
    std::cerr << "Configuration error: " << e.what() << std::endl;
    return 1;
  }

  try {
    if (cmd == "encode" && argc == 4) {
      return encodeCommand(cfg, argv[2], argv[3]);
    }
    if (cmd == "decode" && (argc == 4 || argc == 6)) {
      std::optional<std::string> expect;
      if (argc == 6) {
        if (std::string(argv[4]) != "--expect") {
          usage();
          return 1;
        }
        expect = argv[5];
      }
      return decodeCommand(cfg, argv[2], argv[3], expect);
    }
    if (cmd == "inspect" && argc == 3) {
      return inspectCommand(argv[2]);
    }
    if (cmd == "fallback" && (argc == 4 || argc == 5)) {
      return fallbackCommand(cfg, argv[2], argv[3],
                             argc == 5 ? argv[4] : "zstd");
    }
    if (cmd == "stats" && argc == 2) {
      return statsCommand(cfg);
    }
    if (cmd == "gc" && (argc == 2 || argc == 3)) {
      bool const dryRun = argc == 3 && std::string(argv[2]) == "--dry-run";
      if (argc == 3 && !dryRun) {
        usage();
        return 1;
      }
      return gcCommand(cfg, dryRun);
    }
  } catch (const CodecError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, "cogdedup_ctl", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  usage();
  return 1;
}
