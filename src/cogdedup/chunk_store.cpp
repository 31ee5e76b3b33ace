#include "cogdedup/chunk_store.hpp"
#include "cogdedup/byte_codec.hpp"
#include "cogdedup/chunk_io.hpp"
#include "cogdedup/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <tuple>

namespace cogdedup {

namespace {

constexpr char kSnapshotMagic[5] = "UCST";
constexpr uint8_t kSnapshotVersion = 1;
constexpr uint8_t kFlagPromoted = 0x01;

const std::string kComponent = "chunk_store";

} // namespace

const char *tierName(Tier tier) {
  switch (tier) {
  case Tier::Hot:
    return "hot";
  case Tier::Warm:
    return "warm";
  case Tier::Cold:
    return "cold";
  case Tier::Shared:
    return "shared";
  }
  return "unknown";
}

ChunkStore::ChunkStore(StoreConfig config, std::shared_ptr<ChunkStore> shared)
    : config_(config), shared_(std::move(shared)), hasher_(config.hash_algo) {
  if (shared_ && shared_.get() == this) {
    throw std::invalid_argument("A store cannot be its own shared tier");
  }
}

void ChunkStore::touch(const Entry &entry) const {
  entry.last_access.store(clock_.fetch_add(1) + 1, std::memory_order_relaxed);
}

std::vector<std::byte> ChunkStore::payloadOf(const Entry &entry) const {
  if (entry.tier != Tier::Cold) {
    return entry.payload;
  }
  ChunkIO io(config_.hash_algo, config_.cold_compression_level);
  return io.decompress_data(entry.payload, entry.size);
}

Chunk ChunkStore::toChunk(const std::string &cid, const Entry &entry) const {
  Chunk c;
  c.cid = cid;
  c.digest = entry.digest;
  c.fingerprint = entry.fingerprint;
  c.size = entry.size;
  c.ref_count = entry.ref_count;
  c.tier = entry.tier;
  c.payload = payloadOf(entry);
  return c;
}

void ChunkStore::rehydrate(Entry &entry) {
  if (entry.tier != Tier::Cold) {
    return;
  }
  entry.payload = payloadOf(entry);
  entry.tier = Tier::Warm;
}

void ChunkStore::onReferenced(const std::string &cid, Entry &entry,
                              std::vector<std::byte> *promote_payload) {
  rehydrate(entry);
  touch(entry);
  if (!config_.shared_tier && entry.tier == Tier::Warm &&
      entry.ref_count >= config_.hot_threshold) {
    entry.tier = Tier::Hot;
    Logger::getInstance().log(LogLevel::DEBUG, kComponent,
                              "Chunk " + cid + " is now hot (refs=" +
                                  std::to_string(entry.ref_count) + ")");
  }
  if (shared_ && promote_payload && !entry.promoted &&
      entry.ref_count >= config_.promote_threshold) {
    entry.promoted = true;
    *promote_payload = entry.payload;
  }
}

PutResult ChunkStore::put(std::span<const std::byte> data) {
  return put(data, hasher_.identify(data));
}

PutResult ChunkStore::put(std::span<const std::byte> data,
                          const ChunkIdentity &id) {
  PutResult result;
  result.cid = id.cid;
  std::vector<std::byte> promote_payload;
  bool promote_now = false;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = chunks_.find(id.cid);
    if (it != chunks_.end()) {
      Entry &entry = *it->second;
      ++entry.ref_count;
      bool const was_promoted = entry.promoted;
      onReferenced(id.cid, entry, &promote_payload);
      promote_now = !was_promoted && entry.promoted;
      result.inserted = false;
      result.ref_count = entry.ref_count;
    } else {
      auto entry = std::make_unique<Entry>();
      entry->digest = id.digest;
      entry->fingerprint = id.fingerprint;
      entry->size = data.size();
      entry->tier = baseTier();
      entry->payload.assign(data.begin(), data.end());
      touch(*entry);
      bool const was_promoted = entry->promoted;
      onReferenced(id.cid, *entry, &promote_payload);
      promote_now = !was_promoted && entry->promoted;
      lsh_.insert(id.cid, id.fingerprint);
      chunks_.emplace(id.cid, std::move(entry));
      result.inserted = true;
      result.ref_count = 1;
      demoteLocked();
    }
  }
  if (promote_now) {
    shared_->put(promote_payload);
    Logger::getInstance().log(LogLevel::INFO, kComponent,
                              "Promoted " + id.cid + " to shared tier");
  }
  return result;
}

std::optional<Chunk> ChunkStore::find(const std::string &cid) const {
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = chunks_.find(cid);
    if (it != chunks_.end()) {
      touch(*it->second);
      return toChunk(cid, *it->second);
    }
  }
  if (shared_) {
    return shared_->find(cid);
  }
  return std::nullopt;
}

Chunk ChunkStore::get(const std::string &cid) const {
  auto chunk = find(cid);
  if (!chunk) {
    throw NotFoundError(cid);
  }
  return std::move(*chunk);
}

bool ChunkStore::containsLocal(const std::string &cid) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return chunks_.count(cid) > 0;
}

bool ChunkStore::contains(const std::string &cid) const {
  if (containsLocal(cid)) {
    return true;
  }
  return shared_ && shared_->contains(cid);
}

uint64_t ChunkStore::refCount(const std::string &cid) const {
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = chunks_.find(cid);
    if (it != chunks_.end()) {
      return it->second->ref_count;
    }
  }
  return shared_ ? shared_->refCount(cid) : 0;
}

uint64_t ChunkStore::addReference(const std::string &cid) {
  uint64_t refs = 0;
  std::vector<std::byte> promote_payload;
  bool promote_now = false;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = chunks_.find(cid);
    if (it != chunks_.end()) {
      Entry &entry = *it->second;
      ++entry.ref_count;
      bool const was_promoted = entry.promoted;
      onReferenced(cid, entry, &promote_payload);
      promote_now = !was_promoted && entry.promoted;
      refs = entry.ref_count;
    }
  }
  if (refs == 0) {
    if (shared_) {
      return shared_->addReference(cid);
    }
    throw NotFoundError(cid);
  }
  if (promote_now) {
    shared_->put(promote_payload);
    Logger::getInstance().log(LogLevel::INFO, kComponent,
                              "Promoted " + cid + " to shared tier");
  }
  return refs;
}

std::vector<SimilarCandidate>
ChunkStore::findSimilar(uint64_t fingerprint, size_t max_candidates) const {
  std::vector<SimilarCandidate> out;
  std::unordered_set<std::string> seen;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (auto &[cid, distance] :
         lsh_.withinDistance(fingerprint, SIMILARITY_THRESHOLD)) {
      auto it = chunks_.find(cid);
      if (it == chunks_.end()) {
        continue;
      }
      seen.insert(cid);
      out.push_back({cid, distance, it->second->ref_count});
    }
  }
  if (shared_) {
    for (auto &c : shared_->findSimilar(fingerprint, max_candidates)) {
      if (seen.insert(c.cid).second) {
        out.push_back(std::move(c));
      }
    }
  }
  std::sort(out.begin(), out.end(),
            [](const SimilarCandidate &a, const SimilarCandidate &b) {
              return std::tie(a.distance, a.ref_count, a.cid) <
                     std::tie(b.distance, b.ref_count, b.cid);
            });
  if (out.size() > max_candidates) {
    out.resize(max_candidates);
  }
  return out;
}

bool ChunkStore::promote(const std::string &cid) {
  std::vector<std::byte> payload;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = chunks_.find(cid);
    if (it == chunks_.end()) {
      throw NotFoundError(cid);
    }
    Entry &entry = *it->second;
    if (!shared_) {
      return false;
    }
    if (entry.promoted) {
      return true;
    }
    if (entry.ref_count < config_.promote_threshold) {
      return false;
    }
    entry.promoted = true;
    payload = payloadOf(entry);
  }
  try {
    shared_->put(payload);
  } catch (...) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = chunks_.find(cid);
    if (it != chunks_.end()) {
      it->second->promoted = false;
    }
    throw;
  }
  Logger::getInstance().log(LogLevel::INFO, kComponent,
                            "Promoted " + cid + " to shared tier");
  return true;
}

void ChunkStore::pin(const std::string &cid) { pinHolder(cid); }

ChunkStore &ChunkStore::pinHolder(const std::string &cid) {
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = chunks_.find(cid);
    if (it != chunks_.end()) {
      ++it->second->pins;
      return *this;
    }
  }
  if (!shared_) {
    throw NotFoundError(cid);
  }
  return shared_->pinHolder(cid);
}

bool ChunkStore::unpinLocal(const std::string &cid) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = chunks_.find(cid);
  if (it == chunks_.end()) {
    return false;
  }
  if (it->second->pins > 0) {
    --it->second->pins;
  }
  return true;
}

void ChunkStore::unpin(const std::string &cid) {
  if (unpinLocal(cid)) {
    return;
  }
  if (shared_) {
    shared_->unpin(cid);
  }
}

ChunkStore::PinGuard::PinGuard(ChunkStore &store, std::string cid)
    : store_(nullptr), cid_(std::move(cid)) {
  store_ = &store.pinHolder(cid_);
}

ChunkStore::PinGuard::PinGuard(PinGuard &&other) noexcept
    : store_(other.store_), cid_(std::move(other.cid_)) {
  other.store_ = nullptr;
}

ChunkStore::PinGuard::~PinGuard() {
  if (store_) {
    store_->unpinLocal(cid_);
  }
}

bool ChunkStore::evict(const std::string &cid) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = chunks_.find(cid);
  if (it == chunks_.end()) {
    return false;
  }
  if (it->second->pins > 0) {
    Logger::getInstance().log(LogLevel::WARN, kComponent,
                              "Refusing to evict pinned chunk " + cid);
    return false;
  }
  lsh_.remove(cid);
  chunks_.erase(it);
  return true;
}

ChunkStore::GCStats ChunkStore::garbageCollect(
    const std::unordered_set<std::string> &referencedCids, bool dryRun) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  GCStats stats{};
  stats.totalChunks = chunks_.size();

  for (auto it = chunks_.begin(); it != chunks_.end();) {
    const Entry &entry = *it->second;
    if (referencedCids.count(it->first) == 0 && entry.pins == 0) {
      stats.reclaimableChunks++;
      stats.reclaimableBytes += entry.payload.size();
      if (!dryRun) {
        stats.freedChunks++;
        stats.freedBytes += entry.payload.size();
        lsh_.remove(it->first);
        it = chunks_.erase(it);
        continue;
      }
    }
    ++it;
  }
  Logger::getInstance().log(
      LogLevel::INFO, kComponent,
      std::string(dryRun ? "GC dry run: " : "GC: ") +
          std::to_string(stats.reclaimableChunks) + " of " +
          std::to_string(stats.totalChunks) + " chunks reclaimable");
  return stats;
}

size_t ChunkStore::demoteColdChunks() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  return demoteLocked();
}

size_t ChunkStore::demoteLocked() {
  if (config_.max_warm_chunks == 0 || config_.shared_tier) {
    return 0;
  }
  size_t warm = 0;
  std::vector<std::tuple<uint64_t, uint64_t, const std::string *, Entry *>>
      candidates;
  for (auto &[cid, entry] : chunks_) {
    if (entry->tier != Tier::Warm) {
      continue;
    }
    ++warm;
    if (entry->pins == 0) {
      candidates.emplace_back(entry->ref_count,
                              entry->last_access.load(std::memory_order_relaxed),
                              &cid, entry.get());
    }
  }
  if (warm <= config_.max_warm_chunks) {
    return 0;
  }
  std::sort(candidates.begin(), candidates.end(),
            [](const auto &a, const auto &b) {
              return std::tie(std::get<0>(a), std::get<1>(a), *std::get<2>(a)) <
                     std::tie(std::get<0>(b), std::get<1>(b), *std::get<2>(b));
            });

  ChunkIO io(config_.hash_algo, config_.cold_compression_level);
  size_t demoted = 0;
  for (auto &candidate : candidates) {
    if (warm <= config_.max_warm_chunks) {
      break;
    }
    Entry &entry = *std::get<3>(candidate);
    entry.payload = io.compress_data(entry.payload);
    entry.tier = Tier::Cold;
    --warm;
    ++demoted;
  }
  if (demoted > 0) {
    Logger::getInstance().log(LogLevel::DEBUG, kComponent,
                              "Demoted " + std::to_string(demoted) +
                                  " chunks to cold tier");
  }
  return demoted;
}

void ChunkStore::registerData(const std::string &data_id,
                              const std::vector<std::string> &cids) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  data_chunks_[data_id] =
      std::unordered_set<std::string>(cids.begin(), cids.end());
}

std::unordered_set<std::string>
ChunkStore::chunksForData(const std::string &data_id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = data_chunks_.find(data_id);
  if (it == data_chunks_.end()) {
    return {};
  }
  return it->second;
}

std::unordered_set<std::string> ChunkStore::registeredChunks() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::unordered_set<std::string> out;
  for (const auto &[id, set] : data_chunks_) {
    out.insert(set.begin(), set.end());
  }
  return out;
}

std::vector<std::string> ChunkStore::cids() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<std::string> out;
  out.reserve(chunks_.size());
  for (const auto &[cid, entry] : chunks_) {
    out.push_back(cid);
  }
  return out;
}

void ChunkStore::saveSnapshot(const std::string &path) const {
  ByteWriter w;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    w.putTag(kSnapshotMagic);
    w.putU8(kSnapshotVersion);
    w.putU8(static_cast<uint8_t>(config_.hash_algo));
    w.putUvarint(chunks_.size());
    for (const auto &[cid, entry] : chunks_) {
      w.putDigest(entry->digest);
      w.putU64(entry->fingerprint);
      w.putUvarint(entry->ref_count);
      w.putU8(static_cast<uint8_t>(entry->tier));
      w.putU8(entry->promoted ? kFlagPromoted : 0);
      w.putUvarint(entry->size);
      w.putUvarint(entry->payload.size());
      w.putBytes(entry->payload);
    }
    w.putUvarint(data_chunks_.size());
    for (const auto &[id, set] : data_chunks_) {
      w.putUvarint(id.size());
      w.putBytes(std::as_bytes(std::span<const char>(id.data(), id.size())));
      w.putUvarint(set.size());
      for (const auto &cid : set) {
        w.putDigest(cid_to_digest(cid));
      }
    }
  }

  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("Failed to open snapshot for writing: " + tmp);
    }
    const auto &bytes = w.bytes();
    out.write(reinterpret_cast<const char *>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    if (!out) {
      throw std::runtime_error("Failed to write snapshot: " + tmp);
    }
  }
  std::filesystem::rename(tmp, path);
  Logger::getInstance().log(LogLevel::INFO, kComponent,
                            "Saved snapshot of " + std::to_string(w.size()) +
                                " bytes to " + path);
}

void ChunkStore::loadSnapshot(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open snapshot: " + path);
  }
  std::vector<char> raw((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw std::runtime_error("Failed to read snapshot: " + path);
  }
  std::span<const std::byte> data = std::as_bytes(std::span<const char>(raw));

  ByteReader r(data);
  auto magic = r.getBytes(4);
  if (printableTag(magic) != kSnapshotMagic) {
    throw MalformedEnvelopeError("not a store snapshot: '" +
                                 printableTag(magic) + "'");
  }
  uint8_t const version = r.getU8();
  if (version != kSnapshotVersion) {
    throw MalformedEnvelopeError("unsupported snapshot version " +
                                 std::to_string(version));
  }
  uint8_t const algo = r.getU8();
  if (algo != static_cast<uint8_t>(config_.hash_algo)) {
    throw MalformedEnvelopeError("snapshot hash algorithm does not match store");
  }

  ChunkIO io(config_.hash_algo, config_.cold_compression_level);
  std::unordered_map<std::string, std::unique_ptr<Entry>> loaded;
  uint64_t const count = r.getUvarint();
  for (uint64_t i = 0; i < count; ++i) {
    auto entry = std::make_unique<Entry>();
    entry->digest = r.getDigest();
    entry->fingerprint = r.getU64();
    entry->ref_count = r.getUvarint();
    uint8_t const tier = r.getU8();
    if (tier > static_cast<uint8_t>(Tier::Shared)) {
      throw MalformedEnvelopeError("invalid tier " + std::to_string(tier));
    }
    entry->tier = static_cast<Tier>(tier);
    entry->promoted = (r.getU8() & kFlagPromoted) != 0;
    entry->size = static_cast<size_t>(r.getUvarint());
    auto payload = r.getBytes(r.getUvarint());
    entry->payload.assign(payload.begin(), payload.end());

    std::vector<std::byte> plain;
    if (entry->tier == Tier::Cold) {
      if (ChunkIO::frame_content_size(payload) != entry->size) {
        throw MalformedEnvelopeError("cold payload size mismatch");
      }
      plain = io.decompress_data(payload, entry->size);
    } else {
      if (payload.size() != entry->size) {
        throw MalformedEnvelopeError("payload size mismatch");
      }
      plain = entry->payload;
    }
    DigestResult const dr = ChunkIO::hash(plain, config_.hash_algo);
    if (dr.digest != entry->digest) {
      throw CorruptChunkError("snapshot payload does not match digest " +
                              digest_to_cid(entry->digest, config_.hash_algo));
    }
    touch(*entry);
    loaded.emplace(dr.cid, std::move(entry));
  }

  std::unordered_map<std::string, std::unordered_set<std::string>> data_sets;
  uint64_t const data_count = r.getUvarint();
  for (uint64_t i = 0; i < data_count; ++i) {
    auto id = r.getBytes(r.getUvarint());
    std::string data_id(reinterpret_cast<const char *>(id.data()), id.size());
    auto &set = data_sets[data_id];
    uint64_t const n = r.getUvarint();
    for (uint64_t j = 0; j < n; ++j) {
      set.insert(digest_to_cid(r.getDigest(), config_.hash_algo));
    }
  }
  if (!r.atEnd()) {
    throw MalformedEnvelopeError("trailing bytes after snapshot");
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  chunks_ = std::move(loaded);
  data_chunks_ = std::move(data_sets);
  lsh_.clear();
  for (const auto &[cid, entry] : chunks_) {
    lsh_.insert(cid, entry->fingerprint);
  }
  Logger::getInstance().log(LogLevel::INFO, kComponent,
                            "Loaded " + std::to_string(chunks_.size()) +
                                " chunks from " + path);
}

StoreStats ChunkStore::stats() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  StoreStats s;
  s.chunks = chunks_.size();
  for (const auto &[cid, entry] : chunks_) {
    switch (entry->tier) {
    case Tier::Hot:
      ++s.hot;
      break;
    case Tier::Warm:
      ++s.warm;
      break;
    case Tier::Cold:
      ++s.cold;
      break;
    case Tier::Shared:
      ++s.shared;
      break;
    }
    s.logical_bytes += entry->size;
    s.stored_bytes += entry->payload.size();
    s.total_references += entry->ref_count;
    if (entry->pins > 0) {
      ++s.pinned;
    }
    if (entry->promoted) {
      ++s.promoted;
    }
  }
  s.dedup_ratio = static_cast<double>(s.total_references) /
                  static_cast<double>(std::max<size_t>(1, s.chunks));
  s.lsh_entries = lsh_.size();
  return s;
}

} // namespace cogdedup
