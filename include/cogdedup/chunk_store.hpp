#ifndef COGDEDUP_CHUNK_STORE_HPP
#define COGDEDUP_CHUNK_STORE_HPP

#include "cogdedup/digest.hpp"
#include "cogdedup/hasher.hpp"
#include "cogdedup/lsh_index.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cogdedup {

enum class Tier : uint8_t { Hot = 0, Warm = 1, Cold = 2, Shared = 3 };

const char *tierName(Tier tier);

/// Value snapshot of one stored chunk; the payload is always decompressed.
struct Chunk {
  std::string cid;
  DigestArray digest{};
  uint64_t fingerprint = 0;
  size_t size = 0;
  uint64_t ref_count = 0;
  Tier tier = Tier::Warm;
  std::vector<std::byte> payload;
};

struct StoreConfig {
  HashAlgorithm hash_algo = HashAlgorithm::BLAKE3;
  uint64_t hot_threshold = 5;
  /// Warm chunks kept before demotion to cold; 0 disables demotion.
  size_t max_warm_chunks = 0;
  uint64_t promote_threshold = 5;
  int cold_compression_level = 19;
  /// Marks the store as the shared tier of a federation.
  bool shared_tier = false;
};

struct PutResult {
  std::string cid;
  bool inserted = false;
  uint64_t ref_count = 0;
};

struct SimilarCandidate {
  std::string cid;
  int distance = 0;
  uint64_t ref_count = 0;
};

struct StoreStats {
  size_t chunks = 0;
  size_t hot = 0;
  size_t warm = 0;
  size_t cold = 0;
  size_t shared = 0;
  size_t logical_bytes = 0;
  size_t stored_bytes = 0;
  uint64_t total_references = 0;
  double dedup_ratio = 0.0;
  size_t lsh_entries = 0;
  size_t pinned = 0;
  size_t promoted = 0;
};

/**
 * @brief Thread-safe tiered chunk store keyed by CID.
 *
 * A local store may be attached to a shared store (the federation tier).
 * Exact lookups, reads and similarity searches fall through to the
 * shared store; writes always go to the local store. Once a local chunk's
 * reference count reaches promote_threshold its payload is copied into
 * the shared store; the local copy stays.
 */
class ChunkStore {
public:
  explicit ChunkStore(StoreConfig config = StoreConfig{},
                      std::shared_ptr<ChunkStore> shared = nullptr);

  ChunkStore(const ChunkStore &) = delete;
  ChunkStore &operator=(const ChunkStore &) = delete;

  /**
   * @brief Store a chunk, or add a reference if it is already present.
   *
   * Concurrent first writes of the same content create exactly one chunk.
   */
  PutResult put(std::span<const std::byte> data);

  /// As put(), with the identity computed by the caller.
  PutResult put(std::span<const std::byte> data, const ChunkIdentity &id);

  /**
   * @brief Retrieve a chunk by CID, local tier first, then the shared tier.
   * @throw NotFoundError If neither tier holds it.
   */
  Chunk get(const std::string &cid) const;

  std::optional<Chunk> find(const std::string &cid) const;

  /// True if the local or the attached shared tier holds @p cid.
  bool contains(const std::string &cid) const;
  bool containsLocal(const std::string &cid) const;

  /// Reference count in the tier that holds @p cid (local first); 0 if absent.
  uint64_t refCount(const std::string &cid) const;

  /**
   * @brief Record one more use of an existing chunk.
   * @return The new reference count.
   * @throw NotFoundError If neither tier holds @p cid.
   */
  uint64_t addReference(const std::string &cid);

  /**
   * @brief Chunks within SIMILARITY_THRESHOLD of @p fingerprint.
   *
   * Ordered by Hamming distance, then reference count, then CID, and
   * truncated to @p max_candidates. Includes the shared tier.
   */
  std::vector<SimilarCandidate> findSimilar(uint64_t fingerprint,
                                            size_t max_candidates = 8) const;

  /**
   * @brief Copy a local chunk into the shared tier.
   * @return true if the chunk is in the shared tier after the call.
   * @throw NotFoundError If @p cid is not held locally.
   */
  bool promote(const std::string &cid);

  /// Pinned chunks are never evicted or demoted. Pins nest.
  void pin(const std::string &cid);
  void unpin(const std::string &cid);

  /**
   * @brief Pins a chunk for the guard's lifetime.
   *
   * The pin is released in the store that took it, even if the chunk is
   * later inserted into another tier.
   */
  class PinGuard {
  public:
    PinGuard(ChunkStore &store, std::string cid);
    ~PinGuard();
    PinGuard(const PinGuard &) = delete;
    PinGuard &operator=(const PinGuard &) = delete;
    PinGuard(PinGuard &&other) noexcept;
    PinGuard &operator=(PinGuard &&) = delete;

  private:
    ChunkStore *store_; ///< Store holding the pin.
    std::string cid_;
  };

  /// Remove a local chunk. Returns false if absent or pinned.
  bool evict(const std::string &cid);

  struct GCStats {
    size_t totalChunks{0};
    size_t reclaimableChunks{0};
    size_t reclaimableBytes{0};
    size_t freedChunks{0};
    size_t freedBytes{0};
  };

  /**
   * @brief Garbage collect unreferenced chunks.
   *
   * Local chunks whose CIDs are not in @p referencedCids and that are not
   * pinned are deleted unless @p dryRun is true. Statistics about the
   * operation are returned in all cases.
   */
  GCStats garbageCollect(const std::unordered_set<std::string> &referencedCids,
                         bool dryRun);

  /// Demote warm chunks until at most max_warm_chunks remain warm.
  size_t demoteColdChunks();

  /// Associate the chunks of one encoded payload with an identifier.
  void registerData(const std::string &data_id,
                    const std::vector<std::string> &cids);
  std::unordered_set<std::string> chunksForData(const std::string &data_id) const;
  /// Union of every registered data set; the default GC root set.
  std::unordered_set<std::string> registeredChunks() const;

  std::vector<std::string> cids() const;

  /**
   * @brief Write all local chunks to @p path.
   *
   * The snapshot is written to a temporary file then renamed over @p path.
   * @throw std::runtime_error On I/O failure.
   */
  void saveSnapshot(const std::string &path) const;

  /**
   * @brief Replace the local contents with a snapshot.
   * @throw std::runtime_error If the file cannot be read.
   * @throw MalformedEnvelopeError If the snapshot is truncated or invalid.
   * @throw CorruptChunkError If a payload does not match its digest.
   */
  void loadSnapshot(const std::string &path);

  StoreStats stats() const;

  const StoreConfig &config() const { return config_; }
  const std::shared_ptr<ChunkStore> &sharedStore() const { return shared_; }
  const Hasher &hasher() const { return hasher_; }

private:
  struct Entry {
    DigestArray digest{};
    uint64_t fingerprint = 0;
    size_t size = 0;
    uint64_t ref_count = 1;
    Tier tier = Tier::Warm;
    std::vector<std::byte> payload; ///< zstd frame while cold
    mutable std::atomic<uint64_t> last_access{0};
    unsigned pins = 0;
    bool promoted = false;
  };

  /// Pin in the first tier holding @p cid and return that store.
  ChunkStore &pinHolder(const std::string &cid);
  /// Release a pin held by this store only; false if @p cid is not local.
  bool unpinLocal(const std::string &cid);

  Tier baseTier() const {
    return config_.shared_tier ? Tier::Shared : Tier::Warm;
  }
  std::vector<std::byte> payloadOf(const Entry &entry) const;
  Chunk toChunk(const std::string &cid, const Entry &entry) const;
  void touch(const Entry &entry) const;
  // Caller holds the exclusive lock.
  void onReferenced(const std::string &cid, Entry &entry,
                    std::vector<std::byte> *promote_payload);
  void rehydrate(Entry &entry);
  size_t demoteLocked();

  StoreConfig config_;
  std::shared_ptr<ChunkStore> shared_;
  Hasher hasher_;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::unique_ptr<Entry>> chunks_;
  std::unordered_map<std::string, std::unordered_set<std::string>> data_chunks_;
  LshIndex lsh_;
  mutable std::atomic<uint64_t> clock_{0};
};

} // namespace cogdedup

#endif // COGDEDUP_CHUNK_STORE_HPP
