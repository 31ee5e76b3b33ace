#ifndef COGDEDUP_INTEGRITY_HPP
#define COGDEDUP_INTEGRITY_HPP

#include "cogdedup/digest.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace cogdedup {

/**
 * @brief Limits applied while encoding and decoding.
 *
 * Built once per call chain and passed by const reference.
 */
struct SecurityPolicy {
  /// Chunks referenced this often are no longer eligible as delta bases.
  uint64_t max_ref_count_for_similarity = 1000;
  bool verify_deltas = true;
  /// Declared target size divided by diff length.
  double max_delta_expansion = 100.0;
  /// Largest decoded size accepted for a single record.
  size_t max_chunk_bytes = 1024 * 1024;
};

/**
 * @brief Applies a SecurityPolicy and counts verification outcomes.
 */
class IntegrityVerifier {
public:
  explicit IntegrityVerifier(const SecurityPolicy &policy) : policy_(policy) {}

  const SecurityPolicy &policy() const { return policy_; }

  /// True if a chunk with @p ref_count may still serve as a delta base.
  bool checkRefCount(uint64_t ref_count) const {
    return ref_count < policy_.max_ref_count_for_similarity;
  }

  /// @throw ReferenceCapExceededError
  void enforceRefCount(const std::string &cid, uint64_t ref_count) const;

  /**
   * @brief Reject a delta whose declared output is too large.
   *
   * Must be called before any output buffer is allocated.
   * @throw ExpansionLimitExceededError If the ratio of @p declared_size
   *        to @p diff_size exceeds max_delta_expansion, or the declared
   *        size exceeds max_chunk_bytes.
   */
  void checkExpansion(uint64_t declared_size, size_t diff_size) const;

  /// @throw ExpansionLimitExceededError If @p declared_size > max_chunk_bytes.
  void checkChunkSize(uint64_t declared_size, size_t encoded_size) const;

  /// @throw CorruptChunkError On mismatch when verify_deltas is set.
  void verifyChecksum(std::span<const std::byte> data, uint64_t expected,
                      const std::string &what);

  /// @throw CorruptChunkError On mismatch when verify_deltas is set.
  void verifyDigest(std::span<const std::byte> data, const DigestArray &expected,
                    HashAlgorithm algo);

  uint64_t verified() const { return verified_.load(); }
  uint64_t failed() const { return failed_.load(); }

private:
  SecurityPolicy policy_;
  std::atomic<uint64_t> verified_{0};
  std::atomic<uint64_t> failed_{0};
};

} // namespace cogdedup

#endif // COGDEDUP_INTEGRITY_HPP
