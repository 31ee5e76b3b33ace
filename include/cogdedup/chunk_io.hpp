#ifndef COGDEDUP_CHUNK_IO_HPP
#define COGDEDUP_CHUNK_IO_HPP

#include "blake3.h"
#include "cogdedup/digest.hpp"

#include <cstddef>
#include <cstdint>
#include <sodium.h>
#include <span>
#include <string>
#include <vector>

namespace cogdedup {

/// Digest of a byte range together with its CID rendering.
struct DigestResult {
  DigestArray digest{};
  std::string cid;
};

/**
 * @brief Hashing and zstd compression primitives used by the codec.
 *
 * An instance accumulates bytes for incremental hashing through ingest();
 * the compression helpers are stateless apart from the configured level.
 */
class ChunkIO {
public:
  /**
   * @param hash_algo Exact-match hash used by finalize_hashed().
   * @param compression_level Zstd level for compress_* calls.
   * @throw std::runtime_error If libsodium cannot be initialised.
   */
  explicit ChunkIO(HashAlgorithm hash_algo = HashAlgorithm::BLAKE3,
                   int compression_level = 10);

  // Feeds bytes into the running hash.
  void ingest(const std::byte *data, size_t size);

  /**
   * @brief Finish the running hash.
   * @throw std::logic_error If called twice.
   */
  DigestResult finalize_hashed();

  /// One-shot digest of @p data.
  static DigestResult hash(std::span<const std::byte> data,
                           HashAlgorithm algo = HashAlgorithm::BLAKE3);

  std::vector<std::byte> compress_data(std::span<const std::byte> data) const;

  /**
   * @brief Decompress a zstd frame whose decoded size is already known.
   *
   * Callers validate @p original_size against their limits first; the
   * output buffer is allocated at exactly that size.
   * @throw std::runtime_error On zstd failure or size mismatch.
   */
  std::vector<std::byte> decompress_data(std::span<const std::byte> compressed,
                                         size_t original_size) const;

  /// Compress using @p dictionary as zstd raw-content dictionary.
  std::vector<std::byte>
  compress_with_dictionary(std::span<const std::byte> data,
                           std::span<const std::byte> dictionary) const;

  std::vector<std::byte>
  decompress_with_dictionary(std::span<const std::byte> compressed,
                             std::span<const std::byte> dictionary,
                             size_t original_size) const;

  /**
   * @brief Decoded size recorded in a zstd frame header.
   * @throw std::runtime_error If the header is invalid or carries no size.
   */
  static size_t frame_content_size(std::span<const std::byte> compressed);

  /// Fast 64-bit checksum (SipHash-2-4 with a fixed public key).
  static uint64_t short_checksum(std::span<const std::byte> data);

  int compression_level() const { return compression_level_; }
  HashAlgorithm hash_algorithm() const { return hash_algo_; }

private:
  HashAlgorithm hash_algo_;
  int compression_level_;
  crypto_hash_sha256_state sha_state_;
  blake3_hasher blake3_state_;
  bool finalized_ = false;
};

} // namespace cogdedup

#endif // COGDEDUP_CHUNK_IO_HPP
