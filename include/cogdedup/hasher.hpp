#ifndef COGDEDUP_HASHER_HPP
#define COGDEDUP_HASHER_HPP

#include "cogdedup/chunk_io.hpp"
#include "cogdedup/digest.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

namespace cogdedup {

/// Max Hamming distance for two fingerprints to count as similar.
inline constexpr int SIMILARITY_THRESHOLD = 8;

/// Exact and similarity identity of one chunk.
struct ChunkIdentity {
  DigestArray digest{};
  std::string cid;
  uint64_t fingerprint = 0;
};

/**
 * @brief 64-bit SimHash over 4-byte shingles hashed with FNV-1a.
 *
 * Bit i is set when more than half of the shingle hashes have bit i set.
 * Inputs shorter than four bytes have fingerprint 0.
 */
uint64_t simhash64(std::span<const std::byte> data);

int hammingDistance(uint64_t a, uint64_t b);

/**
 * @brief Computes the exact digest and similarity fingerprint of chunks.
 */
class Hasher {
public:
  explicit Hasher(HashAlgorithm algo = HashAlgorithm::BLAKE3) : algo_(algo) {}

  ChunkIdentity identify(std::span<const std::byte> chunk) const;

  DigestResult exactDigest(std::span<const std::byte> chunk) const {
    return ChunkIO::hash(chunk, algo_);
  }

  HashAlgorithm algorithm() const { return algo_; }

private:
  HashAlgorithm algo_;
};

} // namespace cogdedup

#endif // COGDEDUP_HASHER_HPP
