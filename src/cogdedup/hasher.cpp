#include "cogdedup/hasher.hpp"

#include <array>
#include <bit>
#include <utility>

namespace cogdedup {

namespace {

constexpr uint64_t kFnvOffset = 0xcbf29ce484222325ULL;
constexpr uint64_t kFnvPrime = 0x100000001b3ULL;
constexpr size_t kShingle = 4;

} // namespace

uint64_t simhash64(std::span<const std::byte> data) {
  if (data.size() < kShingle) {
    return 0;
  }
  size_t const shingles = data.size() - kShingle + 1;
  std::array<size_t, 64> set_counts{};

  for (size_t i = 0; i < shingles; ++i) {
    uint64_t h = kFnvOffset;
    for (size_t j = 0; j < kShingle; ++j) {
      h ^= static_cast<uint8_t>(data[i + j]);
      h *= kFnvPrime;
    }
    for (unsigned bit = 0; bit < 64; ++bit) {
      set_counts[bit] += (h >> bit) & 1U;
    }
  }

  uint64_t result = 0;
  for (unsigned bit = 0; bit < 64; ++bit) {
    if (set_counts[bit] * 2 > shingles) {
      result |= (1ULL << bit);
    }
  }
  return result;
}

int hammingDistance(uint64_t a, uint64_t b) { return std::popcount(a ^ b); }

ChunkIdentity Hasher::identify(std::span<const std::byte> chunk) const {
  DigestResult dr = exactDigest(chunk);
  ChunkIdentity id;
  id.digest = dr.digest;
  id.cid = std::move(dr.cid);
  id.fingerprint = simhash64(chunk);
  return id;
}

} // namespace cogdedup
