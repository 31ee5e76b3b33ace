#ifndef COGDEDUP_LSH_INDEX_HPP
#define COGDEDUP_LSH_INDEX_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace cogdedup {

/**
 * @brief Banded locality-sensitive index over 64-bit SimHash values.
 *
 * The fingerprint is cut into kBands bands of kBandBits bits; two
 * fingerprints sharing any band are candidates. With 8 bands of 8 bits, a
 * pair within Hamming distance 8 shares at least one band with high
 * probability. Not synchronized; the owning store locks around it.
 */
class LshIndex {
public:
  static constexpr unsigned kBands = 8;
  static constexpr unsigned kBandBits = 8;

  void insert(const std::string &cid, uint64_t fingerprint);
  void remove(const std::string &cid);

  /// Identifiers sharing at least one band with @p fingerprint.
  std::unordered_set<std::string> candidates(uint64_t fingerprint) const;

  /// (cid, distance) for candidates within @p max_distance.
  std::vector<std::pair<std::string, int>>
  withinDistance(uint64_t fingerprint, int max_distance) const;

  size_t size() const { return fingerprints_.size(); }
  void clear();

private:
  static uint8_t band(uint64_t fingerprint, unsigned index) {
    return static_cast<uint8_t>(fingerprint >> (index * kBandBits));
  }

  std::array<std::unordered_map<uint8_t, std::unordered_set<std::string>>,
             kBands>
      buckets_;
  std::unordered_map<std::string, uint64_t> fingerprints_;
};

} // namespace cogdedup

#endif // COGDEDUP_LSH_INDEX_HPP
