#ifndef COGDEDUP_CHUNKER_HPP
#define COGDEDUP_CHUNKER_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace cogdedup {

/// Tuning for content-defined chunking.
struct ChunkerParams {
  size_t min_size = 1024;
  size_t avg_size = 4096; ///< Must be a power of two.
  size_t max_size = 16384;
  size_t window = 48; ///< Rolling-hash window in bytes.
};

/// A chunk's position inside the input.
struct ChunkSpan {
  size_t offset;
  size_t length;
};

/**
 * @brief Rabin-Karp rolling-hash content-defined chunker.
 *
 * A boundary is declared once a chunk reaches min_size and the top
 * log2(avg_size) bits of the hash over the last `window` bytes are zero,
 * or when the chunk reaches max_size. The hash restarts at each chunk
 * start, so a boundary depends only on the bytes of its own chunk.
 *
 * The object is used either statelessly (nextBoundary / split) or
 * incrementally through feed(); both yield the same boundaries.
 */
class Chunker {
public:
  static constexpr uint64_t kBase = 0x3DA3358B4DC173ULL;

  /// @throw std::invalid_argument On inconsistent parameters.
  explicit Chunker(const ChunkerParams &params = ChunkerParams{});

  /**
   * @brief End offset of the chunk starting at @p start.
   *
   * Returns data.size() when @p start is at or past the end.
   */
  size_t nextBoundary(std::span<const std::byte> data, size_t start) const;

  /// Split the whole input. Empty input gives no spans.
  std::vector<ChunkSpan> split(std::span<const std::byte> data) const;

  /**
   * @brief Push one byte of a stream.
   * @return true if a chunk boundary falls right after this byte; the
   *         internal state is then reset for the next chunk.
   */
  bool feed(std::byte b);

  /// Bytes fed since the last boundary.
  size_t pending() const { return pending_; }

  void reset();

  const ChunkerParams &params() const { return params_; }

private:
  bool isBoundary(uint64_t hash, size_t length) const;

  ChunkerParams params_;
  uint64_t mask_;
  uint64_t base_pow_window_;

  // incremental state
  uint64_t hash_ = 0;
  size_t pending_ = 0;
  std::vector<uint8_t> ring_;
};

} // namespace cogdedup

#endif // COGDEDUP_CHUNKER_HPP
