#ifndef COGDEDUP_STREAM_ENCODER_HPP
#define COGDEDUP_STREAM_ENCODER_HPP

#include "cogdedup/byte_codec.hpp"
#include "cogdedup/chunk_io.hpp"
#include "cogdedup/chunker.hpp"
#include "cogdedup/codec.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace cogdedup {

/**
 * @brief Encodes a byte stream as it arrives.
 *
 * Chunk boundaries are found incrementally; every segment_chunks complete
 * chunks are encoded into one UCOG segment. The result is a USST
 * envelope:
 *
 *   "USST" | version | (uvarint segment_length, UCOG segment)* | uvarint 0
 *
 * Bytes after the last boundary stay buffered until the next boundary or
 * finish().
 */
class StreamEncoder {
public:
  StreamEncoder(ChunkStore &store, const SecurityPolicy &policy,
                Predictor *predictor = nullptr,
                CodecOptions options = CodecOptions{},
                size_t segment_chunks = 64);

  /**
   * @brief Append bytes to the stream.
   * @return Number of complete chunks seen so far.
   * @throw std::logic_error After finish().
   */
  size_t feed(std::span<const std::byte> data);

  /// Encode every complete chunk buffered so far into a segment.
  void flushSegment();

  /**
   * @brief Encode the trailing partial chunk and close the envelope.
   * @throw std::logic_error If called twice.
   */
  EncodeResult finish();

  size_t chunks() const { return chunks_seen_; }
  size_t segments() const { return segments_; }
  bool finished() const { return finished_; }

private:
  ChunkStore &store_;
  SecurityPolicy policy_;
  Predictor *predictor_;
  Codec codec_;
  Chunker chunker_;
  size_t segment_chunks_;

  ChunkIO whole_hash_;
  ByteWriter out_;
  std::vector<std::byte> buffer_;
  std::vector<ChunkSpan> spans_;
  size_t chunk_start_ = 0;
  size_t chunks_seen_ = 0;
  size_t segments_ = 0;
  size_t total_fed_ = 0;

  EncodeStats stats_;
  std::optional<std::string> previous_cid_;
  std::vector<std::string> cids_;
  bool finished_ = false;
};

} // namespace cogdedup

#endif // COGDEDUP_STREAM_ENCODER_HPP
