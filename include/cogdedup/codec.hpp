#ifndef COGDEDUP_CODEC_HPP
#define COGDEDUP_CODEC_HPP

#include "cogdedup/chunk_store.hpp"
#include "cogdedup/chunker.hpp"
#include "cogdedup/integrity.hpp"
#include "cogdedup/predictor.hpp"
#include "cogdedup/wire_format.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace cogdedup {

struct EncodeStats {
  size_t original_size = 0;
  size_t compressed_size = 0;
  size_t chunks = 0;
  size_t ref = 0;
  size_t delta = 0;
  size_t pred_delta = 0;
  size_t full = 0;
  size_t ref_cap_rejections = 0;
  size_t expansion_rejections = 0;
  /// CID of the whole original payload.
  std::string integrity_hash;

  /// original_size / compressed_size; 0 for empty output.
  double ratio() const {
    return compressed_size == 0 ? 0.0
                                : static_cast<double>(original_size) /
                                      static_cast<double>(compressed_size);
  }
};

struct EncodeResult {
  std::vector<std::byte> envelope;
  EncodeStats stats;
};

struct CodecOptions {
  ChunkerParams chunker;
  int compression_level = 10;
  /// Similarity candidates examined per chunk.
  size_t max_candidates = 8;
};

/**
 * @brief Encodes payloads into UCOG envelopes against a ChunkStore.
 *
 * Stateless apart from its options; the store and predictor are passed
 * to every call.
 */
class Codec {
public:
  /// @throw std::invalid_argument On invalid chunker parameters.
  explicit Codec(CodecOptions options = CodecOptions{});

  /**
   * @brief Encode @p data.
   *
   * Every chunk ends up in @p store; the chunk list is registered under
   * the integrity hash. When @p predictor is given it is consulted for
   * PRED_DELTA bases and updated with the chunk sequence.
   * @throw std::invalid_argument If the chunker max size exceeds
   *        policy.max_chunk_bytes.
   */
  EncodeResult encode(std::span<const std::byte> data, ChunkStore &store,
                      const SecurityPolicy &policy,
                      Predictor *predictor = nullptr) const;

  /**
   * @brief Encode pre-split chunks of @p data into records.
   *
   * Counters are added to @p stats; @p previous_cid carries the last
   * chunk across calls. Does not update the predictor.
   * @return CIDs of the chunks, in order.
   */
  std::vector<std::string>
  encodeChunks(std::span<const std::byte> data,
               const std::vector<ChunkSpan> &spans, ChunkStore &store,
               const SecurityPolicy &policy, Predictor *predictor,
               Envelope &envelope, EncodeStats &stats,
               std::optional<std::string> &previous_cid) const;

  /**
   * @brief Decode a UCOG envelope.
   * @param expected_hash When set, the output must hash to this CID.
   * @throw UnrecognizedFormatError If the blob is not UCOG, including the
   *        other members of the format family.
   * @throw MalformedEnvelopeError, CorruptChunkError, NotFoundError,
   *        ExpansionLimitExceededError, IntegrityMismatchError
   */
  std::vector<std::byte>
  decode(std::span<const std::byte> envelope, ChunkStore &store,
         const SecurityPolicy &policy,
         const std::optional<std::string> &expected_hash = std::nullopt) const;

  const CodecOptions &options() const { return options_; }

private:
  void decodeRecord(const ChunkRecord &record, HashAlgorithm algo,
                    ChunkStore &store, const SecurityPolicy &policy,
                    IntegrityVerifier &verifier,
                    std::vector<std::byte> &out) const;

  CodecOptions options_;
  Chunker chunker_;
};

} // namespace cogdedup

#endif // COGDEDUP_CODEC_HPP
