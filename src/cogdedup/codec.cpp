#include "cogdedup/codec.hpp"
#include "cogdedup/chunk_io.hpp"
#include "cogdedup/classifier.hpp"
#include "cogdedup/delta_coder.hpp"
#include "cogdedup/errors.hpp"
#include "utilities/logger.h"

#include <stdexcept>
#include <type_traits>

namespace cogdedup {

namespace {

const std::string kComponent = "codec";

std::vector<std::byte> decompressFull(const FullRecord &full,
                                      const ChunkIO &io) {
  try {
    if (ChunkIO::frame_content_size(full.compressed) != full.raw_size) {
      throw CorruptChunkError("FULL record frame size does not match " +
                              std::to_string(full.raw_size));
    }
    return io.decompress_data(full.compressed,
                              static_cast<size_t>(full.raw_size));
  } catch (const CodecError &) {
    throw;
  } catch (const std::runtime_error &e) {
    throw CorruptChunkError(e.what());
  }
}

} // namespace

Codec::Codec(CodecOptions options)
    : options_(options), chunker_(options.chunker) {}

std::vector<std::string>
Codec::encodeChunks(std::span<const std::byte> data,
                    const std::vector<ChunkSpan> &spans, ChunkStore &store,
                    const SecurityPolicy &policy, Predictor *predictor,
                    Envelope &envelope, EncodeStats &stats,
                    std::optional<std::string> &previous_cid) const {
  if (options_.chunker.max_size > policy.max_chunk_bytes) {
    throw std::invalid_argument(
        "Chunker max size " + std::to_string(options_.chunker.max_size) +
        " exceeds max_chunk_bytes " + std::to_string(policy.max_chunk_bytes));
  }
  ChunkIO io(store.config().hash_algo, options_.compression_level);
  Classifier classifier(store, policy, io, predictor, options_.max_candidates);

  std::vector<std::string> cids;
  cids.reserve(spans.size());
  for (const auto &span : spans) {
    auto chunk = data.subspan(span.offset, span.length);
    ChunkIdentity const id = store.hasher().identify(chunk);
    envelope.records.push_back(classifier.classify(chunk, id, previous_cid));
    cids.push_back(id.cid);
    previous_cid = id.cid;
  }

  const auto &c = classifier.counters();
  stats.chunks += spans.size();
  stats.ref += c.ref;
  stats.delta += c.delta;
  stats.pred_delta += c.pred_delta;
  stats.full += c.full;
  stats.ref_cap_rejections += c.ref_cap_rejections;
  stats.expansion_rejections += c.expansion_rejections;
  return cids;
}

EncodeResult Codec::encode(std::span<const std::byte> data, ChunkStore &store,
                           const SecurityPolicy &policy,
                           Predictor *predictor) const {
  EncodeResult result;
  Envelope envelope;
  envelope.hash_algo = store.config().hash_algo;

  std::optional<std::string> previous;
  auto cids = encodeChunks(data, chunker_.split(data), store, policy, predictor,
                           envelope, result.stats, previous);
  if (predictor) {
    predictor->observe(cids);
  }

  result.stats.original_size = data.size();
  result.stats.integrity_hash = ChunkIO::hash(data, envelope.hash_algo).cid;
  if (!cids.empty()) {
    store.registerData(result.stats.integrity_hash, cids);
  }
  result.envelope = serializeEnvelope(envelope);
  result.stats.compressed_size = result.envelope.size();

  Logger::getInstance().log(
      LogLevel::INFO, kComponent,
      "Encoded " + std::to_string(data.size()) + " bytes into " +
          std::to_string(result.envelope.size()) + " (chunks=" +
          std::to_string(result.stats.chunks) +
          " ref=" + std::to_string(result.stats.ref) +
          " delta=" + std::to_string(result.stats.delta) +
          " pred_delta=" + std::to_string(result.stats.pred_delta) +
          " full=" + std::to_string(result.stats.full) + ")");
  return result;
}

void Codec::decodeRecord(const ChunkRecord &record, HashAlgorithm algo,
                         ChunkStore &store, const SecurityPolicy &policy,
                         IntegrityVerifier &verifier,
                         std::vector<std::byte> &out) const {
  auto applyDelta = [&](const DigestArray &base_digest, uint64_t checksum,
                        const std::vector<std::byte> &diff) {
    std::string const base_cid = digest_to_cid(base_digest, algo);
    ChunkStore::PinGuard pin(store, base_cid);
    Chunk const base = store.get(base_cid);
    auto target = DeltaCoder::decode(base.payload, diff, policy);
    verifier.verifyChecksum(target, checksum, "delta against " + base_cid);
    out.insert(out.end(), target.begin(), target.end());
  };

  std::visit(
      [&](const auto &r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, RefRecord>) {
          Chunk const chunk = store.get(digest_to_cid(r.digest, algo));
          out.insert(out.end(), chunk.payload.begin(), chunk.payload.end());
        } else if constexpr (std::is_same_v<T, FullRecord>) {
          verifier.checkChunkSize(r.raw_size, r.compressed.size());
          ChunkIO io(algo, options_.compression_level);
          auto plain = decompressFull(r, io);
          verifier.verifyDigest(plain, r.digest, algo);
          out.insert(out.end(), plain.begin(), plain.end());
        } else if constexpr (std::is_same_v<T, DeltaRecord>) {
          applyDelta(r.base, r.checksum, r.diff);
        } else if constexpr (std::is_same_v<T, PredDeltaRecord>) {
          applyDelta(r.base, r.checksum, r.diff);
        }
      },
      record);
}

std::vector<std::byte>
Codec::decode(std::span<const std::byte> blob, ChunkStore &store,
              const SecurityPolicy &policy,
              const std::optional<std::string> &expected_hash) const {
  try {
    Envelope const envelope = parseEnvelope(blob);
    if (envelope.hash_algo != store.config().hash_algo) {
      throw MalformedEnvelopeError(
          std::string("envelope uses ") +
          hash_algorithm_name(envelope.hash_algo) + " but the store uses " +
          hash_algorithm_name(store.config().hash_algo));
    }

    IntegrityVerifier verifier(policy);
    std::vector<std::byte> out;
    for (const auto &record : envelope.records) {
      decodeRecord(record, envelope.hash_algo, store, policy, verifier, out);
    }

    if (expected_hash) {
      std::string const actual = ChunkIO::hash(out, envelope.hash_algo).cid;
      if (actual != *expected_hash) {
        throw IntegrityMismatchError(*expected_hash, actual);
      }
    }
    Logger::getInstance().log(LogLevel::INFO, kComponent,
                              "Decoded " + std::to_string(envelope.records.size()) +
                                  " records into " + std::to_string(out.size()) +
                                  " bytes");
    return out;
  } catch (const CodecError &e) {
    Logger::getInstance().log(LogLevel::ERROR, kComponent,
                              std::string("Decode failed: ") + e.what());
    throw;
  }
}

} // namespace cogdedup
