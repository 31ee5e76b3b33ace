#include "cogdedup/stream_encoder.hpp"
#include "cogdedup/wire_format.hpp"
#include "utilities/logger.h"

#include <stdexcept>

namespace cogdedup {

StreamEncoder::StreamEncoder(ChunkStore &store, const SecurityPolicy &policy,
                             Predictor *predictor, CodecOptions options,
                             size_t segment_chunks)
    : store_(store), policy_(policy), predictor_(predictor), codec_(options),
      chunker_(options.chunker),
      segment_chunks_(segment_chunks == 0 ? 1 : segment_chunks),
      whole_hash_(store.config().hash_algo, options.compression_level) {
  out_.putTag(MAGIC_USST);
  out_.putU8(WIRE_VERSION);
}

size_t StreamEncoder::feed(std::span<const std::byte> data) {
  if (finished_) {
    throw std::logic_error("Cannot feed a finished stream");
  }
  whole_hash_.ingest(data.data(), data.size());
  total_fed_ += data.size();
  for (std::byte b : data) {
    buffer_.push_back(b);
    if (chunker_.feed(b)) {
      spans_.push_back({chunk_start_, buffer_.size() - chunk_start_});
      chunk_start_ = buffer_.size();
      ++chunks_seen_;
      if (spans_.size() >= segment_chunks_) {
        flushSegment();
      }
    }
  }
  return chunks_seen_;
}

void StreamEncoder::flushSegment() {
  if (finished_) {
    throw std::logic_error("Cannot flush a finished stream");
  }
  if (spans_.empty()) {
    return;
  }
  Envelope segment;
  segment.hash_algo = store_.config().hash_algo;
  auto cids = codec_.encodeChunks(buffer_, spans_, store_, policy_, predictor_,
                                  segment, stats_, previous_cid_);
  if (predictor_) {
    std::vector<std::string> sequence;
    if (!cids_.empty()) {
      sequence.push_back(cids_.back());
    }
    sequence.insert(sequence.end(), cids.begin(), cids.end());
    predictor_->observe(sequence);
  }
  cids_.insert(cids_.end(), cids.begin(), cids.end());

  auto bytes = serializeEnvelope(segment);
  out_.putUvarint(bytes.size());
  out_.putBytes(bytes);
  ++segments_;

  buffer_.erase(buffer_.begin(),
                buffer_.begin() + static_cast<std::ptrdiff_t>(chunk_start_));
  chunk_start_ = 0;
  spans_.clear();
  Logger::getInstance().log(LogLevel::DEBUG, "stream_encoder",
                            "Flushed segment " + std::to_string(segments_) +
                                " (" + std::to_string(cids.size()) +
                                " chunks, " + std::to_string(bytes.size()) +
                                " bytes)");
}

EncodeResult StreamEncoder::finish() {
  if (finished_) {
    throw std::logic_error("Stream already finished");
  }
  if (buffer_.size() > chunk_start_) {
    spans_.push_back({chunk_start_, buffer_.size() - chunk_start_});
    chunk_start_ = buffer_.size();
    ++chunks_seen_;
    chunker_.reset();
  }
  flushSegment();
  out_.putUvarint(0);
  finished_ = true;

  EncodeResult result;
  result.stats = stats_;
  result.stats.original_size = total_fed_;
  result.stats.integrity_hash = whole_hash_.finalize_hashed().cid;
  if (!cids_.empty()) {
    store_.registerData(result.stats.integrity_hash, cids_);
  }
  result.envelope = out_.take();
  result.stats.compressed_size = result.envelope.size();
  Logger::getInstance().log(LogLevel::INFO, "stream_encoder",
                            "Finished stream: " + std::to_string(total_fed_) +
                                " bytes, " + std::to_string(chunks_seen_) +
                                " chunks, " + std::to_string(segments_) +
                                " segments");
  return result;
}

} // namespace cogdedup
