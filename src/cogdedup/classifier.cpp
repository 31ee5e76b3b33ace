#include "cogdedup/classifier.hpp"
#include "cogdedup/byte_codec.hpp"
#include "cogdedup/delta_coder.hpp"
#include "cogdedup/errors.hpp"
#include "utilities/logger.h"

namespace cogdedup {

namespace {

const std::string kComponent = "classifier";

// Predicted bases tried per chunk.
constexpr size_t kPredictionsTried = 3;

} // namespace

Classifier::Classifier(ChunkStore &store, const SecurityPolicy &policy,
                       const ChunkIO &io, Predictor *predictor,
                       size_t max_candidates)
    : store_(store), verifier_(policy), io_(io), predictor_(predictor),
      max_candidates_(max_candidates) {}

ChunkRecord Classifier::classify(std::span<const std::byte> chunk,
                                 const ChunkIdentity &id,
                                 const std::optional<std::string> &previous_cid) {
  if (store_.contains(id.cid)) {
    try {
      uint64_t const refs = store_.addReference(id.cid);
      ++counters_.ref;
      Logger::getInstance().log(LogLevel::DEBUG, kComponent,
                                "REF " + id.cid + " refs=" +
                                    std::to_string(refs));
      return RefRecord{id.digest};
    } catch (const NotFoundError &) {
      // Evicted between the lookup and the increment; encode it afresh.
    }
  }

  auto compressed = io_.compress_data(chunk);
  size_t const full_size = 1 + DIGEST_SIZE + uvarintSize(chunk.size()) +
                           uvarintSize(compressed.size()) + compressed.size();

  if (predictor_ && previous_cid) {
    if (auto record = tryPredicted(chunk, id, *previous_cid, full_size)) {
      return std::move(*record);
    }
  }
  if (auto record = trySimilar(chunk, id, full_size)) {
    return std::move(*record);
  }

  store_.put(chunk, id);
  ++counters_.full;
  Logger::getInstance().log(LogLevel::DEBUG, kComponent,
                            "FULL " + id.cid + " " +
                                std::to_string(chunk.size()) + " -> " +
                                std::to_string(compressed.size()));
  FullRecord full;
  full.digest = id.digest;
  full.raw_size = chunk.size();
  full.compressed = std::move(compressed);
  return full;
}

std::optional<std::vector<std::byte>>
Classifier::diffAgainst(const std::string &base_cid,
                        std::span<const std::byte> chunk,
                        size_t record_overhead, size_t full_size) {
  std::optional<ChunkStore::PinGuard> pin;
  try {
    pin.emplace(store_, base_cid);
  } catch (const NotFoundError &) {
    return std::nullopt;
  }
  auto base = store_.find(base_cid);
  if (!base) {
    return std::nullopt;
  }
  try {
    verifier_.enforceRefCount(base_cid, base->ref_count);
  } catch (const ReferenceCapExceededError &e) {
    ++counters_.ref_cap_rejections;
    Logger::getInstance().log(LogLevel::WARN, kComponent, e.what());
    return std::nullopt;
  }

  auto diff = DeltaCoder::encode(base->payload, chunk);
  try {
    verifier_.checkExpansion(chunk.size(), diff.size());
  } catch (const ExpansionLimitExceededError &e) {
    ++counters_.expansion_rejections;
    Logger::getInstance().log(LogLevel::WARN, kComponent,
                              "Delta against " + base_cid +
                                  " rejected: " + e.what());
    return std::nullopt;
  }
  size_t const record_size =
      record_overhead + uvarintSize(diff.size()) + diff.size();
  if (record_size >= full_size) {
    return std::nullopt;
  }
  store_.addReference(base_cid);
  return diff;
}

std::optional<ChunkRecord>
Classifier::tryPredicted(std::span<const std::byte> chunk,
                         const ChunkIdentity &id,
                         const std::string &previous_cid, size_t full_size) {
  auto predicted = predictor_->predict(previous_cid, kPredictionsTried);
  for (size_t index = 0; index < predicted.size(); ++index) {
    const std::string &base_cid = predicted[index];
    if (base_cid == id.cid) {
      continue;
    }
    size_t const overhead =
        1 + uvarintSize(index) + DIGEST_SIZE + sizeof(uint64_t);
    auto diff = diffAgainst(base_cid, chunk, overhead, full_size);
    if (!diff) {
      continue;
    }
    store_.put(chunk, id);
    ++counters_.pred_delta;
    Logger::getInstance().log(LogLevel::DEBUG, kComponent,
                              "PRED_DELTA " + id.cid + " base=" + base_cid +
                                  " diff=" + std::to_string(diff->size()));
    PredDeltaRecord record;
    record.prediction_index = index;
    record.base = cid_to_digest(base_cid);
    record.checksum = ChunkIO::short_checksum(chunk);
    record.diff = std::move(*diff);
    return record;
  }
  return std::nullopt;
}

std::optional<ChunkRecord>
Classifier::trySimilar(std::span<const std::byte> chunk, const ChunkIdentity &id,
                       size_t full_size) {
  size_t const overhead = 1 + DIGEST_SIZE + sizeof(uint64_t);
  for (const auto &candidate : store_.findSimilar(id.fingerprint, max_candidates_)) {
    if (candidate.cid == id.cid) {
      continue;
    }
    auto diff = diffAgainst(candidate.cid, chunk, overhead, full_size);
    if (!diff) {
      continue;
    }
    store_.put(chunk, id);
    ++counters_.delta;
    Logger::getInstance().log(LogLevel::DEBUG, kComponent,
                              "DELTA " + id.cid + " base=" + candidate.cid +
                                  " distance=" +
                                  std::to_string(candidate.distance) +
                                  " diff=" + std::to_string(diff->size()));
    DeltaRecord record;
    record.base = cid_to_digest(candidate.cid);
    record.checksum = ChunkIO::short_checksum(chunk);
    record.diff = std::move(*diff);
    return record;
  }
  return std::nullopt;
}

} // namespace cogdedup
