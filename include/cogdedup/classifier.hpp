#ifndef COGDEDUP_CLASSIFIER_HPP
#define COGDEDUP_CLASSIFIER_HPP

#include "cogdedup/chunk_io.hpp"
#include "cogdedup/chunk_store.hpp"
#include "cogdedup/hasher.hpp"
#include "cogdedup/integrity.hpp"
#include "cogdedup/predictor.hpp"
#include "cogdedup/wire_format.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

namespace cogdedup {

struct ClassifierCounters {
  size_t ref = 0;
  size_t delta = 0;
  size_t pred_delta = 0;
  size_t full = 0;
  /// Candidates skipped because they reached the reference cap.
  size_t ref_cap_rejections = 0;
  /// Diffs discarded because they broke the expansion ceiling.
  size_t expansion_rejections = 0;
};

/**
 * @brief Chooses the record type for each chunk of an encode.
 *
 * In order: REF if the digest is already stored; PRED_DELTA against a
 * predicted successor of the previous chunk; DELTA against the nearest
 * similar chunk; otherwise FULL. A delta is only taken if its record is
 * smaller than the FULL record and within the expansion ceiling. Every
 * non-REF chunk is stored, so repeated content becomes REF.
 */
class Classifier {
public:
  Classifier(ChunkStore &store, const SecurityPolicy &policy, const ChunkIO &io,
             Predictor *predictor = nullptr, size_t max_candidates = 8);

  /**
   * @param previous_cid CID of the preceding chunk, used for prediction.
   */
  ChunkRecord classify(std::span<const std::byte> chunk, const ChunkIdentity &id,
                       const std::optional<std::string> &previous_cid);

  const ClassifierCounters &counters() const { return counters_; }

private:
  std::optional<ChunkRecord> tryPredicted(std::span<const std::byte> chunk,
                                          const ChunkIdentity &id,
                                          const std::string &previous_cid,
                                          size_t full_size);
  std::optional<ChunkRecord> trySimilar(std::span<const std::byte> chunk,
                                        const ChunkIdentity &id,
                                        size_t full_size);
  /// Diff against @p base_cid if it is an acceptable base; empty otherwise.
  std::optional<std::vector<std::byte>>
  diffAgainst(const std::string &base_cid, std::span<const std::byte> chunk,
              size_t record_overhead, size_t full_size);

  ChunkStore &store_;
  IntegrityVerifier verifier_;
  const ChunkIO &io_;
  Predictor *predictor_;
  size_t max_candidates_;
  ClassifierCounters counters_;
};

} // namespace cogdedup

#endif // COGDEDUP_CLASSIFIER_HPP
