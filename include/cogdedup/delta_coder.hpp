#ifndef COGDEDUP_DELTA_CODER_HPP
#define COGDEDUP_DELTA_CODER_HPP

#include "cogdedup/integrity.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace cogdedup {

/**
 * @brief Copy/insert diffs of a target against a base chunk.
 *
 * Diff layout: uvarint target_size, then a sequence of operations
 *   0x00 COPY   uvarint base_offset, uvarint length
 *   0x01 INSERT uvarint length, literal bytes
 * The declared target size is readable without decoding, so the
 * expansion ratio can be checked before anything is allocated.
 */
class DeltaCoder {
public:
  static constexpr uint8_t kOpCopy = 0x00;
  static constexpr uint8_t kOpInsert = 0x01;
  /// Granularity of the base index; shorter matches are emitted as literals.
  static constexpr size_t kBlockSize = 16;

  static std::vector<std::byte> encode(std::span<const std::byte> base,
                                       std::span<const std::byte> target);

  /// @throw MalformedEnvelopeError If the size prefix is truncated.
  static uint64_t declaredSize(std::span<const std::byte> diff);

  /// Declared target size divided by diff length.
  static double expansionRatio(std::span<const std::byte> diff);

  /**
   * @brief Rebuild the target.
   * @throw ExpansionLimitExceededError Before allocation, if the declared
   *        size breaks the policy.
   * @throw CorruptChunkError If an operation reaches outside the base or
   *        the output does not add up to the declared size.
   * @throw MalformedEnvelopeError If the diff is truncated.
   */
  static std::vector<std::byte> decode(std::span<const std::byte> base,
                                       std::span<const std::byte> diff,
                                       const SecurityPolicy &policy);
};

} // namespace cogdedup

#endif // COGDEDUP_DELTA_CODER_HPP
