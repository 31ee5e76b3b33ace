#ifndef COGDEDUP_WIRE_FORMAT_HPP
#define COGDEDUP_WIRE_FORMAT_HPP

#include "cogdedup/byte_codec.hpp"
#include "cogdedup/digest.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <variant>
#include <vector>

namespace cogdedup {

// Format family tags; the first four bytes of every encoded blob.
inline constexpr char MAGIC_UCOG[5] = "UCOG"; ///< cognitive-dedup stream
inline constexpr char MAGIC_USST[5] = "USST"; ///< streaming envelope
inline constexpr char MAGIC_TPF3[5] = "TPF3"; ///< template compression
inline constexpr char MAGIC_USZR[5] = "USZR"; ///< raw zstd fallback
inline constexpr char MAGIC_USZD[5] = "USZD"; ///< dictionary zstd fallback
inline constexpr char MAGIC_USBR[5] = "USBR"; ///< raw fallback B
inline constexpr char MAGIC_USBZ[5] = "USBZ"; ///< raw fallback C

inline constexpr size_t MAGIC_SIZE = 4;
inline constexpr uint8_t WIRE_VERSION = 1;

enum class RecordTag : uint8_t {
  Ref = 0x00,
  Delta = 0x01,
  Full = 0x02,
  PredDelta = 0x03,
};

struct RefRecord {
  DigestArray digest{};
};

struct DeltaRecord {
  DigestArray base{};
  uint64_t checksum = 0; ///< short checksum of the reconstructed chunk
  std::vector<std::byte> diff;
};

struct FullRecord {
  DigestArray digest{};
  uint64_t raw_size = 0;
  std::vector<std::byte> compressed; ///< zstd frame
};

struct PredDeltaRecord {
  uint64_t prediction_index = 0; ///< rank of the base among the predictions
  DigestArray base{};
  uint64_t checksum = 0;
  std::vector<std::byte> diff;
};

using ChunkRecord =
    std::variant<RefRecord, DeltaRecord, FullRecord, PredDeltaRecord>;

/// A parsed UCOG envelope.
struct Envelope {
  HashAlgorithm hash_algo = HashAlgorithm::BLAKE3;
  std::vector<ChunkRecord> records;
};

RecordTag recordTag(const ChunkRecord &record);
const char *recordTagName(RecordTag tag);

/// True if @p data starts with the four bytes of @p magic.
bool hasMagic(std::span<const std::byte> data, const char (&magic)[5]);

void writeRecord(ByteWriter &w, const ChunkRecord &record);

/// Serialize a complete UCOG envelope.
std::vector<std::byte> serializeEnvelope(const Envelope &envelope);

/**
 * @brief Parse a UCOG envelope.
 *
 * The magic is checked before anything else is read.
 * @throw UnrecognizedFormatError If the blob is not UCOG.
 * @throw MalformedEnvelopeError On a bad version, hash algorithm, record
 *        tag, truncation or trailing bytes.
 */
Envelope parseEnvelope(std::span<const std::byte> blob);

/// Digest named by each record: REF target, FULL chunk or delta base.
std::vector<DigestArray> referencedDigests(const Envelope &envelope);

} // namespace cogdedup

#endif // COGDEDUP_WIRE_FORMAT_HPP
