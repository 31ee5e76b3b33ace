#include "cogdedup/wire_format.hpp"
#include "cogdedup/errors.hpp"

#include <cstring>
#include <type_traits>

namespace cogdedup {

namespace {

// Smallest encoded record: a tag byte plus a digest.
constexpr size_t kMinRecordSize = 1 + DIGEST_SIZE;

template <class> inline constexpr bool kAlwaysFalse = false;

std::vector<std::byte> copyOf(std::span<const std::byte> view) {
  return std::vector<std::byte>(view.begin(), view.end());
}

} // namespace

RecordTag recordTag(const ChunkRecord &record) {
  return std::visit(
      [](const auto &r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, RefRecord>)
          return RecordTag::Ref;
        else if constexpr (std::is_same_v<T, DeltaRecord>)
          return RecordTag::Delta;
        else if constexpr (std::is_same_v<T, FullRecord>)
          return RecordTag::Full;
        else if constexpr (std::is_same_v<T, PredDeltaRecord>)
          return RecordTag::PredDelta;
        else
          static_assert(kAlwaysFalse<T>, "unhandled record type");
      },
      record);
}

const char *recordTagName(RecordTag tag) {
  switch (tag) {
  case RecordTag::Ref:
    return "REF";
  case RecordTag::Delta:
    return "DELTA";
  case RecordTag::Full:
    return "FULL";
  case RecordTag::PredDelta:
    return "PRED_DELTA";
  }
  return "UNKNOWN";
}

bool hasMagic(std::span<const std::byte> data, const char (&magic)[5]) {
  return data.size() >= MAGIC_SIZE &&
         std::memcmp(data.data(), magic, MAGIC_SIZE) == 0;
}

void writeRecord(ByteWriter &w, const ChunkRecord &record) {
  w.putU8(static_cast<uint8_t>(recordTag(record)));
  std::visit(
      [&w](const auto &r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, RefRecord>) {
          w.putDigest(r.digest);
        } else if constexpr (std::is_same_v<T, DeltaRecord>) {
          w.putDigest(r.base);
          w.putU64(r.checksum);
          w.putUvarint(r.diff.size());
          w.putBytes(r.diff);
        } else if constexpr (std::is_same_v<T, FullRecord>) {
          w.putDigest(r.digest);
          w.putUvarint(r.raw_size);
          w.putUvarint(r.compressed.size());
          w.putBytes(r.compressed);
        } else if constexpr (std::is_same_v<T, PredDeltaRecord>) {
          w.putUvarint(r.prediction_index);
          w.putDigest(r.base);
          w.putU64(r.checksum);
          w.putUvarint(r.diff.size());
          w.putBytes(r.diff);
        } else {
          static_assert(kAlwaysFalse<T>, "unhandled record type");
        }
      },
      record);
}

std::vector<std::byte> serializeEnvelope(const Envelope &envelope) {
  ByteWriter w;
  w.putTag(MAGIC_UCOG);
  w.putU8(WIRE_VERSION);
  w.putU8(static_cast<uint8_t>(envelope.hash_algo));
  w.putUvarint(envelope.records.size());
  for (const auto &record : envelope.records) {
    writeRecord(w, record);
  }
  return w.take();
}

Envelope parseEnvelope(std::span<const std::byte> blob) {
  if (!hasMagic(blob, MAGIC_UCOG)) {
    throw UnrecognizedFormatError(printableTag(blob));
  }
  ByteReader r(blob.subspan(MAGIC_SIZE));
  uint8_t const version = r.getU8();
  if (version != WIRE_VERSION) {
    throw MalformedEnvelopeError("unsupported version " +
                                 std::to_string(version));
  }
  uint8_t const algo = r.getU8();
  if (algo > static_cast<uint8_t>(HashAlgorithm::BLAKE3)) {
    throw MalformedEnvelopeError("unknown hash algorithm " +
                                 std::to_string(algo));
  }

  Envelope env;
  env.hash_algo = static_cast<HashAlgorithm>(algo);
  uint64_t const count = r.getUvarint();
  if (count > r.remaining() / kMinRecordSize) {
    throw MalformedEnvelopeError("record count " + std::to_string(count) +
                                 " exceeds envelope size");
  }
  env.records.reserve(static_cast<size_t>(count));

  for (uint64_t i = 0; i < count; ++i) {
    uint8_t const tag = r.getU8();
    switch (static_cast<RecordTag>(tag)) {
    case RecordTag::Ref: {
      env.records.emplace_back(RefRecord{r.getDigest()});
      break;
    }
    case RecordTag::Delta: {
      DeltaRecord d;
      d.base = r.getDigest();
      d.checksum = r.getU64();
      d.diff = copyOf(r.getBytes(r.getUvarint()));
      env.records.emplace_back(std::move(d));
      break;
    }
    case RecordTag::Full: {
      FullRecord f;
      f.digest = r.getDigest();
      f.raw_size = r.getUvarint();
      f.compressed = copyOf(r.getBytes(r.getUvarint()));
      env.records.emplace_back(std::move(f));
      break;
    }
    case RecordTag::PredDelta: {
      PredDeltaRecord p;
      p.prediction_index = r.getUvarint();
      p.base = r.getDigest();
      p.checksum = r.getU64();
      p.diff = copyOf(r.getBytes(r.getUvarint()));
      env.records.emplace_back(std::move(p));
      break;
    }
    default:
      throw MalformedEnvelopeError("unknown record tag " + std::to_string(tag) +
                                   " in record " + std::to_string(i));
    }
  }
  if (!r.atEnd()) {
    throw MalformedEnvelopeError(std::to_string(r.remaining()) +
                                 " trailing bytes after last record");
  }
  return env;
}

std::vector<DigestArray> referencedDigests(const Envelope &envelope) {
  std::vector<DigestArray> out;
  for (const auto &record : envelope.records) {
    std::visit(
        [&out](const auto &r) {
          using T = std::decay_t<decltype(r)>;
          if constexpr (std::is_same_v<T, RefRecord> ||
                        std::is_same_v<T, FullRecord>) {
            out.push_back(r.digest);
          } else {
            out.push_back(r.base);
          }
        },
        record);
  }
  return out;
}

} // namespace cogdedup
