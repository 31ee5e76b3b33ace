#include "cogdedup/integrity.hpp"
#include "cogdedup/chunk_io.hpp"
#include "cogdedup/errors.hpp"

namespace cogdedup {

void IntegrityVerifier::enforceRefCount(const std::string &cid,
                                        uint64_t ref_count) const {
  if (!checkRefCount(ref_count)) {
    throw ReferenceCapExceededError(cid, ref_count);
  }
}

void IntegrityVerifier::checkExpansion(uint64_t declared_size,
                                       size_t diff_size) const {
  // An empty diff cannot describe anything; treat it as one byte so the
  // ratio stays finite.
  double const ratio = static_cast<double>(declared_size) /
                       static_cast<double>(diff_size == 0 ? 1 : diff_size);
  if (ratio > policy_.max_delta_expansion) {
    throw ExpansionLimitExceededError(ratio, policy_.max_delta_expansion);
  }
  checkChunkSize(declared_size, diff_size);
}

void IntegrityVerifier::checkChunkSize(uint64_t declared_size,
                                       size_t encoded_size) const {
  if (declared_size > policy_.max_chunk_bytes) {
    double const ratio =
        static_cast<double>(declared_size) /
        static_cast<double>(encoded_size == 0 ? 1 : encoded_size);
    throw ExpansionLimitExceededError(
        "Declared size " + std::to_string(declared_size) +
            " exceeds chunk limit " + std::to_string(policy_.max_chunk_bytes),
        ratio, policy_.max_delta_expansion);
  }
}

void IntegrityVerifier::verifyChecksum(std::span<const std::byte> data,
                                       uint64_t expected,
                                       const std::string &what) {
  if (!policy_.verify_deltas) {
    return;
  }
  if (ChunkIO::short_checksum(data) != expected) {
    ++failed_;
    throw CorruptChunkError("checksum mismatch for " + what);
  }
  ++verified_;
}

void IntegrityVerifier::verifyDigest(std::span<const std::byte> data,
                                     const DigestArray &expected,
                                     HashAlgorithm algo) {
  if (!policy_.verify_deltas) {
    return;
  }
  DigestResult const actual = ChunkIO::hash(data, algo);
  if (actual.digest != expected) {
    ++failed_;
    throw CorruptChunkError("payload does not hash to " +
                            digest_to_cid(expected, algo));
  }
  ++verified_;
}

} // namespace cogdedup
