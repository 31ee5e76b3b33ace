#include "cogdedup/chunk_io.hpp"

#include <memory>
#include <stdexcept>
#include <zstd.h>

namespace cogdedup {

namespace {

// Checksums only need to be stable across processes, not secret.
constexpr unsigned char kChecksumKey[crypto_shorthash_KEYBYTES] = {
    'c', 'o', 'g', 'd', 'e', 'd', 'u', 'p',
    '-', 'c', 'h', 'e', 'c', 'k', 's', 'm'};

struct CCtxDeleter {
  void operator()(ZSTD_CCtx *ctx) const { ZSTD_freeCCtx(ctx); }
};
struct DCtxDeleter {
  void operator()(ZSTD_DCtx *ctx) const { ZSTD_freeDCtx(ctx); }
};

void ensure_sodium() {
  // sodium_init() returns -1 on error, 0 on success, 1 if already done.
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

} // namespace

ChunkIO::ChunkIO(HashAlgorithm hash_algo, int compression_level)
    : hash_algo_(hash_algo), compression_level_(compression_level) {
  ensure_sodium();
  if (hash_algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_init(&sha_state_);
  } else {
    blake3_hasher_init(&blake3_state_);
  }
}

void ChunkIO::ingest(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after finalize_hashed() has been called.");
  }
  if (!data || size == 0) {
    return;
  }
  if (hash_algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_update(
        &sha_state_, reinterpret_cast<const unsigned char *>(data), size);
  } else {
    blake3_hasher_update(&blake3_state_, reinterpret_cast<const uint8_t *>(data),
                         size);
  }
}

DigestResult ChunkIO::finalize_hashed() {
  if (finalized_) {
    throw std::logic_error("finalize_hashed() already called.");
  }
  DigestResult result;
  if (hash_algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_final(&sha_state_, result.digest.data());
  } else {
    blake3_hasher_finalize(&blake3_state_, result.digest.data(), DIGEST_SIZE);
  }
  result.cid = digest_to_cid(result.digest, hash_algo_);
  finalized_ = true;
  return result;
}

DigestResult ChunkIO::hash(std::span<const std::byte> data,
                           HashAlgorithm algo) {
  ChunkIO io(algo);
  io.ingest(data.data(), data.size());
  return io.finalize_hashed();
}

std::vector<std::byte>
ChunkIO::compress_data(std::span<const std::byte> data) const {
  if (data.empty()) {
    return {};
  }
  size_t const bound = ZSTD_compressBound(data.size());
  std::vector<std::byte> out(bound);
  size_t const written = ZSTD_compress(out.data(), bound, data.data(),
                                       data.size(), compression_level_);
  if (ZSTD_isError(written)) {
    throw std::runtime_error(std::string("ZSTD_compress failed: ") +
                             ZSTD_getErrorName(written));
  }
  out.resize(written);
  return out;
}

std::vector<std::byte>
ChunkIO::decompress_data(std::span<const std::byte> compressed,
                         size_t original_size) const {
  if (compressed.empty() || original_size == 0) {
    if (!compressed.empty() || original_size != 0) {
      throw std::runtime_error(
          "ZSTD_decompress failed: empty frame with non-zero size.");
    }
    return {};
  }
  std::vector<std::byte> out(original_size);
  size_t const got = ZSTD_decompress(out.data(), original_size,
                                     compressed.data(), compressed.size());
  if (ZSTD_isError(got)) {
    throw std::runtime_error(std::string("ZSTD_decompress failed: ") +
                             ZSTD_getErrorName(got));
  }
  if (got != original_size) {
    throw std::runtime_error(
        "ZSTD_decompress failed: output size does not match original size.");
  }
  return out;
}

std::vector<std::byte>
ChunkIO::compress_with_dictionary(std::span<const std::byte> data,
                                  std::span<const std::byte> dictionary) const {
  if (data.empty()) {
    return {};
  }
  std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx(ZSTD_createCCtx());
  if (!cctx) {
    throw std::runtime_error("ZSTD_createCCtx failed");
  }
  size_t const bound = ZSTD_compressBound(data.size());
  std::vector<std::byte> out(bound);
  size_t const written = ZSTD_compress_usingDict(
      cctx.get(), out.data(), bound, data.data(), data.size(),
      dictionary.data(), dictionary.size(), compression_level_);
  if (ZSTD_isError(written)) {
    throw std::runtime_error(std::string("ZSTD_compress_usingDict failed: ") +
                             ZSTD_getErrorName(written));
  }
  out.resize(written);
  return out;
}

std::vector<std::byte>
ChunkIO::decompress_with_dictionary(std::span<const std::byte> compressed,
                                    std::span<const std::byte> dictionary,
                                    size_t original_size) const {
  if (compressed.empty() || original_size == 0) {
    if (!compressed.empty() || original_size != 0) {
      throw std::runtime_error(
          "ZSTD_decompress_usingDict failed: empty frame with non-zero size.");
    }
    return {};
  }
  std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx(ZSTD_createDCtx());
  if (!dctx) {
    throw std::runtime_error("ZSTD_createDCtx failed");
  }
  std::vector<std::byte> out(original_size);
  size_t const got = ZSTD_decompress_usingDict(
      dctx.get(), out.data(), original_size, compressed.data(),
      compressed.size(), dictionary.data(), dictionary.size());
  if (ZSTD_isError(got)) {
    throw std::runtime_error(std::string("ZSTD_decompress_usingDict failed: ") +
                             ZSTD_getErrorName(got));
  }
  if (got != original_size) {
    throw std::runtime_error("ZSTD_decompress_usingDict failed: output size "
                             "does not match original size.");
  }
  return out;
}

size_t ChunkIO::frame_content_size(std::span<const std::byte> compressed) {
  unsigned long long const size =
      ZSTD_getFrameContentSize(compressed.data(), compressed.size());
  if (size == ZSTD_CONTENTSIZE_ERROR) {
    throw std::runtime_error("Invalid zstd frame header.");
  }
  if (size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw std::runtime_error("Zstd frame does not record its content size.");
  }
  return static_cast<size_t>(size);
}

uint64_t ChunkIO::short_checksum(std::span<const std::byte> data) {
  ensure_sodium();
  unsigned char out[crypto_shorthash_BYTES];
  crypto_shorthash(out, reinterpret_cast<const unsigned char *>(data.data()),
                   data.size(), kChecksumKey);
  uint64_t value = 0;
  for (size_t i = 0; i < crypto_shorthash_BYTES; ++i) {
    value |= static_cast<uint64_t>(out[i]) << (8 * i);
  }
  return value;
}

} // namespace cogdedup
