#include "cogdedup/decode_router.hpp"
#include "cogdedup/byte_codec.hpp"
#include "cogdedup/chunk_io.hpp"
#include "cogdedup/errors.hpp"
#include "cogdedup/wire_format.hpp"
#include "utilities/logger.h"

#include <array>
#include <brotli/decode.h>
#include <brotli/encode.h>
#include <bzlib.h>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>

namespace cogdedup {

namespace {

const std::string kComponent = "decode_router";

// Streaming decoders write through a buffer of this size.
constexpr size_t kStreamBufferSize = 64 * 1024;

struct BrotliDecoderDeleter {
  void operator()(BrotliDecoderState *state) const {
    BrotliDecoderDestroyInstance(state);
  }
};

// Owns a bz_stream set up for decompression.
class Bzip2Decompressor {
public:
  Bzip2Decompressor() {
    int const rc = BZ2_bzDecompressInit(&stream_, 0, 0);
    if (rc != BZ_OK) {
      throw std::runtime_error("BZ2_bzDecompressInit failed: " +
                               std::to_string(rc));
    }
  }
  ~Bzip2Decompressor() { BZ2_bzDecompressEnd(&stream_); }
  Bzip2Decompressor(const Bzip2Decompressor &) = delete;
  Bzip2Decompressor &operator=(const Bzip2Decompressor &) = delete;

  bz_stream &stream() { return stream_; }

private:
  bz_stream stream_{};
};

struct FamilyTag {
  const char (&magic)[5];
  FormatFamily family;
};

const FamilyTag kFamilies[] = {
    {MAGIC_UCOG, FormatFamily::CognitiveDedup},
    {MAGIC_USST, FormatFamily::Stream},
    {MAGIC_TPF3, FormatFamily::Template},
    {MAGIC_USZR, FormatFamily::RawZstd},
    {MAGIC_USZD, FormatFamily::DictionaryZstd},
    {MAGIC_USBR, FormatFamily::RawBrotli},
    {MAGIC_USBZ, FormatFamily::RawBzip2},
};

} // namespace

const char *formatFamilyName(FormatFamily family) {
  switch (family) {
  case FormatFamily::CognitiveDedup:
    return "cognitive-dedup";
  case FormatFamily::Stream:
    return "stream";
  case FormatFamily::Template:
    return "template";
  case FormatFamily::RawZstd:
    return "raw-zstd";
  case FormatFamily::DictionaryZstd:
    return "dictionary-zstd";
  case FormatFamily::RawBrotli:
    return "raw-brotli";
  case FormatFamily::RawBzip2:
    return "raw-bzip2";
  case FormatFamily::Unknown:
    return "unknown";
  }
  return "unknown";
}

DecodeRouter::DecodeRouter(CodecOptions options, size_t max_fallback_bytes)
    : codec_(options), max_fallback_bytes_(max_fallback_bytes) {}

FormatFamily DecodeRouter::detect(std::span<const std::byte> blob) {
  for (const auto &tag : kFamilies) {
    if (hasMagic(blob, tag.magic)) {
      return tag.family;
    }
  }
  return FormatFamily::Unknown;
}

std::vector<std::byte> DecodeRouter::decode(std::span<const std::byte> blob,
                                            ChunkStore &store,
                                            const SecurityPolicy &policy) const {
  FormatFamily const family = detect(blob);
  Logger::getInstance().log(LogLevel::DEBUG, kComponent,
                            std::string("Routing ") + formatFamilyName(family) +
                                " blob of " + std::to_string(blob.size()) +
                                " bytes");
  try {
    switch (family) {
    case FormatFamily::CognitiveDedup:
      return codec_.decode(blob, store, policy);
    case FormatFamily::Stream:
      return decodeStream(blob, store, policy);
    case FormatFamily::RawZstd:
      return decodeRawZstd(blob);
    case FormatFamily::DictionaryZstd:
      return decodeDictionaryZstd(blob);
    case FormatFamily::RawBrotli:
      return decodeRawBrotli(blob);
    case FormatFamily::RawBzip2:
      return decodeRawBzip2(blob);
    case FormatFamily::Template:
      throw UnsupportedFormatError(printableTag(blob));
    case FormatFamily::Unknown:
      break;
    }
    throw UnrecognizedFormatError(printableTag(blob));
  } catch (const CodecError &e) {
    Logger::getInstance().log(LogLevel::ERROR, kComponent, e.what());
    throw;
  }
}

std::vector<std::byte>
DecodeRouter::decodeStream(std::span<const std::byte> blob, ChunkStore &store,
                           const SecurityPolicy &policy) const {
  ByteReader r(blob.subspan(MAGIC_SIZE));
  uint8_t const version = r.getU8();
  if (version != WIRE_VERSION) {
    throw MalformedEnvelopeError("unsupported stream version " +
                                 std::to_string(version));
  }
  std::vector<std::byte> out;
  for (;;) {
    uint64_t const length = r.getUvarint();
    if (length == 0) {
      break;
    }
    auto segment = codec_.decode(r.getBytes(length), store, policy);
    out.insert(out.end(), segment.begin(), segment.end());
  }
  if (!r.atEnd()) {
    throw MalformedEnvelopeError("trailing bytes after stream terminator");
  }
  return out;
}

size_t DecodeRouter::checkedFrameSize(std::span<const std::byte> frame) const {
  size_t size = 0;
  try {
    size = ChunkIO::frame_content_size(frame);
  } catch (const std::runtime_error &e) {
    throw MalformedEnvelopeError(e.what());
  }
  if (size > max_fallback_bytes_) {
    throw ExpansionLimitExceededError(
        "Fallback frame declares " + std::to_string(size) +
            " bytes, limit is " + std::to_string(max_fallback_bytes_),
        static_cast<double>(size) /
            static_cast<double>(frame.empty() ? 1 : frame.size()),
        static_cast<double>(max_fallback_bytes_));
  }
  return size;
}

std::vector<std::byte>
DecodeRouter::decodeRawZstd(std::span<const std::byte> blob) const {
  auto frame = blob.subspan(MAGIC_SIZE);
  if (frame.empty()) {
    return {};
  }
  size_t const size = checkedFrameSize(frame);
  ChunkIO io;
  try {
    return io.decompress_data(frame, size);
  } catch (const std::runtime_error &e) {
    throw CorruptChunkError(e.what());
  }
}

std::vector<std::byte>
DecodeRouter::decodeDictionaryZstd(std::span<const std::byte> blob) const {
  ByteReader r(blob.subspan(MAGIC_SIZE));
  uint32_t const dict_len = r.getU32();
  auto dictionary = r.getBytes(dict_len);
  auto frame = r.getBytes(r.remaining());
  if (frame.empty()) {
    return {};
  }
  size_t const size = checkedFrameSize(frame);
  ChunkIO io;
  try {
    return io.decompress_with_dictionary(frame, dictionary, size);
  } catch (const std::runtime_error &e) {
    throw CorruptChunkError(e.what());
  }
}

void DecodeRouter::appendBounded(std::vector<std::byte> &out,
                                 const uint8_t *data, size_t size,
                                 size_t input_size) const {
  if (size > max_fallback_bytes_ - out.size()) {
    size_t const total = out.size() + size;
    throw ExpansionLimitExceededError(
        "Fallback stream exceeds " + std::to_string(max_fallback_bytes_) +
            " bytes",
        static_cast<double>(total) /
            static_cast<double>(input_size == 0 ? 1 : input_size),
        static_cast<double>(max_fallback_bytes_));
  }
  const auto *bytes = reinterpret_cast<const std::byte *>(data);
  out.insert(out.end(), bytes, bytes + size);
}

std::vector<std::byte>
DecodeRouter::decodeRawBrotli(std::span<const std::byte> blob) const {
  auto payload = blob.subspan(MAGIC_SIZE);
  if (payload.empty()) {
    return {};
  }
  std::unique_ptr<BrotliDecoderState, BrotliDecoderDeleter> state(
      BrotliDecoderCreateInstance(nullptr, nullptr, nullptr));
  if (!state) {
    throw std::runtime_error("BrotliDecoderCreateInstance failed");
  }

  size_t available_in = payload.size();
  const auto *next_in = reinterpret_cast<const uint8_t *>(payload.data());
  std::array<uint8_t, kStreamBufferSize> buffer;
  std::vector<std::byte> out;
  for (;;) {
    size_t available_out = buffer.size();
    uint8_t *next_out = buffer.data();
    BrotliDecoderResult const result = BrotliDecoderDecompressStream(
        state.get(), &available_in, &next_in, &available_out, &next_out,
        nullptr);
    appendBounded(out, buffer.data(), buffer.size() - available_out,
                  payload.size());
    switch (result) {
    case BROTLI_DECODER_RESULT_SUCCESS:
      if (available_in != 0) {
        throw MalformedEnvelopeError("trailing bytes after brotli stream");
      }
      return out;
    case BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT:
      break;
    case BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT:
      throw MalformedEnvelopeError("truncated brotli stream");
    case BROTLI_DECODER_RESULT_ERROR:
    default:
      throw CorruptChunkError(
          std::string("brotli decode failed: ") +
          BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state.get())));
    }
  }
}

std::vector<std::byte>
DecodeRouter::decodeRawBzip2(std::span<const std::byte> blob) const {
  auto payload = blob.subspan(MAGIC_SIZE);
  if (payload.empty()) {
    return {};
  }
  if (payload.size() > std::numeric_limits<unsigned int>::max()) {
    throw MalformedEnvelopeError("bzip2 payload larger than 4 GiB");
  }
  Bzip2Decompressor decompressor;
  bz_stream &stream = decompressor.stream();
  // libbz2 takes a non-const input pointer but does not write through it.
  stream.next_in =
      const_cast<char *>(reinterpret_cast<const char *>(payload.data()));
  stream.avail_in = static_cast<unsigned int>(payload.size());

  std::array<char, kStreamBufferSize> buffer;
  std::vector<std::byte> out;
  for (;;) {
    stream.next_out = buffer.data();
    stream.avail_out = static_cast<unsigned int>(buffer.size());
    int const rc = BZ2_bzDecompress(&stream);
    size_t const produced = buffer.size() - stream.avail_out;
    appendBounded(out, reinterpret_cast<const uint8_t *>(buffer.data()),
                  produced, payload.size());
    if (rc == BZ_STREAM_END) {
      if (stream.avail_in != 0) {
        throw MalformedEnvelopeError("trailing bytes after bzip2 stream");
      }
      return out;
    }
    if (rc != BZ_OK) {
      throw CorruptChunkError("bzip2 decode failed with code " +
                              std::to_string(rc));
    }
    if (stream.avail_in == 0 && produced == 0) {
      throw MalformedEnvelopeError("truncated bzip2 stream");
    }
  }
}

std::vector<std::byte>
DecodeRouter::encodeRawFallback(std::span<const std::byte> data, int level) {
  ChunkIO io(HashAlgorithm::BLAKE3, level);
  ByteWriter w;
  w.putTag(MAGIC_USZR);
  w.putBytes(io.compress_data(data));
  return w.take();
}

std::vector<std::byte>
DecodeRouter::encodeDictionaryFallback(std::span<const std::byte> data,
                                       std::span<const std::byte> dictionary,
                                       int level) {
  if (dictionary.size() > std::numeric_limits<uint32_t>::max()) {
    throw std::invalid_argument("Dictionary larger than 4 GiB");
  }
  ChunkIO io(HashAlgorithm::BLAKE3, level);
  ByteWriter w;
  w.putTag(MAGIC_USZD);
  w.putU32(static_cast<uint32_t>(dictionary.size()));
  w.putBytes(dictionary);
  w.putBytes(io.compress_with_dictionary(data, dictionary));
  return w.take();
}

std::vector<std::byte>
DecodeRouter::encodeBrotliFallback(std::span<const std::byte> data,
                                   int quality) {
  if (quality < BROTLI_MIN_QUALITY || quality > BROTLI_MAX_QUALITY) {
    throw std::invalid_argument("brotli quality out of range: " +
                                std::to_string(quality));
  }
  size_t encoded_size = BrotliEncoderMaxCompressedSize(data.size());
  if (encoded_size == 0) {
    throw std::invalid_argument("Input too large for brotli");
  }
  std::vector<uint8_t> encoded(encoded_size);
  if (!BrotliEncoderCompress(quality, BROTLI_DEFAULT_WINDOW,
                             BROTLI_MODE_GENERIC, data.size(),
                             reinterpret_cast<const uint8_t *>(data.data()),
                             &encoded_size, encoded.data())) {
    throw std::runtime_error("BrotliEncoderCompress failed");
  }
  ByteWriter w;
  w.putTag(MAGIC_USBR);
  w.putBytes(std::as_bytes(std::span<const uint8_t>(encoded.data(), encoded_size)));
  return w.take();
}

std::vector<std::byte>
DecodeRouter::encodeBzip2Fallback(std::span<const std::byte> data,
                                  int block_size) {
  if (block_size < 1 || block_size > 9) {
    throw std::invalid_argument("bzip2 block size must be 1..9, got " +
                                std::to_string(block_size));
  }
  // Worst case from the libbz2 manual: 1% larger plus 600 bytes.
  size_t const bound = data.size() + data.size() / 100 + 600;
  if (bound > std::numeric_limits<unsigned int>::max()) {
    throw std::invalid_argument("Input too large for bzip2");
  }
  std::vector<char> encoded(bound);
  auto encoded_size = static_cast<unsigned int>(bound);
  int const rc = BZ2_bzBuffToBuffCompress(
      encoded.data(), &encoded_size,
      const_cast<char *>(reinterpret_cast<const char *>(data.data())),
      static_cast<unsigned int>(data.size()), block_size, 0, 0);
  if (rc != BZ_OK) {
    throw std::runtime_error("BZ2_bzBuffToBuffCompress failed: " +
                             std::to_string(rc));
  }
  ByteWriter w;
  w.putTag(MAGIC_USBZ);
  w.putBytes(std::as_bytes(std::span<const char>(encoded.data(), encoded_size)));
  return w.take();
}

} // namespace cogdedup
