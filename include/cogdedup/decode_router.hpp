#ifndef COGDEDUP_DECODE_ROUTER_HPP
#define COGDEDUP_DECODE_ROUTER_HPP

#include "cogdedup/codec.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace cogdedup {

enum class FormatFamily {
  CognitiveDedup, ///< UCOG
  Stream,         ///< USST
  Template,       ///< TPF3
  RawZstd,        ///< USZR
  DictionaryZstd, ///< USZD
  RawBrotli,      ///< USBR
  RawBzip2,       ///< USBZ
  Unknown,
};

const char *formatFamilyName(FormatFamily family);

/**
 * @brief Dispatches a blob to the decoder for its magic tag.
 *
 * UCOG, USST, USZR, USZD, USBR and USBZ are decoded. TPF3 is a known
 * family member without a decoder in this build. The raw fallbacks never
 * produce more than max_fallback_bytes.
 */
class DecodeRouter {
public:
  static constexpr size_t kDefaultMaxFallbackBytes = 256 * 1024 * 1024;

  explicit DecodeRouter(CodecOptions options = CodecOptions{},
                        size_t max_fallback_bytes = kDefaultMaxFallbackBytes);

  static FormatFamily detect(std::span<const std::byte> blob);

  /**
   * @throw UnrecognizedFormatError On an unknown magic.
   * @throw UnsupportedFormatError For TPF3.
   * @throw ExpansionLimitExceededError If a fallback frame declares or
   *        produces more than max_fallback_bytes.
   * @throw MalformedEnvelopeError On truncated fallback streams.
   * @throw CorruptChunkError On fallback streams the decoder rejects.
   * @throw CodecError subclasses from the UCOG decoder.
   */
  std::vector<std::byte> decode(std::span<const std::byte> blob,
                                ChunkStore &store,
                                const SecurityPolicy &policy) const;

  /// "USZR" | zstd frame
  static std::vector<std::byte> encodeRawFallback(std::span<const std::byte> data,
                                                  int level = 19);

  /// "USZD" | u32 LE dictionary length | dictionary | zstd frame
  static std::vector<std::byte>
  encodeDictionaryFallback(std::span<const std::byte> data,
                           std::span<const std::byte> dictionary,
                           int level = 19);

  /// "USBR" | brotli stream
  static std::vector<std::byte>
  encodeBrotliFallback(std::span<const std::byte> data, int quality = 11);

  /// "USBZ" | bzip2 stream
  static std::vector<std::byte>
  encodeBzip2Fallback(std::span<const std::byte> data, int block_size = 9);

private:
  std::vector<std::byte> decodeStream(std::span<const std::byte> blob,
                                      ChunkStore &store,
                                      const SecurityPolicy &policy) const;
  std::vector<std::byte> decodeRawZstd(std::span<const std::byte> blob) const;
  std::vector<std::byte>
  decodeDictionaryZstd(std::span<const std::byte> blob) const;
  std::vector<std::byte> decodeRawBrotli(std::span<const std::byte> blob) const;
  std::vector<std::byte> decodeRawBzip2(std::span<const std::byte> blob) const;
  size_t checkedFrameSize(std::span<const std::byte> frame) const;
  // Append decoder output, refusing to grow past max_fallback_bytes.
  void appendBounded(std::vector<std::byte> &out, const uint8_t *data,
                     size_t size, size_t input_size) const;

  Codec codec_;
  size_t max_fallback_bytes_;
};

} // namespace cogdedup

#endif // COGDEDUP_DECODE_ROUTER_HPP
