#ifndef COGDEDUP_BYTE_CODEC_HPP
#define COGDEDUP_BYTE_CODEC_HPP

#include "cogdedup/digest.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace cogdedup {

/**
 * @brief Appends little-endian integers, LEB128 varints and raw bytes.
 */
class ByteWriter {
public:
  void putU8(uint8_t v) { buf_.push_back(static_cast<std::byte>(v)); }
  void putU32(uint32_t v);
  void putU64(uint64_t v);
  void putUvarint(uint64_t v);
  void putBytes(std::span<const std::byte> bytes);
  void putDigest(const DigestArray &digest);
  void putTag(const char (&tag)[5]);

  size_t size() const { return buf_.size(); }
  const std::vector<std::byte> &bytes() const { return buf_; }
  std::vector<std::byte> take() { return std::move(buf_); }

private:
  std::vector<std::byte> buf_;
};

/**
 * @brief Bounds-checked reader over a byte span.
 *
 * Every accessor throws MalformedEnvelopeError when the input is
 * truncated or a varint overflows 64 bits.
 */
class ByteReader {
public:
  explicit ByteReader(std::span<const std::byte> data) : data_(data) {}

  uint8_t getU8();
  uint32_t getU32();
  uint64_t getU64();
  uint64_t getUvarint();
  DigestArray getDigest();
  /// View of the next @p n bytes; no copy.
  std::span<const std::byte> getBytes(uint64_t n);

  size_t offset() const { return pos_; }
  size_t remaining() const { return data_.size() - pos_; }
  bool atEnd() const { return pos_ == data_.size(); }

private:
  void require(uint64_t n, const char *what) const;

  std::span<const std::byte> data_;
  size_t pos_ = 0;
};

/// Encoded length of @p v as a LEB128 varint.
inline size_t uvarintSize(uint64_t v) {
  size_t n = 1;
  while (v >= 0x80) {
    v >>= 7;
    ++n;
  }
  return n;
}

/// Four leading bytes rendered as printable text for messages.
std::string printableTag(std::span<const std::byte> data);

} // namespace cogdedup

#endif // COGDEDUP_BYTE_CODEC_HPP
