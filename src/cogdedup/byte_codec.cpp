#include "cogdedup/byte_codec.hpp"
#include "cogdedup/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>

namespace cogdedup {

void ByteWriter::putU32(uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    putU8(static_cast<uint8_t>(v >> (8 * i)));
  }
}

void ByteWriter::putU64(uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    putU8(static_cast<uint8_t>(v >> (8 * i)));
  }
}

void ByteWriter::putUvarint(uint64_t v) {
  while (v >= 0x80) {
    putU8(static_cast<uint8_t>(v) | 0x80);
    v >>= 7;
  }
  putU8(static_cast<uint8_t>(v));
}

void ByteWriter::putBytes(std::span<const std::byte> bytes) {
  buf_.insert(buf_.end(), bytes.begin(), bytes.end());
}

void ByteWriter::putDigest(const DigestArray &digest) {
  for (uint8_t b : digest) {
    putU8(b);
  }
}

void ByteWriter::putTag(const char (&tag)[5]) {
  for (int i = 0; i < 4; ++i) {
    putU8(static_cast<uint8_t>(tag[i]));
  }
}

void ByteReader::require(uint64_t n, const char *what) const {
  if (n > remaining()) {
    throw MalformedEnvelopeError(std::string("truncated ") + what +
                                 " at offset " + std::to_string(pos_));
  }
}

uint8_t ByteReader::getU8() {
  require(1, "byte");
  return static_cast<uint8_t>(data_[pos_++]);
}

uint32_t ByteReader::getU32() {
  require(4, "u32");
  uint32_t v = 0;
  for (int i = 0; i < 4; ++i) {
    v |= static_cast<uint32_t>(static_cast<uint8_t>(data_[pos_++])) << (8 * i);
  }
  return v;
}

uint64_t ByteReader::getU64() {
  require(8, "u64");
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i) {
    v |= static_cast<uint64_t>(static_cast<uint8_t>(data_[pos_++])) << (8 * i);
  }
  return v;
}

uint64_t ByteReader::getUvarint() {
  uint64_t v = 0;
  for (unsigned shift = 0; shift < 64; shift += 7) {
    uint8_t const b = getU8();
    // The tenth byte carries bit 63 only.
    if (shift == 63 && b > 1) {
      throw MalformedEnvelopeError("varint overflows 64 bits at offset " +
                                   std::to_string(pos_ - 1));
    }
    v |= static_cast<uint64_t>(b & 0x7F) << shift;
    if ((b & 0x80) == 0) {
      return v;
    }
  }
  throw MalformedEnvelopeError("varint longer than 64 bits at offset " +
                               std::to_string(pos_));
}

DigestArray ByteReader::getDigest() {
  require(DIGEST_SIZE, "digest");
  DigestArray d;
  for (size_t i = 0; i < DIGEST_SIZE; ++i) {
    d[i] = static_cast<uint8_t>(data_[pos_++]);
  }
  return d;
}

std::span<const std::byte> ByteReader::getBytes(uint64_t n) {
  require(n, "byte range");
  auto view = data_.subspan(pos_, static_cast<size_t>(n));
  pos_ += static_cast<size_t>(n);
  return view;
}

std::string printableTag(std::span<const std::byte> data) {
  std::string out;
  size_t const n = std::min<size_t>(4, data.size());
  for (size_t i = 0; i < n; ++i) {
    auto const c = static_cast<unsigned char>(data[i]);
    if (std::isprint(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      char hex[5];
      std::snprintf(hex, sizeof(hex), "\\x%02x", c);
      out += hex;
    }
  }
  return out;
}

} // namespace cogdedup
