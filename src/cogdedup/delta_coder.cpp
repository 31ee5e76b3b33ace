#include "cogdedup/delta_coder.hpp"
#include "cogdedup/byte_codec.hpp"
#include "cogdedup/errors.hpp"

#include <algorithm>
#include <cstring>
#include <unordered_map>

namespace cogdedup {

namespace {

// Candidate base offsets kept per block hash.
constexpr size_t kMaxCandidates = 4;

uint64_t blockHash(const std::byte *p) {
  uint64_t h = 0xcbf29ce484222325ULL;
  for (size_t i = 0; i < DeltaCoder::kBlockSize; ++i) {
    h ^= static_cast<uint8_t>(p[i]);
    h *= 0x100000001b3ULL;
  }
  return h;
}

void emitInsert(ByteWriter &w, std::span<const std::byte> literal) {
  if (literal.empty()) {
    return;
  }
  w.putU8(DeltaCoder::kOpInsert);
  w.putUvarint(literal.size());
  w.putBytes(literal);
}

void emitCopy(ByteWriter &w, size_t offset, size_t length) {
  w.putU8(DeltaCoder::kOpCopy);
  w.putUvarint(offset);
  w.putUvarint(length);
}

} // namespace

std::vector<std::byte> DeltaCoder::encode(std::span<const std::byte> base,
                                          std::span<const std::byte> target) {
  ByteWriter w;
  w.putUvarint(target.size());

  std::unordered_map<uint64_t, std::vector<size_t>> index;
  if (base.size() >= kBlockSize) {
    for (size_t p = 0; p + kBlockSize <= base.size(); p += kBlockSize) {
      auto &slots = index[blockHash(base.data() + p)];
      if (slots.size() < kMaxCandidates) {
        slots.push_back(p);
      }
    }
  }

  size_t literal_start = 0;
  size_t i = 0;
  while (i + kBlockSize <= target.size()) {
    auto it = index.find(blockHash(target.data() + i));
    size_t best_len = 0;
    size_t best_base = 0;
    size_t best_back = 0;
    if (it != index.end()) {
      for (size_t p : it->second) {
        if (std::memcmp(base.data() + p, target.data() + i, kBlockSize) != 0) {
          continue;
        }
        size_t len = kBlockSize;
        while (p + len < base.size() && i + len < target.size() &&
               base[p + len] == target[i + len]) {
          ++len;
        }
        size_t back = 0;
        while (back < p && back < i - literal_start &&
               base[p - back - 1] == target[i - back - 1]) {
          ++back;
        }
        if (len + back > best_len + best_back) {
          best_len = len;
          best_base = p;
          best_back = back;
        }
      }
    }
    if (best_len == 0) {
      ++i;
      continue;
    }
    emitInsert(w, target.subspan(literal_start, i - best_back - literal_start));
    emitCopy(w, best_base - best_back, best_len + best_back);
    i += best_len;
    literal_start = i;
  }
  emitInsert(w, target.subspan(literal_start));
  return w.take();
}

uint64_t DeltaCoder::declaredSize(std::span<const std::byte> diff) {
  ByteReader r(diff);
  return r.getUvarint();
}

double DeltaCoder::expansionRatio(std::span<const std::byte> diff) {
  if (diff.empty()) {
    return 0.0;
  }
  return static_cast<double>(declaredSize(diff)) /
         static_cast<double>(diff.size());
}

std::vector<std::byte> DeltaCoder::decode(std::span<const std::byte> base,
                                          std::span<const std::byte> diff,
                                          const SecurityPolicy &policy) {
  ByteReader r(diff);
  uint64_t const target_size = r.getUvarint();
  IntegrityVerifier(policy).checkExpansion(target_size, diff.size());

  std::vector<std::byte> out;
  out.reserve(static_cast<size_t>(target_size));
  while (!r.atEnd()) {
    uint8_t const op = r.getU8();
    if (op == kOpCopy) {
      uint64_t const offset = r.getUvarint();
      uint64_t const length = r.getUvarint();
      if (offset > base.size() || length > base.size() - offset) {
        throw CorruptChunkError("delta copy [" + std::to_string(offset) + ", +" +
                                std::to_string(length) +
                                ") outside base of " +
                                std::to_string(base.size()) + " bytes");
      }
      if (length > target_size - out.size()) {
        throw CorruptChunkError("delta output exceeds declared size");
      }
      out.insert(out.end(), base.begin() + static_cast<ptrdiff_t>(offset),
                 base.begin() + static_cast<ptrdiff_t>(offset + length));
    } else if (op == kOpInsert) {
      uint64_t const length = r.getUvarint();
      if (length > target_size - out.size()) {
        throw CorruptChunkError("delta output exceeds declared size");
      }
      auto literal = r.getBytes(length);
      out.insert(out.end(), literal.begin(), literal.end());
    } else {
      throw CorruptChunkError("unknown delta op " + std::to_string(op));
    }
  }
  if (out.size() != target_size) {
    throw CorruptChunkError("delta produced " + std::to_string(out.size()) +
                            " bytes, declared " + std::to_string(target_size));
  }
  return out;
}

} // namespace cogdedup
