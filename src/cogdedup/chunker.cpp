#include "cogdedup/chunker.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace cogdedup {

namespace {

bool is_power_of_two(size_t v) { return v != 0 && (v & (v - 1)) == 0; }

unsigned log2_of(size_t v) {
  unsigned bits = 0;
  while (v > 1) {
    v >>= 1;
    ++bits;
  }
  return bits;
}

} // namespace

Chunker::Chunker(const ChunkerParams &params) : params_(params) {
  if (!is_power_of_two(params_.avg_size)) {
    throw std::invalid_argument("avg_size must be a power of two, got " +
                                std::to_string(params_.avg_size));
  }
  if (params_.min_size == 0 || params_.min_size > params_.avg_size ||
      params_.avg_size > params_.max_size) {
    throw std::invalid_argument(
        "chunk sizes must satisfy 0 < min_size <= avg_size <= max_size");
  }
  if (params_.window == 0 || params_.window > 256) {
    throw std::invalid_argument("window must be in [1, 256]");
  }

  unsigned const bits = log2_of(params_.avg_size);
  mask_ = bits == 0 ? 0 : (~0ULL << (64 - bits));

  base_pow_window_ = 1;
  for (size_t i = 0; i < params_.window; ++i) {
    base_pow_window_ *= kBase;
  }
  ring_.assign(params_.window, 0);
}

bool Chunker::isBoundary(uint64_t hash, size_t length) const {
  if (length < params_.min_size) {
    return false;
  }
  return length >= params_.max_size || (hash & mask_) == 0;
}

size_t Chunker::nextBoundary(std::span<const std::byte> data,
                             size_t start) const {
  if (start >= data.size()) {
    return data.size();
  }
  size_t const remaining = data.size() - start;
  if (remaining <= params_.min_size) {
    return data.size();
  }

  size_t const limit = std::min(remaining, params_.max_size);
  size_t const w = params_.window;
  // Only the last `w` bytes contribute to the hash, so the scan may begin
  // w bytes before the first position where a cut is allowed.
  size_t const skip = params_.min_size > w ? params_.min_size - w : 0;
  uint64_t hash = 0;
  for (size_t i = skip; i < limit; ++i) {
    auto const in = static_cast<uint8_t>(data[start + i]);
    uint64_t out = 0;
    if (i >= skip + w) {
      out = static_cast<uint8_t>(data[start + i - w]);
    }
    hash = hash * kBase + in - out * base_pow_window_;
    if (isBoundary(hash, i + 1)) {
      return start + i + 1;
    }
  }
  return start + limit;
}

std::vector<ChunkSpan> Chunker::split(std::span<const std::byte> data) const {
  std::vector<ChunkSpan> spans;
  size_t pos = 0;
  while (pos < data.size()) {
    size_t const end = nextBoundary(data, pos);
    spans.push_back({pos, end - pos});
    pos = end;
  }
  return spans;
}

bool Chunker::feed(std::byte b) {
  size_t const w = params_.window;
  auto const in = static_cast<uint8_t>(b);
  size_t const slot = pending_ % w;
  uint64_t const out = pending_ >= w ? ring_[slot] : 0;
  ring_[slot] = in;
  hash_ = hash_ * kBase + in - out * base_pow_window_;
  ++pending_;
  if (isBoundary(hash_, pending_)) {
    reset();
    return true;
  }
  return false;
}

void Chunker::reset() {
  hash_ = 0;
  pending_ = 0;
  std::fill(ring_.begin(), ring_.end(), 0);
}

} // namespace cogdedup
