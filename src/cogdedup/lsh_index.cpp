#include "cogdedup/lsh_index.hpp"
#include "cogdedup/hasher.hpp"

namespace cogdedup {

void LshIndex::insert(const std::string &cid, uint64_t fingerprint) {
  auto [it, inserted] = fingerprints_.emplace(cid, fingerprint);
  if (!inserted) {
    return;
  }
  for (unsigned b = 0; b < kBands; ++b) {
    buckets_[b][band(fingerprint, b)].insert(cid);
  }
}

void LshIndex::remove(const std::string &cid) {
  auto it = fingerprints_.find(cid);
  if (it == fingerprints_.end()) {
    return;
  }
  for (unsigned b = 0; b < kBands; ++b) {
    auto bucket = buckets_[b].find(band(it->second, b));
    if (bucket == buckets_[b].end()) {
      continue;
    }
    bucket->second.erase(cid);
    if (bucket->second.empty()) {
      buckets_[b].erase(bucket);
    }
  }
  fingerprints_.erase(it);
}

std::unordered_set<std::string> LshIndex::candidates(uint64_t fingerprint) const {
  std::unordered_set<std::string> out;
  for (unsigned b = 0; b < kBands; ++b) {
    auto bucket = buckets_[b].find(band(fingerprint, b));
    if (bucket != buckets_[b].end()) {
      out.insert(bucket->second.begin(), bucket->second.end());
    }
  }
  return out;
}

std::vector<std::pair<std::string, int>>
LshIndex::withinDistance(uint64_t fingerprint, int max_distance) const {
  std::vector<std::pair<std::string, int>> out;
  for (const auto &cid : candidates(fingerprint)) {
    int const d = hammingDistance(fingerprint, fingerprints_.at(cid));
    if (d <= max_distance) {
      out.emplace_back(cid, d);
    }
  }
  return out;
}

void LshIndex::clear() {
  for (auto &b : buckets_) {
    b.clear();
  }
  fingerprints_.clear();
}

} // namespace cogdedup
