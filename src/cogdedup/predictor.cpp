#include "cogdedup/predictor.hpp"
#include "cogdedup/byte_codec.hpp"
#include "cogdedup/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <utility>

namespace cogdedup {

namespace {

constexpr char kTableMagic[5] = "UCPR";
constexpr uint8_t kTableVersion = 1;

const std::string kComponent = "predictor";

void putString(ByteWriter &w, const std::string &s) {
  w.putUvarint(s.size());
  w.putBytes(std::as_bytes(std::span<const char>(s.data(), s.size())));
}

std::string getString(ByteReader &r) {
  auto bytes = r.getBytes(r.getUvarint());
  return std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size());
}

} // namespace

Predictor::Predictor(size_t max_tracked, size_t max_successors)
    : max_tracked_(max_tracked), max_successors_(max_successors) {
  if (max_tracked_ == 0 || max_successors_ == 0) {
    throw std::invalid_argument("Predictor bounds must be positive");
  }
}

std::vector<std::string> Predictor::predict(const std::string &previous,
                                            size_t top_k) const {
  std::vector<std::pair<std::string, uint64_t>> ranked;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = successors_.find(previous);
    if (it == successors_.end()) {
      return {};
    }
    ranked.assign(it->second.begin(), it->second.end());
  }
  std::sort(ranked.begin(), ranked.end(), [](const auto &a, const auto &b) {
    if (a.second != b.second) {
      return a.second > b.second;
    }
    return a.first < b.first;
  });
  std::vector<std::string> out;
  for (size_t i = 0; i < ranked.size() && i < top_k; ++i) {
    out.push_back(std::move(ranked[i].first));
  }
  return out;
}

void Predictor::observe(const std::vector<std::string> &sequence) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = 1; i < sequence.size(); ++i) {
    observeLocked(sequence[i - 1], sequence[i]);
  }
}

void Predictor::observe(const std::string &previous, const std::string &next) {
  std::lock_guard<std::mutex> lock(mutex_);
  observeLocked(previous, next);
}

void Predictor::observeLocked(const std::string &previous,
                              const std::string &next) {
  auto it = successors_.find(previous);
  if (it == successors_.end()) {
    while (successors_.size() >= max_tracked_ && !order_.empty()) {
      successors_.erase(order_.front());
      order_.pop_front();
    }
    it = successors_.emplace(previous, std::unordered_map<std::string, uint64_t>{})
             .first;
    order_.push_back(previous);
  }
  auto &next_counts = it->second;
  auto found = next_counts.find(next);
  if (found != next_counts.end()) {
    ++found->second;
    return;
  }
  if (next_counts.size() >= max_successors_) {
    auto rarest = std::min_element(
        next_counts.begin(), next_counts.end(), [](const auto &a, const auto &b) {
          if (a.second != b.second) {
            return a.second < b.second;
          }
          return a.first > b.first;
        });
    next_counts.erase(rarest);
  }
  next_counts.emplace(next, 1);
}

size_t Predictor::tracked() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return successors_.size();
}

void Predictor::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  successors_.clear();
  order_.clear();
}

void Predictor::save(const std::string &path) const {
  ByteWriter w;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    w.putTag(kTableMagic);
    w.putU8(kTableVersion);
    w.putUvarint(order_.size());
    for (const auto &previous : order_) {
      const auto &next_counts = successors_.at(previous);
      putString(w, previous);
      w.putUvarint(next_counts.size());
      for (const auto &[next, count] : next_counts) {
        putString(w, next);
        w.putUvarint(count);
      }
    }
  }

  const std::string tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw std::runtime_error("Failed to open predictor table for writing: " +
                               tmp);
    }
    const auto &bytes = w.bytes();
    out.write(reinterpret_cast<const char *>(bytes.data()),
              static_cast<std::streamsize>(bytes.size()));
    if (!out) {
      throw std::runtime_error("Failed to write predictor table: " + tmp);
    }
  }
  std::filesystem::rename(tmp, path);
}

void Predictor::load(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open predictor table: " + path);
  }
  std::vector<char> raw((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw std::runtime_error("Failed to read predictor table: " + path);
  }

  ByteReader r(std::as_bytes(std::span<const char>(raw)));
  auto magic = r.getBytes(4);
  if (printableTag(magic) != kTableMagic) {
    throw MalformedEnvelopeError("not a predictor table: '" +
                                 printableTag(magic) + "'");
  }
  uint8_t const version = r.getU8();
  if (version != kTableVersion) {
    throw MalformedEnvelopeError("unsupported predictor table version " +
                                 std::to_string(version));
  }

  // Parse fully before touching the live table.
  std::vector<std::pair<std::string, std::vector<std::pair<std::string, uint64_t>>>>
      entries;
  uint64_t const tracked = r.getUvarint();
  for (uint64_t i = 0; i < tracked; ++i) {
    std::string previous = getString(r);
    std::vector<std::pair<std::string, uint64_t>> next_counts;
    uint64_t const n = r.getUvarint();
    for (uint64_t j = 0; j < n; ++j) {
      std::string next = getString(r);
      uint64_t const count = r.getUvarint();
      if (count == 0) {
        throw MalformedEnvelopeError("zero successor count for " + previous);
      }
      next_counts.emplace_back(std::move(next), count);
    }
    entries.emplace_back(std::move(previous), std::move(next_counts));
  }
  if (!r.atEnd()) {
    throw MalformedEnvelopeError("trailing bytes after predictor table");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  successors_.clear();
  order_.clear();
  for (auto &[previous, next_counts] : entries) {
    // Highest counts survive the per-chunk bound.
    std::sort(next_counts.begin(), next_counts.end(),
              [](const auto &a, const auto &b) {
                if (a.second != b.second) {
                  return a.second > b.second;
                }
                return a.first < b.first;
              });
    if (next_counts.size() > max_successors_) {
      next_counts.resize(max_successors_);
    }
    if (successors_.count(previous) == 0) {
      while (successors_.size() >= max_tracked_ && !order_.empty()) {
        successors_.erase(order_.front());
        order_.pop_front();
      }
      order_.push_back(previous);
    }
    auto &table = successors_[previous];
    table.clear();
    table.insert(next_counts.begin(), next_counts.end());
  }
  Logger::getInstance().log(LogLevel::DEBUG, kComponent,
                            "Loaded " + std::to_string(successors_.size()) +
                                " tracked chunks from " + path);
}

} // namespace cogdedup
