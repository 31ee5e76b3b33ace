#ifndef COGDEDUP_PREDICTOR_HPP
#define COGDEDUP_PREDICTOR_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cogdedup {

/**
 * @brief First-order model of which chunk tends to follow which.
 *
 * Fed with the chunk sequence of every encoded payload; queried by the
 * classifier for likely delta bases of the next chunk. Both the number of
 * tracked chunks and the successors kept per chunk are bounded; the
 * oldest tracked chunk and the rarest successor are dropped first.
 */
class Predictor {
public:
  explicit Predictor(size_t max_tracked = 4096, size_t max_successors = 8);

  /// Most frequent successors of @p previous, most frequent first.
  std::vector<std::string> predict(const std::string &previous,
                                   size_t top_k = 3) const;

  /// Record each adjacent pair of @p sequence.
  void observe(const std::vector<std::string> &sequence);
  void observe(const std::string &previous, const std::string &next);

  size_t tracked() const;
  void clear();

  /**
   * @brief Write the successor table to @p path ("UCPR" file).
   *
   * Written to a temporary file then renamed over @p path.
   * @throw std::runtime_error On I/O failure.
   */
  void save(const std::string &path) const;

  /**
   * @brief Replace the table with the contents of @p path.
   *
   * Entries beyond this predictor's bounds are dropped as observe() would.
   * @throw std::runtime_error If the file cannot be read.
   * @throw MalformedEnvelopeError If the file is truncated or invalid.
   */
  void load(const std::string &path);

private:
  void observeLocked(const std::string &previous, const std::string &next);

  size_t max_tracked_;
  size_t max_successors_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::unordered_map<std::string, uint64_t>>
      successors_;
  std::deque<std::string> order_;
};

} // namespace cogdedup

#endif // COGDEDUP_PREDICTOR_HPP
