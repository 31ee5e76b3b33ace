#ifndef COGDEDUP_ANOMALY_DETECTOR_HPP
#define COGDEDUP_ANOMALY_DETECTOR_HPP

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cogdedup {

enum class Severity { Low, Medium, High };

const char *severityName(Severity severity);

struct AnomalyAlert {
  std::chrono::system_clock::time_point timestamp;
  std::string label;
  double ratio = 0.0;
  double z_score = 0.0;
  double mean = 0.0;
  double stddev = 0.0;
  Severity severity = Severity::Low;

  std::string toString() const;
};

struct DriftReport {
  size_t window_size = 0;
  double mean = 0.0;
  double stddev = 0.0;
  /// Mean of the newer half minus mean of the older half.
  double trend = 0.0;
  size_t alerts = 0;
  bool drifting = false;
};

/**
 * @brief Sliding-window z-score detector over compression ratios.
 *
 * A ratio far below the window mean means novel data; far above it
 * suggests a duplication loop. Nothing is flagged until min_samples
 * observations are in the window.
 */
class AnomalyDetector {
public:
  static constexpr size_t kMinSamples = 5;

  explicit AnomalyDetector(size_t window_size = 50, double z_low = -2.0,
                           double z_high = 3.0);

  std::optional<AnomalyAlert> observe(double ratio,
                                      const std::string &label = "");

  DriftReport driftReport() const;
  std::vector<AnomalyAlert> alerts() const;
  size_t observations() const;
  void reset();

private:
  size_t window_size_;
  double z_low_;
  double z_high_;
  mutable std::mutex mutex_;
  std::deque<double> history_;
  std::vector<AnomalyAlert> alerts_;
  size_t observations_ = 0;
};

} // namespace cogdedup

#endif // COGDEDUP_ANOMALY_DETECTOR_HPP
