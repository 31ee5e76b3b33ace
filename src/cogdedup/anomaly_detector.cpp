#include "cogdedup/anomaly_detector.hpp"
#include "utilities/logger.h"

#include <cmath>
#include <cstdio>
#include <numeric>
#include <stdexcept>

namespace cogdedup {

namespace {

// Stand-in deviation when the window is constant.
constexpr double kMinStddev = 0.001;

struct Moments {
  double mean = 0.0;
  double stddev = 0.0;
};

Moments moments(const std::deque<double> &values) {
  Moments m;
  if (values.empty()) {
    return m;
  }
  double const n = static_cast<double>(values.size());
  m.mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
  double variance = 0.0;
  for (double v : values) {
    variance += (v - m.mean) * (v - m.mean);
  }
  m.stddev = std::sqrt(variance / n);
  return m;
}

} // namespace

const char *severityName(Severity severity) {
  switch (severity) {
  case Severity::Low:
    return "low";
  case Severity::Medium:
    return "medium";
  case Severity::High:
    return "high";
  }
  return "unknown";
}

std::string AnomalyAlert::toString() const {
  char buf[160];
  std::snprintf(buf, sizeof(buf), "ratio=%.1fx (z=%+.2f, mean=%.1fx, std=%.2f)",
                ratio, z_score, mean, stddev);
  return std::string("[") + severityName(severity) + "] " + buf + " @ " + label;
}

AnomalyDetector::AnomalyDetector(size_t window_size, double z_low,
                                 double z_high)
    : window_size_(window_size), z_low_(z_low), z_high_(z_high) {
  if (window_size_ < kMinSamples) {
    throw std::invalid_argument("Anomaly window must hold at least " +
                                std::to_string(kMinSamples) + " samples");
  }
  if (z_low_ >= 0.0 || z_high_ <= 0.0) {
    throw std::invalid_argument(
        "z_low must be negative and z_high positive");
  }
}

std::optional<AnomalyAlert> AnomalyDetector::observe(double ratio,
                                                     const std::string &label) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++observations_;

  std::optional<AnomalyAlert> alert;
  if (history_.size() >= kMinSamples) {
    Moments const m = moments(history_);
    double const stddev = m.stddev > 0.0 ? m.stddev : kMinStddev;
    double const z = (ratio - m.mean) / stddev;

    if (z < z_low_ || z > z_high_) {
      AnomalyAlert a;
      a.timestamp = std::chrono::system_clock::now();
      a.label = label;
      a.ratio = ratio;
      a.z_score = z;
      a.mean = m.mean;
      a.stddev = stddev;
      if (z < z_low_) {
        a.severity = z < z_low_ * 1.5 ? Severity::High : Severity::Medium;
      } else {
        a.severity = z > z_high_ * 1.5 ? Severity::Medium : Severity::Low;
      }
      alerts_.push_back(a);
      alert = a;
      Logger::getInstance().log(LogLevel::WARN, "anomaly",
                                "Compression ratio anomaly " + a.toString());
    }
  }

  history_.push_back(ratio);
  if (history_.size() > window_size_) {
    history_.pop_front();
  }
  return alert;
}

DriftReport AnomalyDetector::driftReport() const {
  std::lock_guard<std::mutex> lock(mutex_);
  DriftReport report;
  report.window_size = history_.size();
  report.alerts = alerts_.size();
  Moments const m = moments(history_);
  report.mean = m.mean;
  if (history_.size() < 2) {
    return report;
  }
  report.stddev = m.stddev;

  size_t const half = history_.size() / 2;
  double const older =
      std::accumulate(history_.begin(), history_.begin() + half, 0.0) /
      static_cast<double>(half);
  double const newer =
      std::accumulate(history_.begin() + half, history_.end(), 0.0) /
      static_cast<double>(history_.size() - half);
  report.trend = newer - older;
  report.drifting = report.stddev > 0.0 ? std::abs(report.trend) > report.stddev
                                        : std::abs(report.trend) > 0.5;
  return report;
}

std::vector<AnomalyAlert> AnomalyDetector::alerts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return alerts_;
}

size_t AnomalyDetector::observations() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return observations_;
}

void AnomalyDetector::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  history_.clear();
  alerts_.clear();
  observations_ = 0;
}

} // namespace cogdedup
