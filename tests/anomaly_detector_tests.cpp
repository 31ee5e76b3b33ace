#include "gtest/gtest.h"
#include "cogdedup/anomaly_detector.hpp"

#include <stdexcept>

using namespace cogdedup;

TEST(AnomalyDetectorTest, NoAlertsBeforeMinimumSamples) {
    AnomalyDetector detector;
    for (int i = 0; i < 4; ++i) {
        EXPECT_FALSE(detector.observe(10.0 + i).has_value());
    }
    EXPECT_FALSE(detector.observe(1000.0).has_value());
    EXPECT_EQ(detector.observations(), 5u);
}

TEST(AnomalyDetectorTest, LowRatioIsHighSeverity) {
    AnomalyDetector detector;
    for (int i = 0; i < 20; ++i) {
        detector.observe(i % 2 == 0 ? 9.0 : 11.0);
    }
    auto alert = detector.observe(2.0, "novel-batch");
    ASSERT_TRUE(alert.has_value());
    EXPECT_EQ(alert->severity, Severity::High);
    EXPECT_LT(alert->z_score, -3.0);
    EXPECT_EQ(alert->label, "novel-batch");
    EXPECT_NE(alert->toString().find("[high]"), std::string::npos);
    EXPECT_EQ(detector.alerts().size(), 1u);
}

TEST(AnomalyDetectorTest, SlightlyLowRatioIsMedium) {
    AnomalyDetector detector;
    for (int i = 0; i < 20; ++i) {
        detector.observe(i % 2 == 0 ? 9.0 : 11.0);
    }
    // mean 10, std 1: z = -2.5
    auto alert = detector.observe(7.5);
    ASSERT_TRUE(alert.has_value());
    EXPECT_EQ(alert->severity, Severity::Medium);
}

TEST(AnomalyDetectorTest, HighRatioSeverity) {
    AnomalyDetector detector;
    for (int i = 0; i < 20; ++i) {
        detector.observe(i % 2 == 0 ? 9.0 : 11.0);
    }
    auto mild = detector.observe(13.5); // z = 3.5
    ASSERT_TRUE(mild.has_value());
    EXPECT_EQ(mild->severity, Severity::Low);

    AnomalyDetector other;
    for (int i = 0; i < 20; ++i) {
        other.observe(i % 2 == 0 ? 9.0 : 11.0);
    }
    auto loop = other.observe(20.0); // z = 10
    ASSERT_TRUE(loop.has_value());
    EXPECT_EQ(loop->severity, Severity::Medium);
}

TEST(AnomalyDetectorTest, ConstantWindowUsesFallbackDeviation) {
    AnomalyDetector detector;
    for (int i = 0; i < 10; ++i) {
        EXPECT_FALSE(detector.observe(5.0).has_value());
    }
    auto alert = detector.observe(5.1);
    ASSERT_TRUE(alert.has_value());
    EXPECT_DOUBLE_EQ(alert->stddev, 0.001);
}

TEST(AnomalyDetectorTest, DriftReportShowsTrend) {
    AnomalyDetector detector(20);
    for (int i = 0; i < 20; ++i) {
        detector.observe(i < 10 ? 5.0 : 15.0);
    }
    DriftReport report = detector.driftReport();
    EXPECT_EQ(report.window_size, 20u);
    EXPECT_DOUBLE_EQ(report.mean, 10.0);
    EXPECT_DOUBLE_EQ(report.trend, 10.0);
    EXPECT_TRUE(report.drifting);
}

TEST(AnomalyDetectorTest, StableSeriesIsNotDrifting) {
    AnomalyDetector detector(10);
    for (int i = 0; i < 30; ++i) {
        detector.observe(i % 2 == 0 ? 9.0 : 11.0);
    }
    DriftReport report = detector.driftReport();
    EXPECT_EQ(report.window_size, 10u);
    EXPECT_FALSE(report.drifting);
    detector.reset();
    EXPECT_EQ(detector.observations(), 0u);
    EXPECT_EQ(detector.driftReport().window_size, 0u);
}

TEST(AnomalyDetectorTest, RejectsInvalidConfiguration) {
    EXPECT_THROW(AnomalyDetector(3), std::invalid_argument);
    EXPECT_THROW(AnomalyDetector(50, 1.0, 3.0), std::invalid_argument);
    EXPECT_THROW(AnomalyDetector(50, -2.0, -1.0), std::invalid_argument);
}
