#include "mulegraph/concurrent/parallel_executor.hpp"
#include "mulegraph/observability/logger.hpp"
#include "mulegraph/observability/metrics.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mulegraph;
using namespace mulegraph::observability;

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    saved_level_ = Logger::getInstance().getLogLevel();
    Logger::getInstance().setOutputStream(output_);
    Logger::getInstance().setLogLevel(LogLevel::INFO);
  }

  void TearDown() override {
    Logger::getInstance().setOutputStream(std::cerr);
    Logger::getInstance().setLogLevel(saved_level_);
  }

  std::vector<nlohmann::json> lines() {
    std::vector<nlohmann::json> parsed;
    std::string line;
    std::istringstream in(output_.str());
    while (std::getline(in, line)) parsed.push_back(nlohmann::json::parse(line));
    return parsed;
  }

  std::ostringstream output_;
  LogLevel saved_level_ = LogLevel::INFO;
};

TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
  LOG_INFO("batch started");
  LOG_BUILDER(LogLevel::WARN, "slow stage").field("stage", "proximity").field("levels", 3)
      .field("converged", false);

  auto entries = lines();
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0]["level"], "INFO");
  EXPECT_EQ(entries[0]["message"], "batch started");
  EXPECT_TRUE(entries[0].contains("timestamp"));
  EXPECT_TRUE(entries[0].contains("thread"));
  EXPECT_EQ(entries[0]["component"], "TestBody");

  EXPECT_EQ(entries[1]["level"], "WARN");
  EXPECT_EQ(entries[1]["stage"], "proximity");
  EXPECT_EQ(entries[1]["levels"], 3);
  EXPECT_EQ(entries[1]["converged"], false);
}

TEST_F(LoggerTest, FiltersBelowMinimumLevel) {
  Logger::getInstance().setLogLevel(LogLevel::WARN);
  LOG_DEBUG("hidden");
  LOG_INFO("hidden");
  LOG_ERROR("shown");

  auto entries = lines();
  ASSERT_EQ(entries.size(), 1u);
  EXPECT_EQ(entries[0]["level"], "ERROR");
}

TEST(MetricsCollectorTest, CountersGaugesAndHistograms) {
  MetricsCollector metrics;
  metrics.describe("mulegraph_batches_total", "Batch runs");
  metrics.incrementCounter("mulegraph_batches_total");
  metrics.incrementCounter("mulegraph_batches_total", 2.0);
  metrics.setGauge("mulegraph_feature_generation", 7.0);
  metrics.observeHistogram("mulegraph_batch_duration_seconds", 0.02);
  metrics.observeHistogram("mulegraph_batch_duration_seconds", 2.0);

  EXPECT_DOUBLE_EQ(metrics.counterValue("mulegraph_batches_total"), 3.0);
  EXPECT_DOUBLE_EQ(metrics.gaugeValue("mulegraph_feature_generation"), 7.0);
  EXPECT_EQ(metrics.histogramCount("mulegraph_batch_duration_seconds"), 2u);
  EXPECT_DOUBLE_EQ(metrics.counterValue("unknown"), 0.0);

  std::string text = metrics.exportMetrics();
  EXPECT_NE(text.find("# HELP mulegraph_batches_total Batch runs"), std::string::npos);
  EXPECT_NE(text.find("# TYPE mulegraph_batches_total counter"), std::string::npos);
  EXPECT_NE(text.find("mulegraph_feature_generation 7"), std::string::npos);
  EXPECT_NE(text.find("mulegraph_batch_duration_seconds_bucket{le=\"0.05\"} 1"),
            std::string::npos);
  EXPECT_NE(text.find("mulegraph_batch_duration_seconds_bucket{le=\"+Inf\"} 2"),
            std::string::npos);
  EXPECT_NE(text.find("mulegraph_batch_duration_seconds_count 2"), std::string::npos);

  metrics.reset();
  EXPECT_DOUBLE_EQ(metrics.counterValue("mulegraph_batches_total"), 0.0);
}

TEST(MetricsCollectorTest, TimerRecordsOnDestruction) {
  MetricsCollector metrics;
  {
    MetricsCollector::Timer timer(metrics, "stage_seconds");
    EXPECT_GE(timer.elapsedSeconds(), 0.0);
  }
  EXPECT_EQ(metrics.histogramCount("stage_seconds"), 1u);
}

TEST(ParallelExecutorTest, CoversEveryIndexOnce) {
  concurrent::ParallelExecutor executor(4, 10);
  std::vector<std::atomic<int>> hits(1000);
  for (auto& h : hits) h.store(0);

  executor.forEachRange(hits.size(), [&hits](std::size_t begin, std::size_t end) {
    for (std::size_t i = begin; i < end; ++i) hits[i].fetch_add(1);
  });

  for (const auto& h : hits) EXPECT_EQ(h.load(), 1);
}

TEST(ParallelExecutorTest, RethrowsWorkerException) {
  concurrent::ParallelExecutor executor(4, 1);
  EXPECT_THROW(executor.forEachRange(100,
                                     [](std::size_t begin, std::size_t) {
                                       if (begin > 0) throw std::runtime_error("worker failed");
                                     }),
               std::runtime_error);
}

TEST(ParallelExecutorTest, JoinsEveryWorkerBeforeRethrowing) {
  concurrent::ParallelExecutor executor(4, 1);
  std::atomic<int> finished{0};

  EXPECT_THROW(executor.forEachRange(4,
                                     [&finished](std::size_t begin, std::size_t) {
                                       if (begin == 0) throw std::runtime_error("first range");
                                       std::this_thread::sleep_for(std::chrono::milliseconds(20));
                                       finished.fetch_add(1);
                                     }),
               std::runtime_error);
  EXPECT_EQ(finished.load(), 3);
}

TEST(ParallelExecutorTest, EmptyRangeDoesNothing) {
  concurrent::ParallelExecutor executor;
  bool called = false;
  executor.forEachRange(0, [&called](std::size_t, std::size_t) { called = true; });
  EXPECT_FALSE(called);
}
