#ifndef MULEGRAPH_OBSERVABILITY_METRICS_HPP_
#define MULEGRAPH_OBSERVABILITY_METRICS_HPP_

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace mulegraph {
namespace observability {

/**
 * Metrics collection for batch jobs and query serving.
 * Supports counters, gauges, and histograms with Prometheus-compatible output.
 */
class MetricsCollector {
 public:
  MetricsCollector() = default;
  ~MetricsCollector() = default;

  // Attach a HELP line to a metric of any type
  void describe(const std::string& name, const std::string& help);

  // Counter: monotonically increasing value
  void incrementCounter(const std::string& name, double value = 1.0);

  // Gauge: value that can go up and down
  void setGauge(const std::string& name, double value);

  // Histogram: distribution of values
  void observeHistogram(const std::string& name, double value);

  double counterValue(const std::string& name) const;
  double gaugeValue(const std::string& name) const;
  std::size_t histogramCount(const std::string& name) const;

  // Records the elapsed wall time in seconds into a histogram on destruction
  class Timer {
   public:
    Timer(MetricsCollector& collector, const std::string& name);
    ~Timer();

    Timer(const Timer&) = delete;
    Timer& operator=(const Timer&) = delete;

    double elapsedSeconds() const;

   private:
    MetricsCollector& collector_;
    std::string name_;
    std::chrono::steady_clock::time_point start_;
  };

  // Export metrics in Prometheus text format, sorted by metric name
  std::string exportMetrics() const;

  void reset();

 private:
  struct HistogramBucket {
    double upper_bound;
    std::size_t count{0};
  };

  struct Histogram {
    std::vector<HistogramBucket> buckets;
    std::size_t count{0};
    double sum{0.0};
  };

  std::string helpFor(const std::string& name, const std::string& fallback) const;

  mutable std::mutex mutex_;
  std::map<std::string, double> counters_;
  std::map<std::string, double> gauges_;
  std::map<std::string, Histogram> histograms_;
  std::map<std::string, std::string> help_;

  // Default histogram buckets (in seconds)
  static std::vector<double> defaultBuckets();
};

// Global metrics instance
MetricsCollector& getGlobalMetrics();

}  // namespace observability
}  // namespace mulegraph

#endif  // MULEGRAPH_OBSERVABILITY_METRICS_HPP_
