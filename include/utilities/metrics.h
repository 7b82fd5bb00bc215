#pragma once
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace chunkvault {

using MetricLabels = std::map<std::string, std::string>;

/**
 * @brief Process-wide registry of gauges, counters and histograms that can be
 * rendered in Prometheus text exposition format.
 */
class MetricsRegistry {
public:
  /** Get singleton instance. */
  static MetricsRegistry &instance();

  /** Set gauge value with optional labels. */
  void setGauge(const std::string &name, double value,
                const MetricLabels &labels = {});

  /** Increment counter by value (default 1). */
  void incrementCounter(const std::string &name, double value = 1.0,
                        const MetricLabels &labels = {});

  /** Record observation for a histogram. */
  void observe(const std::string &name, double value,
               const MetricLabels &labels = {});

  /** Current value of a gauge, 0 if it was never set. */
  double gaugeValue(const std::string &name,
                    const MetricLabels &labels = {}) const;

  /** Current value of a counter, 0 if it was never incremented. */
  double counterValue(const std::string &name,
                      const MetricLabels &labels = {}) const;

  /** Serialize all metrics in Prometheus text format. */
  std::string toPrometheus() const;

  /** Clear all stored metrics. Used by unit tests. */
  void reset();

  /** Convert labels map to Prometheus label string. */
  static std::string labelsToString(const MetricLabels &labels);

private:
  MetricsRegistry() = default;
  struct Histogram {
    double sum{0};
    unsigned long count{0};
  };

  mutable std::mutex mtx_;
  std::unordered_map<std::string, double> gauges_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, Histogram> histograms_;
};

} // namespace chunkvault
