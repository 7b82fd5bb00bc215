#include "utilities/metrics.h"

#include <set>
#include <sstream>

namespace chunkvault {

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry inst;
  return inst;
}

static std::string makeKey(const std::string &name,
                           const MetricLabels &labels) {
  return name + MetricsRegistry::labelsToString(labels);
}

static std::string baseName(const std::string &key) {
  return key.substr(0, key.find('{'));
}

static std::string labelPart(const std::string &key) {
  auto pos = key.find('{');
  return pos == std::string::npos ? "" : key.substr(pos);
}

void MetricsRegistry::setGauge(const std::string &name, double value,
                               const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_[makeKey(name, labels)] = value;
}

void MetricsRegistry::incrementCounter(const std::string &name, double value,
                                       const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  counters_[makeKey(name, labels)] += value;
}

void MetricsRegistry::observe(const std::string &name, double value,
                              const MetricLabels &labels) {
  std::lock_guard<std::mutex> lg(mtx_);
  auto &h = histograms_[makeKey(name, labels)];
  h.sum += value;
  h.count += 1;
}

double MetricsRegistry::gaugeValue(const std::string &name,
                                   const MetricLabels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = gauges_.find(makeKey(name, labels));
  return it == gauges_.end() ? 0.0 : it->second;
}

double MetricsRegistry::counterValue(const std::string &name,
                                     const MetricLabels &labels) const {
  std::lock_guard<std::mutex> lg(mtx_);
  auto it = counters_.find(makeKey(name, labels));
  return it == counters_.end() ? 0.0 : it->second;
}

std::string MetricsRegistry::labelsToString(const MetricLabels &labels) {
  if (labels.empty())
    return "";
  std::ostringstream oss;
  oss << '{';
  bool first = true;
  for (const auto &kv : labels) {
    if (!first)
      oss << ',';
    first = false;
    oss << kv.first << "=\"" << kv.second << "\"";
  }
  oss << '}';
  return oss.str();
}

std::string MetricsRegistry::toPrometheus() const {
  std::lock_guard<std::mutex> lg(mtx_);
  std::ostringstream oss;
  std::set<std::string> typed;
  auto emitType = [&](const std::string &name, const char *type) {
    if (typed.insert(name).second)
      oss << "# TYPE " << name << ' ' << type << '\n';
  };
  for (const auto &kv : gauges_) {
    emitType(baseName(kv.first), "gauge");
    oss << kv.first << ' ' << kv.second << '\n';
  }
  for (const auto &kv : counters_) {
    emitType(baseName(kv.first), "counter");
    oss << kv.first << ' ' << kv.second << '\n';
  }
  for (const auto &kv : histograms_) {
    std::string name = baseName(kv.first);
    std::string labels = labelPart(kv.first);
    emitType(name, "summary");
    oss << name << "_sum" << labels << ' ' << kv.second.sum << '\n';
    oss << name << "_count" << labels << ' ' << kv.second.count << '\n';
  }
  return oss.str();
}

void MetricsRegistry::reset() {
  std::lock_guard<std::mutex> lg(mtx_);
  gauges_.clear();
  counters_.clear();
  histograms_.clear();
}

} // namespace chunkvault
