#include <gtest/gtest.h>
#include "utilities/metrics.h"

using chunkvault::MetricsRegistry;

/**
 * @brief Verify correct formatting of label strings in Prometheus format.
 */
TEST(MetricsRegistry, LabelsToString) {
    std::map<std::string,std::string> labels{{"k","v"},{"a","b"}};
    std::string formatted = MetricsRegistry::labelsToString(labels);
    // Map iteration is ordered, so "a" should come before "k".
    EXPECT_EQ(formatted, "{a=\"b\",k=\"v\"}");
    EXPECT_EQ(MetricsRegistry::labelsToString({}), "");
}

/**
 * @brief Validate gauge, counter and histogram reporting.
 */
TEST(MetricsRegistry, BasicRecording) {
    MetricsRegistry::instance().reset();
    MetricsRegistry::instance().setGauge("chunkvault_node_available_bytes", 2.5, {{"node","n1"}});
    MetricsRegistry::instance().incrementCounter("chunkvault_replica_writes_total", 3, {{"result","completed"}});
    MetricsRegistry::instance().observe("chunkvault_replica_write_seconds", 1.2);
    std::string metrics = MetricsRegistry::instance().toPrometheus();
    EXPECT_NE(metrics.find("# TYPE chunkvault_node_available_bytes gauge"), std::string::npos);
    EXPECT_NE(metrics.find("chunkvault_node_available_bytes{node=\"n1\"} 2.5"), std::string::npos);
    EXPECT_NE(metrics.find("# TYPE chunkvault_replica_writes_total counter"), std::string::npos);
    EXPECT_NE(metrics.find("chunkvault_replica_writes_total{result=\"completed\"} 3"), std::string::npos);
    EXPECT_NE(metrics.find("chunkvault_replica_write_seconds_sum 1.2"), std::string::npos);
    EXPECT_NE(metrics.find("chunkvault_replica_write_seconds_count 1"), std::string::npos);
    MetricsRegistry::instance().reset();
    EXPECT_TRUE(MetricsRegistry::instance().toPrometheus().empty());
}

TEST(MetricsRegistry, ValueLookup) {
    MetricsRegistry::instance().reset();
    EXPECT_EQ(MetricsRegistry::instance().counterValue("missing_total"), 0.0);
    MetricsRegistry::instance().incrementCounter("reads_total", 1, {{"result","ok"}});
    MetricsRegistry::instance().incrementCounter("reads_total", 2, {{"result","ok"}});
    MetricsRegistry::instance().incrementCounter("reads_total", 1, {{"result","IncompleteFile"}});
    EXPECT_EQ(MetricsRegistry::instance().counterValue("reads_total", {{"result","ok"}}), 3.0);
    EXPECT_EQ(MetricsRegistry::instance().counterValue("reads_total", {{"result","IncompleteFile"}}), 1.0);
    MetricsRegistry::instance().setGauge("corrupted", 4);
    MetricsRegistry::instance().setGauge("corrupted", 1);
    EXPECT_EQ(MetricsRegistry::instance().gaugeValue("corrupted"), 1.0);
    MetricsRegistry::instance().reset();
}
