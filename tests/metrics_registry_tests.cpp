#include <gtest/gtest.h>
#include "utilities/metrics.h"

/**
 * @brief Verify correct formatting of label strings in Prometheus format.
 */
TEST(MetricsRegistry, LabelsToString) {
    std::map<std::string,std::string> labels{{"stream","output"},{"a","b"}};
    std::string formatted = MetricsRegistry::labelsToString(labels);
    // Map iteration is ordered, so "a" should come before "stream".
    EXPECT_EQ(formatted, "{a=\"b\",stream=\"output\"}");
    EXPECT_EQ(MetricsRegistry::labelsToString({}), "");
}

/**
 * @brief Validate gauge and counter reporting.
 */
TEST(MetricsRegistry, BasicRecording) {
    MetricsRegistry::instance().reset();
    MetricsRegistry::instance().setGauge("vidseal_session_active", 1);
    MetricsRegistry::instance().incrementCounter("vidseal_frames_total", 3, {{"stream","input"}});
    MetricsRegistry::instance().incrementCounter("vidseal_comparisons_total", 1, {{"verdict","TAMPERED"}});
    std::string metrics = MetricsRegistry::instance().toPrometheus();
    EXPECT_NE(metrics.find("vidseal_session_active 1\n"), std::string::npos);
    EXPECT_NE(metrics.find("vidseal_frames_total{stream=\"input\"} 3\n"), std::string::npos);
    EXPECT_NE(metrics.find("vidseal_comparisons_total{verdict=\"TAMPERED\"} 1\n"), std::string::npos);
    MetricsRegistry::instance().reset();
    EXPECT_TRUE(MetricsRegistry::instance().toPrometheus().empty());
}

TEST(MetricsRegistry, CountersAccumulatePerLabelSet) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    reg.incrementCounter("vidseal_frames_total", 1, {{"stream","input"}});
    reg.incrementCounter("vidseal_frames_total", 1, {{"stream","input"}});
    reg.incrementCounter("vidseal_frames_total", 1, {{"stream","output"}});
    EXPECT_DOUBLE_EQ(reg.counterValue("vidseal_frames_total", {{"stream","input"}}), 2.0);
    EXPECT_DOUBLE_EQ(reg.counterValue("vidseal_frames_total", {{"stream","output"}}), 1.0);
    EXPECT_DOUBLE_EQ(reg.counterValue("vidseal_frames_total"), 0.0);
    EXPECT_DOUBLE_EQ(reg.gaugeValue("missing"), 0.0);
    reg.reset();
}
