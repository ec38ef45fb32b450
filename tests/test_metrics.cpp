#include <gtest/gtest.h>
#include "metrics.hpp"

using namespace redirector;

TEST(MetricsTest, Counter) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();

    reg.increment_counter("redirect_resolved_total", 1.0);
    reg.increment_counter("redirect_resolved_total", 2.5);
    EXPECT_EQ(reg.get_counter("redirect_resolved_total"), 3.5);

    std::string prometheus = reg.collect_prometheus();
    EXPECT_NE(prometheus.find("redirect_resolved_total 3.5"), std::string::npos);
    EXPECT_NE(prometheus.find("# TYPE redirect_resolved_total counter"), std::string::npos);
}

TEST(MetricsTest, UnknownCounterIsZero) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    EXPECT_EQ(reg.get_counter("cert_issued_total"), 0.0);
}

TEST(MetricsTest, Gauge) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    EXPECT_EQ(reg.get_gauge("active_connections"), 0.0);

    reg.increment_gauge("active_connections");
    reg.increment_gauge("active_connections");
    reg.increment_gauge("active_connections");
    EXPECT_EQ(reg.get_gauge("active_connections"), 3.0);

    reg.decrement_gauge("active_connections");
    EXPECT_EQ(reg.get_gauge("active_connections"), 2.0);

    std::string prometheus = reg.collect_prometheus();
    EXPECT_NE(prometheus.find("active_connections 2\n"), std::string::npos);
    EXPECT_NE(prometheus.find("# TYPE active_connections gauge"), std::string::npos);
}

TEST(MetricsTest, CountersListedBeforeGauges) {
    auto& reg = MetricsRegistry::instance();
    reg.reset();
    reg.increment_gauge("active_connections");
    reg.increment_counter("redirect_fallback_total");
    reg.increment_counter("cert_issued_total");

    std::string prometheus = reg.collect_prometheus();
    auto issued = prometheus.find("cert_issued_total 1");
    auto fallback = prometheus.find("redirect_fallback_total 1");
    auto active = prometheus.find("active_connections 1");
    ASSERT_NE(issued, std::string::npos);
    ASSERT_NE(fallback, std::string::npos);
    ASSERT_NE(active, std::string::npos);
    EXPECT_LT(issued, fallback);
    EXPECT_LT(fallback, active);
}
