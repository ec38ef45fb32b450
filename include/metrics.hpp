#pragma once

#include <map>
#include <mutex>
#include <sstream>
#include <string>

namespace redirector {

// Process-wide counters and gauges behind GET /metrics and /healthz.
// Names follow Prometheus conventions: counters end in _total.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return it != counters_.end() ? it->second : 0.0;
    }

    // active_connections is the only gauge; it moves with accept and close.
    void increment_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] += value;
    }

    void decrement_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] -= value;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        return it != gauges_.end() ? it->second : 0.0;
    }

    // Tests only.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

    // Text exposition format 0.0.4, sorted by name.
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::ostringstream out;
        write_family(out, counters_, "counter");
        write_family(out, gauges_, "gauge");
        return out.str();
    }

private:
    MetricsRegistry() = default;

    static void write_family(std::ostringstream& out, const std::map<std::string, double>& values,
                             const char* type) {
        for (const auto& [name, value] : values) {
            out << "# TYPE " << name << ' ' << type << '\n' << name << ' ' << value << '\n';
        }
    }

    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    std::mutex mutex_;
};

} // namespace redirector
