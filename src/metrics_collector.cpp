#include "metrics_collector.hpp"

#include <iostream>

namespace scan_notifier {

MetricsCollector::MetricsCollector(std::size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

auto MetricsCollector::recordMetric(const std::string &name, const std::string &value) -> void {
    std::lock_guard lock(m_metrics_mutex);
    if (m_metrics.size() >= m_capacity) {
        m_metrics.pop_front();
        ++m_dropped;
    }
    m_metrics.push_back({name, value, std::chrono::system_clock::now()});
}

auto MetricsCollector::collect() -> void {
    collect(std::cout);
}

auto MetricsCollector::collect(std::ostream &out) -> void {
    std::lock_guard lock(m_metrics_mutex);
    for (const auto &metric : m_metrics) {
        out << metric.name << ": " << metric.value << std::endl;
    }
    m_metrics.clear();
}

auto MetricsCollector::values(const std::string &name) const -> std::vector<std::string> {
    std::lock_guard lock(m_metrics_mutex);
    std::vector<std::string> result;
    for (const auto &metric : m_metrics) {
        if (metric.name == name) {
            result.push_back(metric.value);
        }
    }
    return result;
}

auto MetricsCollector::size() const -> std::size_t {
    std::lock_guard lock(m_metrics_mutex);
    return m_metrics.size();
}

auto MetricsCollector::dropped() const -> std::uint64_t {
    std::lock_guard lock(m_metrics_mutex);
    return m_dropped;
}

}  // namespace scan_notifier
