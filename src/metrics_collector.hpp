#ifndef SCAN_NOTIFIER_METRICS_COLLECTOR_HPP
#define SCAN_NOTIFIER_METRICS_COLLECTOR_HPP


#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>


namespace scan_notifier {

/// Buffers named, timestamped records until collect() prints them. When the buffer is
/// full the oldest record is dropped.
class MetricsCollector {
private:
    struct Metric {
        std::string name;
        std::string value;
        std::chrono::system_clock::time_point timestamp;
    };

    std::deque<Metric> m_metrics;
    mutable std::mutex m_metrics_mutex;
    std::size_t m_capacity;
    std::uint64_t m_dropped{0};

public:
    static constexpr std::size_t kDefaultCapacity = 4096;

    explicit MetricsCollector(std::size_t capacity = kDefaultCapacity);

    void recordMetric(const std::string& name, const std::string& value);

    /// @brief Print "name: value" lines to std::cout and clear the buffer
    void collect();

    void collect(std::ostream& out);

    /// @brief Buffered values recorded under name, oldest first
    std::vector<std::string> values(const std::string& name) const;

    std::size_t size() const;

    std::uint64_t dropped() const;
};

}  // namespace scan_notifier

#endif  // SCAN_NOTIFIER_METRICS_COLLECTOR_HPP
