#include <gtest/gtest.h>
#include "metrics_collector.hpp"
#include <iostream>
#include <sstream>
#include <thread>
#include <vector>

using namespace scan_notifier;

class MetricsCollectorTest : public ::testing::Test {
protected:
    // Redirect std::cout to our stringstream
    std::streambuf* originalBuffer;
    std::stringstream capturedOutput;

    void SetUp() override {
        originalBuffer = std::cout.rdbuf();
        std::cout.rdbuf(capturedOutput.rdbuf());
    }

    void TearDown() override {
        std::cout.rdbuf(originalBuffer);
    }

    static int countLines(const std::string& output) {
        int lineCount = 0;
        std::istringstream iss(output);
        std::string line;
        while (std::getline(iss, line)) {
            if (!line.empty()) {
                lineCount++;
            }
        }
        return lineCount;
    }
};

// Test that metrics can be recorded and printed
TEST_F(MetricsCollectorTest, RecordMetric) {
    MetricsCollector collector;
    collector.recordMetric("pass", "#1: 3 entries");

    capturedOutput.str("");
    collector.collect();

    std::string output = capturedOutput.str();
    EXPECT_NE(output.find("pass: #1: 3 entries"), std::string::npos);
}

// Test that collect clears metrics after outputting them
TEST_F(MetricsCollectorTest, CollectClearsMetrics) {
    MetricsCollector collector;
    collector.recordMetric("notifier", "started");

    capturedOutput.str("");
    collector.collect();
    std::string firstOutput = capturedOutput.str();

    capturedOutput.str("");
    collector.collect();
    std::string secondOutput = capturedOutput.str();

    EXPECT_NE(firstOutput.find("notifier: started"), std::string::npos);
    EXPECT_TRUE(secondOutput.empty());
    EXPECT_EQ(collector.size(), 0u);
}

TEST_F(MetricsCollectorTest, CollectToStream) {
    MetricsCollector collector;
    collector.recordMetric("walk_error", "/tmp/x: Permission denied");
    collector.recordMetric("pass", "#1");

    std::ostringstream out;
    collector.collect(out);

    EXPECT_EQ(out.str(), "walk_error: /tmp/x: Permission denied\npass: #1\n");
    EXPECT_TRUE(capturedOutput.str().empty());
}

// values() filters by name and keeps recording order
TEST_F(MetricsCollectorTest, ValuesByName) {
    MetricsCollector collector;
    collector.recordMetric("pass", "#1");
    collector.recordMetric("dropped_event", "/a");
    collector.recordMetric("pass", "#2");

    EXPECT_EQ(collector.values("pass"), (std::vector<std::string>{"#1", "#2"}));
    EXPECT_EQ(collector.values("dropped_event"), (std::vector<std::string>{"/a"}));
    EXPECT_TRUE(collector.values("internal_error").empty());
    // values() does not consume the buffer
    EXPECT_EQ(collector.size(), 3u);
}

// The oldest records are dropped once the buffer is full
TEST_F(MetricsCollectorTest, BoundedBuffer) {
    MetricsCollector collector(3);
    for (int i = 0; i < 5; ++i) {
        collector.recordMetric("pass", std::to_string(i));
    }

    EXPECT_EQ(collector.size(), 3u);
    EXPECT_EQ(collector.dropped(), 2u);
    EXPECT_EQ(collector.values("pass"), (std::vector<std::string>{"2", "3", "4"}));
}

// Test thread safety with concurrent recordMetric calls
TEST_F(MetricsCollectorTest, ConcurrentRecording) {
    MetricsCollector collector;
    const int numThreads = 10;
    const int metricsPerThread = 100;

    std::vector<std::thread> threads;
    for (int i = 0; i < numThreads; ++i) {
        threads.emplace_back([&collector, i, metricsPerThread]() {
            for (int j = 0; j < metricsPerThread; ++j) {
                std::string metricName = "thread" + std::to_string(i) + "_metric" + std::to_string(j);
                collector.recordMetric(metricName, "value" + std::to_string(j));
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    capturedOutput.str("");
    collector.collect();

    EXPECT_EQ(countLines(capturedOutput.str()), numThreads * metricsPerThread);
    EXPECT_EQ(collector.dropped(), 0u);
}
