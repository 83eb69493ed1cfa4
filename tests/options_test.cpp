#include <gtest/gtest.h>
#include "options.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <regex>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace scan_notifier;
namespace fs = std::filesystem;

class OptionsTest : public ::testing::Test {
protected:
    fs::path configPath;

    void SetUp() override {
        configPath = fs::temp_directory_path() / ("scan_notifier_options_" + std::to_string(::getpid()) + ".json");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(configPath, ec);
    }

    void writeConfig(const std::string& content) {
        std::ofstream file(configPath);
        file << content;
    }
};

// Test default option values
TEST_F(OptionsTest, DefaultValues) {
    Options options;
    EXPECT_EQ(options.queueSize(), 10u);
    EXPECT_EQ(options.maxWorkers(), 1u);
    EXPECT_EQ(options.scanInterval(), std::chrono::seconds(1));
    EXPECT_EQ(options.excludePaths(), nullptr);
    EXPECT_EQ(options.includePaths(), nullptr);

    EXPECT_TRUE(options.ignoreNoChange());
    EXPECT_FALSE(options.ignoreErrors());
    EXPECT_FALSE(options.ignoreDelete());
    EXPECT_FALSE(options.ignoreCreate());
    EXPECT_FALSE(options.ignoreModify());
    EXPECT_FALSE(options.ignorePerm());
    EXPECT_FALSE(options.ignoreFile());
    EXPECT_FALSE(options.ignoreFolder());
    EXPECT_FALSE(options.ignoreSymlink());
    EXPECT_FALSE(options.ignoreFolderContent());
}

// Setters return the same object so they can be chained
TEST_F(OptionsTest, ChainedSetters) {
    auto options = Options::create();
    Options& result = options->setQueueSize(32)
                          .setMaxWorkers(4)
                          .setScanInterval(std::chrono::milliseconds(250))
                          .setIgnoreErrors(true)
                          .setIgnoreNoChangeEvent(false)
                          .setIgnoreDeleteEvent(true)
                          .setIgnoreCreateEvent(true)
                          .setIgnoreModifyEvent(true)
                          .setIgnorePermEvent(true)
                          .setIgnoreFileEvent(true)
                          .setIgnoreFolderEvent(true)
                          .setIgnoreSymlink(true)
                          .setIgnoreFolderContentEvent(true);

    EXPECT_EQ(&result, options.get());
    EXPECT_EQ(options->queueSize(), 32u);
    EXPECT_EQ(options->maxWorkers(), 4u);
    EXPECT_EQ(options->scanInterval(), std::chrono::milliseconds(250));
    EXPECT_TRUE(options->ignoreErrors());
    EXPECT_FALSE(options->ignoreNoChange());
    EXPECT_TRUE(options->ignoreDelete());
    EXPECT_TRUE(options->ignoreCreate());
    EXPECT_TRUE(options->ignoreModify());
    EXPECT_TRUE(options->ignorePerm());
    EXPECT_TRUE(options->ignoreFile());
    EXPECT_TRUE(options->ignoreFolder());
    EXPECT_TRUE(options->ignoreSymlink());
    EXPECT_TRUE(options->ignoreFolderContent());
}

TEST_F(OptionsTest, ZeroSizesAreIgnored) {
    Options options;
    options.setQueueSize(0).setMaxWorkers(0);
    EXPECT_EQ(options.queueSize(), Options::kDefaultQueueSize);
    EXPECT_EQ(options.maxWorkers(), Options::kDefaultMaxWorkers);
}

TEST_F(OptionsTest, PatternsAreSearchedInPath) {
    auto options = Options::withPatterns("\\.git/", "\\.txt$");
    ASSERT_NE(options->excludePaths(), nullptr);
    ASSERT_NE(options->includePaths(), nullptr);

    EXPECT_TRUE(options->excludePaths()->matches("/repo/.git/config"));
    EXPECT_FALSE(options->excludePaths()->matches("/repo/src/main.cpp"));
    EXPECT_TRUE(options->includePaths()->matches("/repo/notes.txt"));
    EXPECT_FALSE(options->includePaths()->matches("/repo/notes.txt.bak"));
}

TEST_F(OptionsTest, EmptyPatternMeansUnset) {
    auto options = Options::withPatterns("", "");
    EXPECT_EQ(options->excludePaths(), nullptr);
    EXPECT_EQ(options->includePaths(), nullptr);

    options->setExcludePaths("tmp");
    ASSERT_NE(options->excludePaths(), nullptr);
    options->setExcludePaths("");
    EXPECT_EQ(options->excludePaths(), nullptr);
}

TEST_F(OptionsTest, InvalidPatternThrows) {
    Options options;
    EXPECT_THROW(options.setIncludePaths("([unclosed"), std::regex_error);
    EXPECT_EQ(options.includePaths(), nullptr);
}

TEST_F(OptionsTest, LoadFromFile) {
    writeConfig(R"({
        "queue_size": 64,
        "max_workers": 3,
        "scan_interval_ms": 50,
        "exclude_paths": "node_modules",
        "ignore": { "no_change": false, "symlinks": true }
    })");

    auto options = Options::loadFile(configPath);
    EXPECT_EQ(options->queueSize(), 64u);
    EXPECT_EQ(options->maxWorkers(), 3u);
    EXPECT_EQ(options->scanInterval(), std::chrono::milliseconds(50));
    ASSERT_NE(options->excludePaths(), nullptr);
    EXPECT_EQ(options->excludePaths()->source, "node_modules");
    EXPECT_EQ(options->includePaths(), nullptr);
    EXPECT_FALSE(options->ignoreNoChange());
    EXPECT_TRUE(options->ignoreSymlink());
    // untouched keys keep defaults
    EXPECT_FALSE(options->ignoreDelete());
}

TEST_F(OptionsTest, LoadFileErrors) {
    EXPECT_THROW(Options::loadFile(configPath), std::runtime_error);

    writeConfig("{ not json");
    EXPECT_THROW(Options::loadFile(configPath), std::runtime_error);
}

TEST_F(OptionsTest, JsonRoundTripKeepsSettings) {
    auto options = Options::withPatterns("cache", "");
    options->setMaxWorkers(6).setIgnorePermEvent(true);

    auto copy = Options::fromJson(options->toJson());
    EXPECT_EQ(copy->maxWorkers(), 6u);
    EXPECT_TRUE(copy->ignorePerm());
    ASSERT_NE(copy->excludePaths(), nullptr);
    EXPECT_EQ(copy->excludePaths()->source, "cache");
    EXPECT_EQ(copy->includePaths(), nullptr);
}

// Writers and readers on different fields never block or tear each other
TEST_F(OptionsTest, ConcurrentUpdates) {
    auto options = Options::create();
    std::atomic<bool> done{false};
    std::atomic<int> badReads{0};

    std::vector<std::thread> threads;
    threads.emplace_back([&] {
        for (std::uint32_t i = 1; i <= 2000; ++i) {
            options->setMaxWorkers(i % 2 == 0 ? 2 : 8);
        }
    });
    threads.emplace_back([&] {
        for (int i = 0; i < 2000; ++i) {
            options->setExcludePaths(i % 2 == 0 ? "even" : "odd");
        }
    });
    threads.emplace_back([&] {
        for (int i = 0; i < 2000; ++i) {
            options->setIgnoreDeleteEvent(i % 2 == 0);
        }
    });
    std::thread reader([&] {
        while (!done) {
            auto workers = options->maxWorkers();
            if (workers != 1 && workers != 2 && workers != 8) {
                ++badReads;
            }
            auto pattern = options->excludePaths();
            if (pattern && pattern->source != "even" && pattern->source != "odd") {
                ++badReads;
            }
        }
    });

    for (auto& t : threads) {
        t.join();
    }
    done = true;
    reader.join();

    EXPECT_EQ(badReads, 0);
}
