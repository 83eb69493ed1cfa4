#include <gtest/gtest.h>
#include "path_state_cache.hpp"
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace scan_notifier;

class PathStateCacheTest : public ::testing::Test {
protected:
    PathStateCache cache;

    static PathSnapshot snapshot(long mtime, mode_t mode = 0100644, bool visited = false) {
        return PathSnapshot{std::chrono::nanoseconds(mtime), mode, visited};
    }
};

TEST_F(PathStateCacheTest, StoreLookupErase) {
    EXPECT_FALSE(cache.lookup("/a").has_value());

    cache.store("/a", snapshot(1));
    auto found = cache.lookup("/a");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->modifiedTime.count(), 1);
    EXPECT_EQ(found->permissions(), 0644u);
    EXPECT_EQ(cache.size(), 1u);

    cache.store("/a", snapshot(2));
    EXPECT_EQ(cache.lookup("/a")->modifiedTime.count(), 2);
    EXPECT_EQ(cache.size(), 1u);

    EXPECT_TRUE(cache.erase("/a"));
    EXPECT_FALSE(cache.erase("/a"));
    EXPECT_EQ(cache.size(), 0u);
}

// update() sees the current value and writes back what the slot holds afterwards
TEST_F(PathStateCacheTest, UpdateReadModifyWrite) {
    bool wasPresent = cache.update("/a", [](std::optional<PathSnapshot>& slot) {
        bool present = slot.has_value();
        slot = PathSnapshot{std::chrono::nanoseconds(5), 0100600, true};
        return present;
    });
    EXPECT_FALSE(wasPresent);
    ASSERT_TRUE(cache.lookup("/a").has_value());
    EXPECT_TRUE(cache.lookup("/a")->visited);

    cache.update("/a", [](std::optional<PathSnapshot>& slot) {
        ASSERT_TRUE(slot.has_value());
        slot->visited = false;
    });
    EXPECT_FALSE(cache.lookup("/a")->visited);

    // emptying the slot removes the entry
    cache.update("/a", [](std::optional<PathSnapshot>& slot) { slot.reset(); });
    EXPECT_FALSE(cache.lookup("/a").has_value());

    // an absent path left empty stays absent
    cache.update("/b", [](std::optional<PathSnapshot>&) {});
    EXPECT_EQ(cache.size(), 0u);
}

// A throwing update leaves the entry as it was
TEST_F(PathStateCacheTest, ThrowingUpdateDoesNotWrite) {
    cache.store("/a", snapshot(1));
    EXPECT_THROW(cache.update("/a",
                              [](std::optional<PathSnapshot>& slot) {
                                  slot->modifiedTime = std::chrono::nanoseconds(99);
                                  throw std::runtime_error("boom");
                              }),
                 std::runtime_error);
    EXPECT_EQ(cache.lookup("/a")->modifiedTime.count(), 1);
}

TEST_F(PathStateCacheTest, ForEachKeepAndErase) {
    for (int i = 0; i < 20; ++i) {
        cache.store("/p" + std::to_string(i), snapshot(i, 0100644, i % 2 == 0));
    }

    std::set<std::string> erased;
    std::size_t visited = cache.forEach([&](const std::string& path, PathSnapshot& entry) {
        if (entry.visited) {
            entry.visited = false;
            return VisitAction::Keep;
        }
        erased.insert(path);
        return VisitAction::Erase;
    });

    EXPECT_EQ(visited, 20u);
    EXPECT_EQ(erased.size(), 10u);
    EXPECT_EQ(cache.size(), 10u);
    for (int i = 0; i < 20; i += 2) {
        auto entry = cache.lookup("/p" + std::to_string(i));
        ASSERT_TRUE(entry.has_value());
        EXPECT_FALSE(entry->visited);
    }
}

TEST_F(PathStateCacheTest, ForEachStop) {
    for (int i = 0; i < 20; ++i) {
        cache.store("/p" + std::to_string(i), snapshot(i));
    }

    std::size_t visited = cache.forEach([](const std::string&, PathSnapshot&) { return VisitAction::Stop; });

    EXPECT_EQ(visited, 1u);
    EXPECT_EQ(cache.size(), 20u);
}

TEST_F(PathStateCacheTest, Clear) {
    cache.store("/a", snapshot(1));
    cache.store("/b", snapshot(2));
    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
    EXPECT_FALSE(cache.lookup("/a").has_value());
}

TEST_F(PathStateCacheTest, SingleShard) {
    PathStateCache single(0);
    single.store("/a", snapshot(1));
    single.store("/b", snapshot(2));
    EXPECT_EQ(single.size(), 2u);
}

// Writers on disjoint paths never lose each other's entries
TEST_F(PathStateCacheTest, ConcurrentDisjointStores) {
    const int numThreads = 8;
    const int pathsPerThread = 500;

    std::vector<std::thread> threads;
    for (int t = 0; t < numThreads; ++t) {
        threads.emplace_back([this, t, pathsPerThread] {
            for (int i = 0; i < pathsPerThread; ++i) {
                std::string path = "/t" + std::to_string(t) + "/" + std::to_string(i);
                cache.update(path, [i](std::optional<PathSnapshot>& slot) {
                    slot = PathSnapshot{std::chrono::nanoseconds(i), 0100644, true};
                });
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(cache.size(), static_cast<std::size_t>(numThreads * pathsPerThread));
}
