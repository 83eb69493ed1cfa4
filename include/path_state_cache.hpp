#ifndef SCAN_NOTIFIER_PATH_STATE_CACHE_HPP
#define SCAN_NOTIFIER_PATH_STATE_CACHE_HPP

#include <sys/types.h>
#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace scan_notifier {

/// @brief Last observed state of a path
struct PathSnapshot {
    std::chrono::nanoseconds modifiedTime{0};
    mode_t mode{0};  // type and permission bits
    bool visited{false};  // seen during the current pass

    mode_t permissions() const { return mode & 07777; }
};

/// What a forEach visitor wants done with the entry it was handed
enum class VisitAction {
    Keep,
    Erase,
    Stop  // keep the entry and end the iteration
};

/// Concurrent map from absolute path to its snapshot. Keys are spread over
/// independently locked shards, so workers touching different paths rarely contend.
/// Operations on one path are linearizable; there is no ordering across paths.
class PathStateCache {
public:
    static constexpr std::size_t kDefaultShardCount = 16;

    explicit PathStateCache(std::size_t shardCount = kDefaultShardCount);
    PathStateCache(const PathStateCache&) = delete;
    PathStateCache& operator=(const PathStateCache&) = delete;

    std::optional<PathSnapshot> lookup(const std::string& path) const;

    void store(const std::string& path, const PathSnapshot& snapshot);

    /// @return true if the path was present
    bool erase(const std::string& path);

    /// @brief Atomically read-modify-write one path.
    /// fn receives the current snapshot (empty when absent). Whatever the slot holds
    /// when fn returns is written back; an emptied slot removes the entry.
    template <typename Fn>
    std::invoke_result_t<Fn&, std::optional<PathSnapshot>&> update(const std::string& path, Fn&& fn) {
        Shard& shard = shardFor(path);
        std::lock_guard lock(shard.mutex);

        std::optional<PathSnapshot> slot;
        auto it = shard.entries.find(path);
        if (it != shard.entries.end()) {
            slot = it->second;
        }

        auto writeBack = [&] {
            if (slot) {
                shard.entries.insert_or_assign(path, *slot);
            } else if (it != shard.entries.end()) {
                shard.entries.erase(it);
            }
        };

        if constexpr (std::is_void_v<std::invoke_result_t<Fn&, std::optional<PathSnapshot>&>>) {
            fn(slot);
            writeBack();
        } else {
            auto result = fn(slot);
            writeBack();
            return result;
        }
    }

    /// @brief Visit every entry, one shard at a time, while that shard is locked.
    /// The visitor may change the snapshot in place, ask for its removal, or stop.
    /// @return number of entries visited
    std::size_t forEach(const std::function<VisitAction(const std::string&, PathSnapshot&)>& visitor);

    void clear();

    std::size_t size() const;

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, PathSnapshot> entries;
    };

    Shard& shardFor(const std::string& path);
    const Shard& shardFor(const std::string& path) const;

    std::vector<Shard> m_shards;
};

}  // namespace scan_notifier

#endif  // SCAN_NOTIFIER_PATH_STATE_CACHE_HPP
