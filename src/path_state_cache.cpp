#include "path_state_cache.hpp"

namespace scan_notifier {

PathStateCache::PathStateCache(std::size_t shardCount) : m_shards(shardCount == 0 ? 1 : shardCount) {}

PathStateCache::Shard& PathStateCache::shardFor(const std::string& path) {
    return m_shards[std::hash<std::string>{}(path) % m_shards.size()];
}

const PathStateCache::Shard& PathStateCache::shardFor(const std::string& path) const {
    return m_shards[std::hash<std::string>{}(path) % m_shards.size()];
}

std::optional<PathSnapshot> PathStateCache::lookup(const std::string& path) const {
    const Shard& shard = shardFor(path);
    std::lock_guard lock(shard.mutex);
    auto it = shard.entries.find(path);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PathStateCache::store(const std::string& path, const PathSnapshot& snapshot) {
    Shard& shard = shardFor(path);
    std::lock_guard lock(shard.mutex);
    shard.entries.insert_or_assign(path, snapshot);
}

bool PathStateCache::erase(const std::string& path) {
    Shard& shard = shardFor(path);
    std::lock_guard lock(shard.mutex);
    return shard.entries.erase(path) > 0;
}

std::size_t PathStateCache::forEach(const std::function<VisitAction(const std::string&, PathSnapshot&)>& visitor) {
    std::size_t visited = 0;
    for (auto& shard : m_shards) {
        std::lock_guard lock(shard.mutex);
        for (auto it = shard.entries.begin(); it != shard.entries.end();) {
            ++visited;
            switch (visitor(it->first, it->second)) {
                case VisitAction::Keep:
                    ++it;
                    break;
                case VisitAction::Erase:
                    it = shard.entries.erase(it);
                    break;
                case VisitAction::Stop:
                    return visited;
            }
        }
    }
    return visited;
}

void PathStateCache::clear() {
    for (auto& shard : m_shards) {
        std::lock_guard lock(shard.mutex);
        shard.entries.clear();
    }
}

std::size_t PathStateCache::size() const {
    std::size_t total = 0;
    for (const auto& shard : m_shards) {
        std::lock_guard lock(shard.mutex);
        total += shard.entries.size();
    }
    return total;
}

}  // namespace scan_notifier
