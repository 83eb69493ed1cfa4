#ifndef SCAN_NOTIFIER_SCAN_NOTIFIER_HPP
#define SCAN_NOTIFIER_SCAN_NOTIFIER_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>

#include "bounded_queue.hpp"
#include "errors.hpp"
#include "event.hpp"
#include "event_receiver.hpp"
#include "options.hpp"
#include "path_state_cache.hpp"

namespace scan_notifier {

class ChangeClassifier;
class MetricsCollector;
class PathFilter;
enum class FilterDecision;
class WorkerPool;

/// Periodically walks a directory tree and reports what changed since the previous pass
/// (created, deleted, modified, permission changes) on an event queue.
///
/// Lifecycle: constructed (ready) -> start() (running) <-> pause()/resume() -> stop() or
/// cancellation (stopping) -> torn down and ready again. Teardown closes the event queue
/// and forgets every snapshot, so a restarted notifier reports the whole tree as created
/// on its first pass.
class ScanNotifier {
public:
    /// A single walked entry on its way to the workers
    struct RawEntry {
        std::string path;
        PathType type{PathType::UNSUPPORTED};
        std::error_code error;
    };

    /// @brief Seed the cache with the current content of root.
    /// @param options shared settings, null means defaults
    /// @throws std::system_error with ErrorCode::InvalidRootDirPath if root is not an
    /// accessible directory, or ErrorCode::Initialization if the seeding walk fails
    ScanNotifier(const std::filesystem::path& root, std::shared_ptr<Options> options = nullptr);
    ~ScanNotifier();
    ScanNotifier(const ScanNotifier&) = delete;
    ScanNotifier& operator=(const ScanNotifier&) = delete;
    ScanNotifier(ScanNotifier&&) = delete;
    ScanNotifier& operator=(ScanNotifier&&) = delete;

    /// @brief Run the scan loop on the calling thread until stop() or until token is stopped.
    /// A start after a teardown opens a new event queue; receivers taken before it stay closed.
    std::error_code start(std::stop_token token = {});

    /// @brief Ask the scan loop to exit once its current pass has drained. Does not block.
    std::error_code stop();

    /// @brief Skip passes until resume()
    std::error_code pause();

    std::error_code resume();

    /// @brief Forget every cached snapshot. Every tracked path is reported as CREATE on
    /// the next pass, and paths that vanished meanwhile are never reported as DELETE.
    void flush();

    bool isRunning() const { return m_running.load(); }
    bool isPaused() const { return m_paused.load(); }

    /// @brief Receiver for the current event stream
    EventReceiver queue() const;

    const std::filesystem::path& root() const { return m_root; }

    Options& options() { return *m_options; }

    std::optional<PathSnapshot> snapshot(const std::string& path) const { return m_cache->lookup(path); }

    std::size_t trackedPaths() const { return m_cache->size(); }

    std::uint64_t completedPasses() const { return m_passes.load(); }

    MetricsCollector& metrics() { return *m_metrics; }

private:
    std::filesystem::path m_root;
    std::shared_ptr<Options> m_options;
    std::unique_ptr<PathStateCache> m_cache;
    std::unique_ptr<PathFilter> m_filter;
    std::unique_ptr<ChangeClassifier> m_classifier;
    std::unique_ptr<MetricsCollector> m_metrics;
    std::unique_ptr<WorkerPool> m_pool;

    std::size_t m_queueSize;
    std::shared_ptr<BoundedQueue<RawEntry>> m_intake;
    std::shared_ptr<BoundedQueue<Event>> m_events;

    // replaced on each restart, a stop_source cannot be reset
    std::stop_source m_stopSource;
    mutable std::mutex m_stateMutex;  // serializes lifecycle transitions
    std::mutex m_sleepMutex;
    std::condition_variable_any m_sleepCondition;

    std::atomic<bool> m_ready{false};
    std::atomic<bool> m_running{false};
    std::atomic<bool> m_stopping{false};
    std::atomic<bool> m_paused{false};

    std::atomic<std::uint64_t> m_passes{0};
    std::atomic<std::uint64_t> m_passEvents{0};

    void seed();
    void openQueues();
    FilterDecision filterEntry(const std::filesystem::path& path, PathType type, const std::error_code& error) const;
    void scanLoop();
    void runPass();
    void sweepMissingPaths();
    void sleepInterval();
    void finalize();

    // Worker thread function draining the intake queue for one pass
    void consume();
    void processEntry(const RawEntry& entry);

    bool queueEvent(Event event);
};

}  // namespace scan_notifier

#endif  // SCAN_NOTIFIER_SCAN_NOTIFIER_HPP
