#include "scan_notifier.hpp"

#include <sys/stat.h>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "change_classifier.hpp"
#include "directory_walker.hpp"
#include "metrics_collector.hpp"
#include "path_filter.hpp"
#include "sys/path_stat.hpp"
#include "worker_pool.hpp"

namespace fs = std::filesystem;

namespace scan_notifier {

namespace {

fs::path normalizeRoot(const fs::path& root) {
    std::error_code ec;
    fs::path absolute = fs::absolute(root, ec);
    if (ec) {
        return root.lexically_normal();
    }
    absolute = absolute.lexically_normal();
    // "/a/b/" and "/a/b" must name the same root
    if (!absolute.has_filename() && absolute != absolute.root_path()) {
        absolute = absolute.parent_path();
    }
    return absolute;
}

PathType pathTypeOfMode(mode_t mode) {
    if (S_ISDIR(mode)) {
        return PathType::DIRECTORY;
    }
    if (S_ISREG(mode)) {
        return PathType::FILE;
    }
    if (S_ISLNK(mode)) {
        return PathType::SYMLINK;
    }
    return PathType::UNSUPPORTED;
}

PathSnapshot snapshotOf(const sys::PathStat& st) {
    return PathSnapshot{st.modifiedTime(), st.mode(), false};
}

}  // namespace

ScanNotifier::ScanNotifier(const fs::path& root, std::shared_ptr<Options> options)
    : m_root(normalizeRoot(root)),
      m_options(options ? std::move(options) : Options::create()),
      m_cache(std::make_unique<PathStateCache>()),
      m_metrics(std::make_unique<MetricsCollector>()),
      m_pool(std::make_unique<WorkerPool>()),
      m_queueSize(m_options->queueSize()) {
    std::error_code ec;
    if (root.empty() || !fs::is_directory(m_root, ec)) {
        std::string detail = m_root.string();
        if (ec) {
            detail += ": " + ec.message();
        }
        throw std::system_error(make_error_code(ErrorCode::InvalidRootDirPath), detail);
    }

    m_filter = std::make_unique<PathFilter>(m_root, m_options);
    m_classifier = std::make_unique<ChangeClassifier>(*m_cache, m_options);

    seed();

    openQueues();
    m_ready = true;
}

ScanNotifier::~ScanNotifier() {
    m_stopSource.request_stop();
    m_pool->wait();
}

// Load every accepted path with visited=false so the first pass only reports changes
void ScanNotifier::seed() {
    std::error_code error = walkDirectory(m_root, [this](const fs::path& path, PathType type,
                                                         const std::error_code& ec) {
        if (ec) {
            return WalkAction::Abort;
        }

        FilterDecision decision = m_filter->classify(path, type);
        if (reportsNode(decision)) {
            try {
                m_cache->store(path.string(), snapshotOf(sys::PathStat::lstat(path.string())));
            } catch (const std::system_error& e) {
                // gone since it was listed, the next pass decides what it is
                m_metrics->recordMetric("walk_error", e.what());
            }
        }
        return descends(decision) ? WalkAction::Continue : WalkAction::SkipSubtree;
    });

    if (error) {
        throw std::system_error(make_error_code(ErrorCode::Initialization),
                                m_root.string() + ": " + error.message());
    }
}

void ScanNotifier::openQueues() {
    m_intake = std::make_shared<BoundedQueue<RawEntry>>(m_queueSize);
    m_events = std::make_shared<BoundedQueue<Event>>(m_queueSize);
}

EventReceiver ScanNotifier::queue() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return EventReceiver(m_events);
}

std::error_code ScanNotifier::start(std::stop_token token) {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_running) {
            return ErrorCode::ScanAlreadyStarted;
        }
        if (m_stopping) {
            return ErrorCode::ScanIsStopping;
        }
        if (!m_ready) {
            return ErrorCode::ScanIsNotReady;
        }
        // a previous run closed its queues and consumed its stop signal
        if (m_events->closed()) {
            openQueues();
            m_stopSource = std::stop_source();
        }
        m_running = true;
    }

    m_metrics->recordMetric("notifier", "started");
    std::error_code result;
    {
        // caller cancellation is folded into our own stop signal
        std::stop_callback onCancel(token, [this] { m_stopSource.request_stop(); });
        try {
            scanLoop();
        } catch (const std::exception& e) {
            m_metrics->recordMetric("internal_error", e.what());
            result = ErrorCode::InternalError;
        }
    }
    finalize();
    return result;
}

std::error_code ScanNotifier::stop() {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (m_stopping) {
        return ErrorCode::ScanIsStopping;
    }
    if (!m_running) {
        return ErrorCode::ScanIsNotRunning;
    }
    m_stopping = true;
    m_stopSource.request_stop();
    return {};
}

std::error_code ScanNotifier::pause() {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (m_stopping) {
        return ErrorCode::ScanIsStopping;
    }
    if (!m_running) {
        return ErrorCode::ScanIsNotRunning;
    }
    m_paused = true;
    return {};
}

std::error_code ScanNotifier::resume() {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    if (m_stopping) {
        return ErrorCode::ScanIsStopping;
    }
    m_paused = false;
    return {};
}

void ScanNotifier::flush() {
    m_cache->clear();
}

// Runs on the thread that called start(). Cancellation is only honoured between passes.
void ScanNotifier::scanLoop() {
    std::stop_token stopToken = m_stopSource.get_token();
    while (!stopToken.stop_requested()) {
        if (m_paused) {
            sleepInterval();
            continue;
        }
        runPass();
        sleepInterval();
    }
}

void ScanNotifier::runPass() {
    auto startTime = std::chrono::steady_clock::now();
    m_passEvents = 0;
    std::uint64_t walked = 0;

    m_intake->restart();
    m_pool->spawn(m_options->maxWorkers(), [this] { consume(); });

    std::error_code error = walkDirectory(m_root, [this, &walked](const fs::path& path, PathType type,
                                                                  const std::error_code& ec) {
        if (ec) {
            m_metrics->recordMetric("walk_error", path.string() + ": " + ec.message());
        }

        FilterDecision decision = filterEntry(path, type, ec);
        if (reportsNode(decision)) {
            ++walked;
            if (!m_intake->push(RawEntry{path.string(), type, ec})) {
                return WalkAction::Abort;
            }
        }
        return descends(decision) ? WalkAction::Continue : WalkAction::SkipSubtree;
    });
    if (error) {
        m_metrics->recordMetric("pass_error", m_root.string() + ": " + error.message());
    }

    // drain barrier: nothing may classify while the sweep runs
    m_intake->finish();
    m_pool->wait();

    sweepMissingPaths();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTime);
    std::uint64_t pass = ++m_passes;
    m_metrics->recordMetric("pass", "#" + std::to_string(pass) + ": " + std::to_string(walked) + " entries, " +
                                        std::to_string(m_passEvents.load()) + " events, " +
                                        std::to_string(elapsed.count()) + " ms");
}

void ScanNotifier::consume() {
    while (auto entry = m_intake->pop()) {
        try {
            processEntry(*entry);
        } catch (const std::exception& e) {
            m_metrics->recordMetric("internal_error", entry->path + ": " + e.what());
            if (!m_options->ignoreErrors()) {
                queueEvent(Event::failure(entry->path, entry->type, make_error_code(ErrorCode::InternalError), e.what()));
            }
        }
    }
}

void ScanNotifier::processEntry(const RawEntry& entry) {
    // options may have changed since the entry was queued
    if (!reportsNode(filterEntry(entry.path, entry.type, entry.error))) {
        return;
    }

    if (entry.error) {
        if (auto event = m_classifier->classifyFailure(entry.path, entry.type, entry.error, entry.error.message())) {
            queueEvent(std::move(*event));
        }
        return;
    }

    PathSnapshot observed;
    try {
        observed = snapshotOf(sys::PathStat::lstat(entry.path));
    } catch (const std::system_error& e) {
        if (auto event = m_classifier->classifyFailure(entry.path, entry.type, e.code(), e.what())) {
            queueEvent(std::move(*event));
        }
        return;
    }

    for (auto& event : m_classifier->classify(entry.path, entry.type, observed)) {
        queueEvent(std::move(event));
    }
}

// An entry that could not be typed is still reported when it fails
FilterDecision ScanNotifier::filterEntry(const fs::path& path, PathType type, const std::error_code& error) const {
    if (error && type == PathType::UNSUPPORTED) {
        return m_filter->classifyFailure(path);
    }
    return m_filter->classify(path, type);
}

// Evict what was not seen during the pass and reset the visited mark of the rest.
// Eviction happens even when DELETE events are suppressed.
void ScanNotifier::sweepMissingPaths() {
    std::stop_token stopToken = m_stopSource.get_token();
    std::vector<Event> deleted;

    m_cache->forEach([&](const std::string& path, PathSnapshot& snapshot) {
        if (!m_running || stopToken.stop_requested()) {
            return VisitAction::Stop;
        }
        if (snapshot.visited) {
            snapshot.visited = false;
            return VisitAction::Keep;
        }
        if (!m_options->ignoreDelete()) {
            deleted.emplace_back(path, pathTypeOfMode(snapshot.mode), EventKind::DELETE);
        }
        return VisitAction::Erase;
    });

    // emitted outside the cache locks, a slow consumer must not block flush()
    for (auto& event : deleted) {
        queueEvent(std::move(event));
    }
}

void ScanNotifier::sleepInterval() {
    std::unique_lock<std::mutex> lock(m_sleepMutex);
    m_sleepCondition.wait_for(lock, m_stopSource.get_token(), m_options->scanInterval(), [] { return false; });
}

void ScanNotifier::finalize() {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_stopping = true;
    }

    m_intake->close();
    m_events->close();
    m_pool->wait();
    m_cache->clear();
    m_metrics->recordMetric("notifier", "stopped");

    // back to ready
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_paused = false;
        m_running = false;
        m_stopping = false;
    }
}

bool ScanNotifier::queueEvent(Event event) {
    if (!m_running) {
        return false;
    }

    std::string path = event.path;
    if (!m_events->push(std::move(event), m_stopSource.get_token())) {
        m_metrics->recordMetric("dropped_event", path);
        return false;
    }
    ++m_passEvents;
    return true;
}

}  // namespace scan_notifier
