#ifndef SCAN_NOTIFIER_OPTIONS_HPP
#define SCAN_NOTIFIER_OPTIONS_HPP

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <regex>
#include <string>

#include <json/json.h>

namespace scan_notifier {

/// A compiled path expression together with its source text
struct PathPattern {
    explicit PathPattern(const std::string& expression)
        : source(expression), regex(expression, std::regex::ECMAScript | std::regex::optimize) {}

    bool matches(const std::string& path) const { return std::regex_search(path, regex); }

    std::string source;
    std::regex regex;
};

/// Settings shared between the caller and a running scanner. Every field is an
/// independent atomic cell, so setters may be called from any thread at any time
/// and readers always see the latest value.
class Options {
public:
    static constexpr std::size_t kDefaultQueueSize = 10;
    static constexpr std::uint32_t kDefaultMaxWorkers = 1;
    static constexpr std::chrono::milliseconds kDefaultScanInterval{1000};

    Options();
    Options(const Options&) = delete;
    Options& operator=(const Options&) = delete;
    Options(Options&&) = delete;
    Options& operator=(Options&&) = delete;

    static std::shared_ptr<Options> create();

    /// @brief Build options from exclude and include expressions. An empty expression means unset.
    /// @throws std::regex_error if an expression does not compile
    static std::shared_ptr<Options> withPatterns(const std::string& exclude, const std::string& include);

    /// @brief Build options from a JSON object, missing keys keep their defaults
    static std::shared_ptr<Options> fromJson(const Json::Value& json);

    /// @brief Read a JSON options file
    /// @throws std::runtime_error if the file cannot be opened or parsed
    static std::shared_ptr<Options> loadFile(const std::filesystem::path& path);

    Json::Value toJson() const;

    /// Zero is ignored. Only read when a scanner is constructed.
    Options& setQueueSize(std::size_t value);
    /// Zero is ignored. Takes effect on the next pass.
    Options& setMaxWorkers(std::uint32_t value);
    Options& setScanInterval(std::chrono::milliseconds value);
    Options& setExcludePaths(const std::string& expression);
    Options& setIncludePaths(const std::string& expression);

    Options& setIgnoreErrors(bool value);
    Options& setIgnoreNoChangeEvent(bool value);
    Options& setIgnoreDeleteEvent(bool value);
    Options& setIgnoreCreateEvent(bool value);
    Options& setIgnoreModifyEvent(bool value);
    Options& setIgnorePermEvent(bool value);
    Options& setIgnoreFileEvent(bool value);
    Options& setIgnoreFolderEvent(bool value);
    Options& setIgnoreSymlink(bool value);
    Options& setIgnoreFolderContentEvent(bool value);

    std::size_t queueSize() const { return m_queueSize.load(); }
    std::uint32_t maxWorkers() const { return m_maxWorkers.load(); }
    std::chrono::milliseconds scanInterval() const { return std::chrono::milliseconds(m_scanIntervalMs.load()); }
    std::shared_ptr<const PathPattern> excludePaths() const { return m_excludePaths.load(); }
    std::shared_ptr<const PathPattern> includePaths() const { return m_includePaths.load(); }

    bool ignoreErrors() const { return m_ignoreErrors.load(); }
    bool ignoreNoChange() const { return m_ignoreNoChange.load(); }
    bool ignoreDelete() const { return m_ignoreDelete.load(); }
    bool ignoreCreate() const { return m_ignoreCreate.load(); }
    bool ignoreModify() const { return m_ignoreModify.load(); }
    bool ignorePerm() const { return m_ignorePerm.load(); }
    bool ignoreFile() const { return m_ignoreFile.load(); }
    bool ignoreFolder() const { return m_ignoreFolder.load(); }
    bool ignoreSymlink() const { return m_ignoreSymlink.load(); }
    bool ignoreFolderContent() const { return m_ignoreFolderContent.load(); }

private:
    std::atomic<std::size_t> m_queueSize{kDefaultQueueSize};
    std::atomic<std::uint32_t> m_maxWorkers{kDefaultMaxWorkers};
    std::atomic<std::chrono::milliseconds::rep> m_scanIntervalMs{kDefaultScanInterval.count()};
    std::atomic<std::shared_ptr<const PathPattern>> m_excludePaths;
    std::atomic<std::shared_ptr<const PathPattern>> m_includePaths;

    std::atomic<bool> m_ignoreErrors{false};
    std::atomic<bool> m_ignoreNoChange{true};  // NOCHANGE is opt-in
    std::atomic<bool> m_ignoreDelete{false};
    std::atomic<bool> m_ignoreCreate{false};
    std::atomic<bool> m_ignoreModify{false};
    std::atomic<bool> m_ignorePerm{false};
    std::atomic<bool> m_ignoreFile{false};
    std::atomic<bool> m_ignoreFolder{false};
    std::atomic<bool> m_ignoreSymlink{false};
    std::atomic<bool> m_ignoreFolderContent{false};
};

}  // namespace scan_notifier

#endif  // SCAN_NOTIFIER_OPTIONS_HPP
