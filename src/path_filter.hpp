#ifndef SCAN_NOTIFIER_PATH_FILTER_HPP
#define SCAN_NOTIFIER_PATH_FILTER_HPP

#include <filesystem>
#include <memory>
#include <string>

#include "event.hpp"
#include "options.hpp"

namespace scan_notifier {

enum class FilterDecision {
    Accept,          // report and descend
    AcceptNodeOnly,  // report the directory, skip what is below it
    Skip,            // do not report, still descend
    SkipSubtree      // report neither the directory nor what is below it
};

inline bool reportsNode(FilterDecision decision) {
    return decision == FilterDecision::Accept || decision == FilterDecision::AcceptNodeOnly;
}

inline bool descends(FilterDecision decision) {
    return decision == FilterDecision::Accept || decision == FilterDecision::Skip;
}

/// Decides whether a walked path is reported. Options are read on every call, so the
/// same path and type always get the same answer under the same options.
class PathFilter {
public:
    PathFilter(std::filesystem::path root, std::shared_ptr<const Options> options);

    FilterDecision classify(const std::filesystem::path& path, PathType type) const;

    /// @brief Decision for a path that could not be read. Its type is unknown, so only
    /// the root and pattern rules apply. Never descends.
    FilterDecision classifyFailure(const std::filesystem::path& path) const;

private:
    bool rejectedByPatterns(const std::string& path) const;

    std::filesystem::path m_root;
    std::shared_ptr<const Options> m_options;
};

}  // namespace scan_notifier

#endif  // SCAN_NOTIFIER_PATH_FILTER_HPP
