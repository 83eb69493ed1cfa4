#include "path_filter.hpp"

namespace scan_notifier {

PathFilter::PathFilter(std::filesystem::path root, std::shared_ptr<const Options> options)
    : m_root(std::move(root)), m_options(std::move(options)) {}

FilterDecision PathFilter::classify(const std::filesystem::path& path, PathType type) const {
    if (type == PathType::UNSUPPORTED) {
        return FilterDecision::Skip;
    }

    // the root is never reported
    if (path == m_root) {
        return FilterDecision::Skip;
    }

    if (rejectedByPatterns(path.native())) {
        return FilterDecision::Skip;
    }

    if (type == PathType::FILE && m_options->ignoreFile()) {
        return FilterDecision::Skip;
    }

    if (type == PathType::DIRECTORY && m_options->ignoreFolderContent()) {
        return m_options->ignoreFolder() ? FilterDecision::SkipSubtree : FilterDecision::AcceptNodeOnly;
    }

    if (type == PathType::DIRECTORY && m_options->ignoreFolder()) {
        return FilterDecision::Skip;
    }

    if (type == PathType::SYMLINK && m_options->ignoreSymlink()) {
        return FilterDecision::Skip;
    }

    return FilterDecision::Accept;
}

FilterDecision PathFilter::classifyFailure(const std::filesystem::path& path) const {
    if (path == m_root || rejectedByPatterns(path.native())) {
        return FilterDecision::SkipSubtree;
    }
    return FilterDecision::AcceptNodeOnly;
}

bool PathFilter::rejectedByPatterns(const std::string& path) const {
    // exclusion wins over inclusion
    if (auto exclude = m_options->excludePaths(); exclude && exclude->matches(path)) {
        return true;
    }
    auto include = m_options->includePaths();
    return include && !include->matches(path);
}

}  // namespace scan_notifier
