#ifndef SCAN_NOTIFIER_CHANGE_CLASSIFIER_HPP
#define SCAN_NOTIFIER_CHANGE_CLASSIFIER_HPP

#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "event.hpp"
#include "options.hpp"
#include "path_state_cache.hpp"

namespace scan_notifier {

/// Compares freshly observed metadata with the cached snapshot of a path, updates the
/// cache and returns the events that are not suppressed by the options.
class ChangeClassifier {
public:
    ChangeClassifier(PathStateCache& cache, std::shared_ptr<const Options> options);

    /// @brief Classify an accepted path. observed.visited is ignored.
    /// An unknown path yields CREATE and nothing else. A known path may yield PERM and
    /// MODIFY together, or NOCHANGE when neither changed.
    std::vector<Event> classify(const std::string& path, PathType type, const PathSnapshot& observed) const;

    /// @brief ERROR event for a path whose metadata could not be read. The cache is untouched.
    std::optional<Event> classifyFailure(const std::string& path, PathType type,
                                         const std::error_code& code, const std::string& message) const;

private:
    PathStateCache& m_cache;
    std::shared_ptr<const Options> m_options;
};

}  // namespace scan_notifier

#endif  // SCAN_NOTIFIER_CHANGE_CLASSIFIER_HPP
