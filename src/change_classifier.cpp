#include "change_classifier.hpp"

namespace scan_notifier {

namespace {

struct Changes {
    bool created{false};
    bool permissions{false};
    bool modified{false};
};

}  // namespace

ChangeClassifier::ChangeClassifier(PathStateCache& cache, std::shared_ptr<const Options> options)
    : m_cache(cache), m_options(std::move(options)) {}

std::vector<Event> ChangeClassifier::classify(const std::string& path, PathType type,
                                              const PathSnapshot& observed) const {
    Changes changes = m_cache.update(path, [&observed](std::optional<PathSnapshot>& slot) {
        Changes result;
        if (!slot) {
            slot = observed;
            slot->visited = true;
            result.created = true;
            return result;
        }

        slot->visited = true;
        if (slot->permissions() != observed.permissions()) {
            result.permissions = true;
        }
        if (slot->modifiedTime != observed.modifiedTime) {
            result.modified = true;
            slot->modifiedTime = observed.modifiedTime;
        }
        slot->mode = observed.mode;
        return result;
    });

    std::vector<Event> events;
    if (changes.created) {
        if (!m_options->ignoreCreate()) {
            events.emplace_back(path, type, EventKind::CREATE);
        }
        return events;
    }

    if (changes.permissions && !m_options->ignorePerm()) {
        events.emplace_back(path, type, EventKind::PERM);
    }
    if (changes.modified && !m_options->ignoreModify()) {
        events.emplace_back(path, type, EventKind::MODIFY);
    }
    if (!changes.permissions && !changes.modified && !m_options->ignoreNoChange()) {
        events.emplace_back(path, type, EventKind::NOCHANGE);
    }
    return events;
}

std::optional<Event> ChangeClassifier::classifyFailure(const std::string& path, PathType type,
                                                       const std::error_code& code,
                                                       const std::string& message) const {
    if (m_options->ignoreErrors()) {
        return std::nullopt;
    }
    return Event::failure(path, type, code, message);
}

}  // namespace scan_notifier
