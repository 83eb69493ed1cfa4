#ifndef SCAN_NOTIFIER_EVENT_HPP
#define SCAN_NOTIFIER_EVENT_HPP

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

#include <json/json.h>

namespace scan_notifier {

/// Kind of filesystem item an event refers to
enum class PathType {
    FILE,
    DIRECTORY,
    SYMLINK,
    UNSUPPORTED
};

/// What happened to the item since the previous pass
enum class EventKind {
    CREATE,
    MODIFY,
    DELETE,
    PERM,
    ERROR,
    NOCHANGE
};

std::string_view toString(PathType type);
std::string_view toString(EventKind kind);

std::optional<PathType> parsePathType(std::string_view name);
std::optional<EventKind> parseEventKind(std::string_view name);

/// @brief A single change notification delivered through the event queue.
struct Event {
    std::string path;
    PathType type{PathType::UNSUPPORTED};
    EventKind kind{EventKind::NOCHANGE};
    std::optional<std::string> error;
    std::error_code errorCode;

    Event() = default;
    Event(std::string path, PathType type, EventKind kind)
        : path(std::move(path)), type(type), kind(kind) {}

    /// @brief Build an ERROR event carrying the underlying cause
    static Event failure(std::string path, PathType type, std::error_code code, std::string message);

    /// @brief Serialize as {path, type, kind, error?}
    Json::Value toJson() const;

    /// @brief Parse the format written by toJson()
    /// @throws std::invalid_argument on unknown type or kind names
    static Event fromJson(const Json::Value& json);

    bool operator==(const Event& other) const {
        return path == other.path && type == other.type && kind == other.kind && error == other.error;
    }
};

std::ostream& operator<<(std::ostream& os, const Event& event);

}  // namespace scan_notifier

#endif  // SCAN_NOTIFIER_EVENT_HPP
