#include "event.hpp"

#include <array>
#include <stdexcept>
#include <utility>

namespace scan_notifier {

namespace {

constexpr std::array<std::pair<PathType, std::string_view>, 4> kPathTypeNames{{
    {PathType::FILE, "FILE"},
    {PathType::DIRECTORY, "DIRECTORY"},
    {PathType::SYMLINK, "SYMLINK"},
    {PathType::UNSUPPORTED, "UNSUPPORTED"},
}};

constexpr std::array<std::pair<EventKind, std::string_view>, 6> kEventKindNames{{
    {EventKind::CREATE, "CREATE"},
    {EventKind::MODIFY, "MODIFY"},
    {EventKind::DELETE, "DELETE"},
    {EventKind::PERM, "PERM"},
    {EventKind::ERROR, "ERROR"},
    {EventKind::NOCHANGE, "NOCHANGE"},
}};

}  // namespace

std::string_view toString(PathType type) {
    for (const auto& [value, name] : kPathTypeNames) {
        if (value == type) {
            return name;
        }
    }
    return "UNSUPPORTED";
}

std::string_view toString(EventKind kind) {
    for (const auto& [value, name] : kEventKindNames) {
        if (value == kind) {
            return name;
        }
    }
    return "ERROR";
}

std::optional<PathType> parsePathType(std::string_view name) {
    for (const auto& [value, candidate] : kPathTypeNames) {
        if (candidate == name) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<EventKind> parseEventKind(std::string_view name) {
    for (const auto& [value, candidate] : kEventKindNames) {
        if (candidate == name) {
            return value;
        }
    }
    return std::nullopt;
}

Event Event::failure(std::string path, PathType type, std::error_code code, std::string message) {
    Event event(std::move(path), type, EventKind::ERROR);
    event.errorCode = code;
    event.error = message.empty() ? code.message() : std::move(message);
    return event;
}

Json::Value Event::toJson() const {
    Json::Value json;
    json["path"] = path;
    json["type"] = std::string(toString(type));
    json["kind"] = std::string(toString(kind));
    if (error) {
        json["error"] = *error;
    }
    return json;
}

Event Event::fromJson(const Json::Value& json) {
    auto type = parsePathType(json["type"].asString());
    if (!type) {
        throw std::invalid_argument("unknown path type: " + json["type"].asString());
    }
    auto kind = parseEventKind(json["kind"].asString());
    if (!kind) {
        throw std::invalid_argument("unknown event kind: " + json["kind"].asString());
    }

    Event event(json["path"].asString(), *type, *kind);
    if (json.isMember("error") && !json["error"].isNull()) {
        event.error = json["error"].asString();
    }
    return event;
}

std::ostream& operator<<(std::ostream& os, const Event& event) {
    os << toString(event.kind) << ' ' << toString(event.type) << " \"" << event.path << '"';
    if (event.error) {
        os << " (" << *event.error << ')';
    }
    return os;
}

}  // namespace scan_notifier
