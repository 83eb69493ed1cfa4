#include "directory_walker.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace scan_notifier {

namespace {

struct WalkResult {
    bool aborted{false};
    std::error_code error;
};

WalkResult abortWith(const std::error_code& ec) {
    return {true, ec ? ec : std::make_error_code(std::errc::operation_canceled)};
}

struct Child {
    fs::path path;
    PathType type;
    std::error_code error;  // set when the entry was listed but could not be stat'ed
};

WalkResult walkChildren(const fs::path& dir, const WalkCallback& callback) {
    std::vector<Child> children;
    std::error_code ec;

    fs::directory_iterator it(dir, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::error_code statusError;
        fs::file_status status = it->symlink_status(statusError);
        PathType type = statusError ? PathType::UNSUPPORTED : pathTypeOf(status.type());
        children.push_back({it->path(), type, statusError});
    }

    if (ec) {
        // the directory itself was already reported, now report why its listing failed
        if (callback(dir, PathType::DIRECTORY, ec) == WalkAction::Abort) {
            return abortWith(ec);
        }
    }

    std::sort(children.begin(), children.end(), [](const Child& a, const Child& b) {
        return a.path.filename() < b.path.filename();
    });

    for (const auto& child : children) {
        WalkAction action = callback(child.path, child.type, child.error);
        if (action == WalkAction::Abort) {
            return abortWith(child.error);
        }
        if (child.type == PathType::DIRECTORY && action != WalkAction::SkipSubtree) {
            WalkResult result = walkChildren(child.path, callback);
            if (result.aborted) {
                return result;
            }
        }
    }
    return {};
}

}  // namespace

PathType pathTypeOf(fs::file_type type) {
    switch (type) {
        case fs::file_type::directory:
            return PathType::DIRECTORY;
        case fs::file_type::regular:
            return PathType::FILE;
        case fs::file_type::symlink:
            return PathType::SYMLINK;
        default:
            return PathType::UNSUPPORTED;
    }
}

std::error_code walkDirectory(const fs::path& root, const WalkCallback& callback) {
    std::error_code ec;
    fs::file_status status = fs::status(root, ec);
    if (ec || !fs::is_directory(status)) {
        if (!ec) {
            ec = std::make_error_code(std::errc::not_a_directory);
        }
        callback(root, PathType::UNSUPPORTED, ec);
        return ec;
    }

    WalkAction action = callback(root, PathType::DIRECTORY, {});
    if (action == WalkAction::Abort) {
        return abortWith({}).error;
    }
    if (action == WalkAction::SkipSubtree) {
        return {};
    }
    return walkChildren(root, callback).error;
}

}  // namespace scan_notifier
