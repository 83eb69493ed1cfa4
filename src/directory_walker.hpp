#ifndef SCAN_NOTIFIER_DIRECTORY_WALKER_HPP
#define SCAN_NOTIFIER_DIRECTORY_WALKER_HPP

#include <filesystem>
#include <functional>
#include <system_error>

#include "event.hpp"

namespace scan_notifier {

enum class WalkAction {
    Continue,
    SkipSubtree,  // do not descend into this directory
    Abort
};

/// Called once per visited path. error is set when the path could not be read; such an
/// entry has type UNSUPPORTED. A directory whose listing fails is reported a second time
/// with that error.
using WalkCallback = std::function<WalkAction(const std::filesystem::path&, PathType, const std::error_code&)>;

PathType pathTypeOf(std::filesystem::file_type type);

/// @brief Depth-first walk of root, reporting root first and each directory's entries in
/// lexical order. Symlinks are reported but never followed.
/// @return the error that made the callback abort, or an empty code
std::error_code walkDirectory(const std::filesystem::path& root, const WalkCallback& callback);

}  // namespace scan_notifier

#endif  // SCAN_NOTIFIER_DIRECTORY_WALKER_HPP
