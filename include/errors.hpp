#ifndef SCAN_NOTIFIER_ERRORS_HPP
#define SCAN_NOTIFIER_ERRORS_HPP

#include <string>
#include <system_error>

namespace scan_notifier {

/// Failures reported by the scan notifier, either thrown inside a std::system_error
/// (construction) or returned as std::error_code (lifecycle operations).
enum class ErrorCode {
    // Unexpected error
    InternalError = 1,

    // Construction errors
    InvalidRootDirPath,
    Initialization,

    // Lifecycle errors
    ScanIsNotRunning,
    ScanAlreadyStarted,
    ScanIsStopping,
    ScanIsNotReady,
};

const std::error_category& notifierCategory() noexcept;

std::error_code make_error_code(ErrorCode code) noexcept;

}  // namespace scan_notifier

template <>
struct std::is_error_code_enum<scan_notifier::ErrorCode> : std::true_type {};

#endif  // SCAN_NOTIFIER_ERRORS_HPP
