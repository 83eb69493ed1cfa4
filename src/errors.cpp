#include "errors.hpp"

namespace scan_notifier {

namespace {

class NotifierCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "scan_notifier"; }

    std::string message(int value) const override {
        switch (static_cast<ErrorCode>(value)) {
            case ErrorCode::InternalError:
                return "internal error";
            case ErrorCode::InvalidRootDirPath:
                return "invalid root directory path";
            case ErrorCode::Initialization:
                return "error parsing root directory";
            case ErrorCode::ScanIsNotRunning:
                return "scan notifier is not running";
            case ErrorCode::ScanAlreadyStarted:
                return "scan notifier has already started";
            case ErrorCode::ScanIsStopping:
                return "scan notifier is stopping";
            case ErrorCode::ScanIsNotReady:
                return "scan notifier is not (re)initialized";
        }
        return "unknown error";
    }
};

}  // namespace

const std::error_category& notifierCategory() noexcept {
    static const NotifierCategory category;
    return category;
}

std::error_code make_error_code(ErrorCode code) noexcept {
    return {static_cast<int>(code), notifierCategory()};
}

}  // namespace scan_notifier
