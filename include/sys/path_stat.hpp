#ifndef SCAN_NOTIFIER_SYS_PATH_STAT_HPP
#define SCAN_NOTIFIER_SYS_PATH_STAT_HPP

#include <sys/stat.h>
#include <sys/types.h>
#include <cerrno>
#include <chrono>
#include <string>
#include <system_error>

namespace scan_notifier::sys {

/// Metadata of a path as returned by lstat(2). Symlinks are never followed.
class PathStat {
private:
    struct stat m_st{};

    explicit PathStat(const struct stat& st) : m_st(st) {}

public:
    static PathStat lstat(const std::string& path) {
        struct stat st{};
        if (::lstat(path.c_str(), &st) == -1) {
            throw std::system_error(errno, std::system_category(), "Failed to lstat: " + path);
        }
        return PathStat(st);
    }

    static PathStat stat(const std::string& path) {
        struct stat st{};
        if (::stat(path.c_str(), &st) == -1) {
            throw std::system_error(errno, std::system_category(), "Failed to stat: " + path);
        }
        return PathStat(st);
    }

    mode_t mode() const { return m_st.st_mode; }

    // Nanoseconds since the epoch
    std::chrono::nanoseconds modifiedTime() const {
        return std::chrono::seconds(m_st.st_mtim.tv_sec) + std::chrono::nanoseconds(m_st.st_mtim.tv_nsec);
    }

    bool isDirectory() const { return S_ISDIR(m_st.st_mode); }
    bool isSymlink() const { return S_ISLNK(m_st.st_mode); }
};

}  // namespace scan_notifier::sys

#endif  // SCAN_NOTIFIER_SYS_PATH_STAT_HPP
