#pragma once
/// @file FileLockGuard.hpp
/// @brief RAII guard for whole-file fcntl advisory locks (internal implementation)

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <system_error>

namespace UserGen {
namespace detail {

/// @brief Holds a whole-file fcntl lock for the lifetime of the guard
///
/// Input files are read under a shared lock and the output file is rewritten
/// under an exclusive one, so another process following the same protocol
/// never observes a half-written output.
///
/// @note Blocking (F_SETLKW). The descriptor must be open for reading to take
///       a Shared lock and for writing to take an Exclusive one.
class FileLockGuard {
  public:
    enum class Mode {
        Shared,   ///< F_RDLCK
        Exclusive ///< F_WRLCK
    };

    FileLockGuard() = default;

    /// @brief Acquires the lock; check @p ec afterwards
    FileLockGuard(int fd, Mode mode, std::error_code& ec) { lock(fd, mode, ec); }

    ~FileLockGuard() { unlockIgnore(); }

    FileLockGuard(const FileLockGuard&) = delete;
    FileLockGuard& operator=(const FileLockGuard&) = delete;

    FileLockGuard(FileLockGuard&& other) noexcept : fd_(other.fd_), locked_(other.locked_) {
        other.fd_ = -1;
        other.locked_ = false;
    }

    FileLockGuard& operator=(FileLockGuard&& other) noexcept {
        if (this != &other) {
            unlockIgnore();
            fd_ = other.fd_;
            locked_ = other.locked_;
            other.fd_ = -1;
            other.locked_ = false;
        }
        return *this;
    }

    /// @brief Locks the whole file behind @p fd, releasing any lock held before
    /// @return true on success, false with @p ec set otherwise
    bool lock(int fd, Mode mode, std::error_code& ec) {
        ec.clear();
        unlockIgnore();

        if (fd < 0) {
            ec = std::make_error_code(std::errc::bad_file_descriptor);
            return false;
        }

        struct flock fl{};
        fl.l_type = (mode == Mode::Shared) ? F_RDLCK : F_WRLCK;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 0; // whole file

        int rc;
        do {
            rc = ::fcntl(fd, F_SETLKW, &fl);
        } while (rc < 0 && errno == EINTR);

        if (rc < 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }

        fd_ = fd;
        locked_ = true;
        return true;
    }

    /// @brief Releases the lock; unlock failures are not reported
    void unlockIgnore() noexcept {
        if (!locked_ || fd_ < 0)
            return;
        struct flock fl{};
        fl.l_type = F_UNLCK;
        fl.l_whence = SEEK_SET;
        fl.l_start = 0;
        fl.l_len = 0;
        (void)::fcntl(fd_, F_SETLK, &fl);
        locked_ = false;
        fd_ = -1;
    }

    bool locked() const noexcept { return locked_; }

  private:
    int fd_ = -1;
    bool locked_ = false;
};

} // namespace detail
} // namespace UserGen
