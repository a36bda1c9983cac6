#pragma once
/// @file UniqueFd.hpp
/// @brief RAII owner of a POSIX file descriptor (internal implementation)

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <string>
#include <system_error>

namespace UserGen {
namespace detail {

/// @brief RAII owner of a POSIX file descriptor
///
/// Move-only. The descriptor is closed on destruction, so every exit path of
/// a reader or writer releases its file before the next one is opened.
///
/// @note This class is for internal library use.
class UniqueFd {
  public:
    UniqueFd() noexcept = default;

    /// @brief Takes ownership of an already opened descriptor
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}

    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}

    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other)
            reset(other.release());
        return *this;
    }

    /// @brief Opens @p path with ::open, retrying on EINTR
    /// @param path File path
    /// @param flags open(2) flags; O_CLOEXEC is added where available
    /// @param mode Permission bits used when O_CREAT creates the file
    /// @param ec Set from errno on failure
    /// @return Owning wrapper, invalid on failure
    static UniqueFd open(const std::string& path, int flags, mode_t mode, std::error_code& ec) {
        ec.clear();
#ifdef O_CLOEXEC
        flags |= O_CLOEXEC;
#endif
        int fd;
        do {
            fd = ::open(path.c_str(), flags, mode);
        } while (fd < 0 && errno == EINTR);

        if (fd < 0) {
            ec = std::error_code(errno, std::generic_category());
            return UniqueFd();
        }
        return UniqueFd(fd);
    }

    /// @return Owned descriptor, -1 if none
    int get() const noexcept { return fd_; }

    bool valid() const noexcept { return fd_ >= 0; }

    explicit operator bool() const noexcept { return valid(); }

    /// @brief Gives up ownership without closing
    int release() noexcept {
        int tmp = fd_;
        fd_ = -1;
        return tmp;
    }

    /// @brief Closes the owned descriptor and adopts @p newFd
    void reset(int newFd = -1) noexcept {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = newFd;
    }

    /// @brief Closes the descriptor and reports the close(2) result
    /// @param ec Set from errno if close fails
    /// @return true on success or if nothing was owned
    bool close(std::error_code& ec) noexcept {
        ec.clear();
        if (fd_ < 0)
            return true;
        int fd = release();
        if (::close(fd) < 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        return true;
    }

  private:
    int fd_ = -1;
};

} // namespace detail
} // namespace UserGen
