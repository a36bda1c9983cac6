#include <usergen/io/AccountFileWriter.hpp>
#include <usergen/util/FileLockGuard.hpp>

#include <cerrno>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <unistd.h>

namespace UserGen {

namespace fs = std::filesystem;

AccountFileWriter::AccountFileWriter(const std::string& path, std::error_code& ec) {
    ec.clear();

    if (path.empty()) {
        ec = std::make_error_code(std::errc::invalid_argument);
        return;
    }

    fs::path dir = fs::path(path).parent_path();
    if (!dir.empty()) {
        std::error_code fec;
        if (!fs::exists(dir, fec)) {
            fs::create_directories(dir, fec);
            if (fec) {
                ec = fec;
                return;
            }
        }
    }

    // no O_TRUNC: truncation waits for the exclusive lock in writeAll()
    fd_ = detail::UniqueFd::open(path, O_CREAT | O_WRONLY, 0644, ec);
}

bool AccountFileWriter::writeAll(const std::vector<AccountRecord>& records, std::error_code& ec) {
    ec.clear();

    if (!fd_) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return false;
    }

    struct stat st{};
    if (::fstat(fd_.get(), &st) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    const bool regular = S_ISREG(st.st_mode);

    detail::FileLockGuard lock;
    if (regular) {
        if (!lock.lock(fd_.get(), detail::FileLockGuard::Mode::Exclusive, ec))
            return false;
        if (::ftruncate(fd_.get(), 0) < 0 || ::lseek(fd_.get(), 0, SEEK_SET) < 0) {
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
    }

    std::string buf;
    for (const auto& r : records) {
        buf += r.formatLine();
        buf += '\n';
        if (buf.size() >= 64 * 1024) {
            if (!writeBuffer(buf, ec))
                return false;
            buf.clear();
        }
    }
    if (!buf.empty() && !writeBuffer(buf, ec))
        return false;

    if (regular && ::fsync(fd_.get()) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    return true;
}

bool AccountFileWriter::writeBuffer(const std::string& data, std::error_code& ec) {
    const char* p = data.data();
    size_t left = data.size();
    while (left > 0) {
        ssize_t n = ::write(fd_.get(), p, left);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = std::error_code(errno, std::generic_category());
            return false;
        }
        p += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}

bool writeOutputFile(const std::string& path, const std::vector<AccountRecord>& records,
                     std::error_code& ec) {
    AccountFileWriter writer(path, ec);
    if (ec)
        return false;
    if (!writer.writeAll(records, ec))
        return false;
    return writer.close(ec);
}

} // namespace UserGen
