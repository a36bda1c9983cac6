#include <usergen/io/TextFileReader.hpp>
#include <usergen/util/textFormatUtil.hpp>

#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace UserGen {

TextFileReader::TextFileReader(const std::string& path, std::error_code& ec) {
    fd_ = detail::UniqueFd::open(path, O_RDONLY, 0, ec);
}

bool TextFileReader::readAll(std::string& out, std::error_code& ec) {
    ec.clear();
    out.clear();

    if (!fd_) {
        ec = std::make_error_code(std::errc::bad_file_descriptor);
        return false;
    }

    struct stat st{};
    if (::fstat(fd_.get(), &st) < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    if (S_ISDIR(st.st_mode)) {
        ec = std::make_error_code(std::errc::is_a_directory);
        return false;
    }

    // no lock: a writer holding one elsewhere must not stall the run
    if (S_ISREG(st.st_mode))
        out.reserve(static_cast<size_t>(st.st_size));

    char buf[4096];
    while (true) {
        ssize_t n = ::read(fd_.get(), buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            ec = std::error_code(errno, std::generic_category());
            out.clear();
            return false;
        }
        if (n == 0)
            break;
        out.append(buf, static_cast<size_t>(n));
    }

    size_t badOffset = 0;
    if (!util::isValidUtf8(out.data(), out.size(), badOffset)) {
        ec = std::make_error_code(std::errc::illegal_byte_sequence);
        out.clear();
        return false;
    }
    return true;
}

bool TextFileReader::readLines(std::vector<std::string>& lines, std::error_code& ec) {
    lines.clear();
    std::string text;
    if (!readAll(text, ec))
        return false;
    lines = util::splitLines(text);
    return true;
}

} // namespace UserGen
