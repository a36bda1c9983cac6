#pragma once
/// @file TextFileReader.hpp
/// @brief Whole-file UTF-8 text reader over a POSIX descriptor

#include "../util/UniqueFd.hpp"

#include <string>
#include <system_error>
#include <vector>

namespace UserGen {

/// @brief Reads one input file completely before any of it is parsed
/// @details The file is opened read-only in the constructor and read without
///          taking any lock. Content that is not valid UTF-8 is rejected
///          as a whole with std::errc::illegal_byte_sequence, so a bad file
///          never contributes a partial set of lines.
class TextFileReader {
  public:
    /// @brief Opens @p path for reading
    /// @param path File path
    /// @param ec Error code set on failure (errno of open(2))
    TextFileReader(const std::string& path, std::error_code& ec);
    ~TextFileReader() = default;

    TextFileReader(const TextFileReader&) = delete;
    TextFileReader& operator=(const TextFileReader&) = delete;

    /// @brief Reads the remaining content and validates it as UTF-8
    /// @param out Receives the raw bytes
    /// @param ec Error code set on failure
    /// @return true on success
    bool readAll(std::string& out, std::error_code& ec);

    /// @brief readAll() followed by util::splitLines()
    bool readLines(std::vector<std::string>& lines, std::error_code& ec);

    /// @brief Releases the descriptor
    bool close(std::error_code& ec) { return fd_.close(ec); }

  private:
    detail::UniqueFd fd_;
};

} // namespace UserGen
