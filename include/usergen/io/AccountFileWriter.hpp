#pragma once
/// @file AccountFileWriter.hpp
/// @brief Writer for the combined output record file

#include "../record/AccountRecord.hpp"
#include "../util/UniqueFd.hpp"

#include <string>
#include <system_error>
#include <vector>

namespace UserGen {

/// @brief Replaces the destination file with a sequence of account records
/// @details Missing parent directories are created. A regular destination file
///          is truncated and rewritten under an exclusive advisory lock, then
///          synced. Each record becomes one newline-terminated line, in the
///          order given.
class AccountFileWriter {
  public:
    /// @brief Opens (creating if needed) @p path for writing
    /// @param path Destination path, must not be empty
    /// @param ec Error code set on failure
    AccountFileWriter(const std::string& path, std::error_code& ec);
    ~AccountFileWriter() = default;

    AccountFileWriter(const AccountFileWriter&) = delete;
    AccountFileWriter& operator=(const AccountFileWriter&) = delete;

    /// @brief Writes all records, replacing any previous content
    /// @param records Records in output order
    /// @param ec Error code set on failure
    /// @return true on success
    bool writeAll(const std::vector<AccountRecord>& records, std::error_code& ec);

    /// @brief Releases the descriptor, reporting close(2) errors
    bool close(std::error_code& ec) { return fd_.close(ec); }

  private:
    bool writeBuffer(const std::string& data, std::error_code& ec);

    detail::UniqueFd fd_;
};

/// @brief Opens, writes and closes @p path in one call
bool writeOutputFile(const std::string& path, const std::vector<AccountRecord>& records,
                     std::error_code& ec);

} // namespace UserGen
