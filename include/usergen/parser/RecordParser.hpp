#pragma once
/// @file RecordParser.hpp
/// @brief Personnel line parsing and the per-run parse loop

#include "../login/LoginRegistry.hpp"
#include "../record/AccountRecord.hpp"
#include "../record/PersonRecord.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <system_error>
#include <vector>

namespace UserGen {

/// Minimum number of ':'-separated fields of a usable line.
constexpr size_t kMinFieldCount = 4;

/// @brief Outcome of parsing one input line
enum class LineStatus {
    Accepted,      ///< PersonRecord produced
    Blank,         ///< empty or whitespace only
    TooFewFields,  ///< fewer than kMinFieldCount fields
    NonNumericId,  ///< first field is not all decimal digits
    MissingSurname ///< surname field empty after trimming
};

/// @brief A line rejected for a non-numeric ID
struct LineWarning {
    size_t lineNumber = 0; ///< 1-based
    std::string id;        ///< offending ID field
    std::string line;      ///< the trimmed line
};

/// @brief What one input file contributed to a run
/// @details Either the file was read (ec clear; records and warnings hold the
///          line-level outcome) or it failed as a whole (ec set; records
///          empty, registry untouched).
struct FileParseResult {
    std::string path;
    std::error_code ec;
    std::vector<AccountRecord> records;
    std::vector<LineWarning> warnings;

    bool ok() const { return !ec; }
};

/// @brief Parses one raw line into a PersonRecord
/// @details Fields are split on every ':' and trimmed. Four fields mean
///          ID:given:surname:department, five add a middle name after the given
///          name, and anything past the fifth field is joined back into the
///          department with ':'.
/// @param line Raw line, with or without surrounding whitespace
/// @param out Filled only when Accepted is returned
/// @return Classification of the line
LineStatus parseLine(const std::string& line, PersonRecord& out);

/// @brief Reads one file and assigns a login to every accepted line
/// @details Writes nothing to any stream; diagnostics are returned in the
///          result. The file is read completely before the first login is
///          generated.
FileParseResult parseFile(const std::string& path, LoginRegistry& registry);

/// @brief Parses the files in order into one record sequence
/// @details Non-numeric IDs are reported as "[Warning] ..." lines and unreadable
///          files as "[Error] ..." lines on @p err; neither stops the run.
/// @param paths Input files, in processing order
/// @param registry Logins issued so far in this run; shared by all files
/// @param err Diagnostic stream
/// @return Records in file order, then line order
std::vector<AccountRecord> readInputFiles(const std::vector<std::string>& paths,
                                          LoginRegistry& registry, std::ostream& err);

/// @brief Prints the diagnostics of one file result to @p err
void reportDiagnostics(const FileParseResult& result, std::ostream& err);

} // namespace UserGen
