#pragma once
/// @file Run.hpp
/// @brief Entry point of the ugen tool

#include <ostream>
#include <string>
#include <vector>

namespace UserGen::cli {

/// Exit status for a bad command line.
constexpr int kExitUsage = 2;

/// @brief Runs one complete ugen invocation
/// @details Parses @p args, reads every input into a fresh LoginRegistry and
///          writes the output file, which is created even when no record
///          survives. Per-line warnings and unreadable inputs go to @p err and
///          do not change the result.
/// @param args Arguments including the program name
/// @param out Help text
/// @param err Usage errors and diagnostics
/// @return 0 on success, 1 if the output cannot be written, kExitUsage for a
///         bad command line
int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace UserGen::cli
