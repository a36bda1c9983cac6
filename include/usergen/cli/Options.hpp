#pragma once
/// @file Options.hpp
/// @brief Command line of the ugen tool

#include <ostream>
#include <string>
#include <vector>

namespace UserGen::cli {

/// @brief Run configuration taken from the command line
struct Options {
    std::string outputPath;              ///< -o / --output
    std::vector<std::string> inputPaths; ///< positional, at least one
};

enum class ParseStatus {
    Run,  ///< options are complete
    Help, ///< -h / --help was given
    Error ///< message describes the problem
};

/// @brief Parses argv-style arguments (args[0] is the program name)
/// @details Uses getopt_long, so options and inputs may be mixed and
///          "--output=FILE" is accepted.
/// @param args Arguments including the program name
/// @param opts Filled when Run is returned
/// @param message Reason when Error is returned
ParseStatus parseArguments(const std::vector<std::string>& args, Options& opts,
                           std::string& message);

void printUsage(const std::string& prog, std::ostream& os);
void printHelp(const std::string& prog, std::ostream& os);

} // namespace UserGen::cli
