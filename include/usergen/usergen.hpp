#pragma once

/**
 * @file usergen.hpp
 * @brief Main convenience header for UserGen
 *
 * Include this single header to access all library functionality.
 *
 * @example Basic Usage
 * @code
 * #include <usergen/usergen.hpp>
 *
 * int main() {
 *     UserGen::LoginRegistry registry;
 *     auto records = UserGen::readInputFiles({"staff.txt", "contractors.txt"},
 *                                            registry, std::cerr);
 *     std::error_code ec;
 *     if (!UserGen::writeOutputFile("logins.txt", records, ec))
 *         std::cerr << "write: " << ec.message() << "\n";
 * }
 * @endcode
 */

// =============================================================================
// Record Types
// =============================================================================
#include "record/RecordBase.hpp"
#include "record/PersonRecord.hpp"
#include "record/AccountRecord.hpp"

// =============================================================================
// Login Generation
// =============================================================================
#include "login/LoginRegistry.hpp"
#include "login/LoginGenerator.hpp"

// =============================================================================
// Parsing and File I/O
// =============================================================================
#include "parser/RecordParser.hpp"
#include "io/TextFileReader.hpp"
#include "io/AccountFileWriter.hpp"

// =============================================================================
// Command Line
// =============================================================================
#include "cli/Options.hpp"
#include "cli/Run.hpp"

// =============================================================================
// Utilities
// =============================================================================
#include "util/UniqueFd.hpp"
#include "util/FileLockGuard.hpp"
#include "util/textFormatUtil.hpp"
