#pragma once
/// @file RecordBase.hpp
/// @brief Base interface for all record types

#include <string>

namespace UserGen {

/// @brief Base interface for records read from or written to record files
/// @details Every record carries the personnel ID of its source line. The ID is
///          not a key: two records may share it.
class RecordBase {
  public:
    virtual ~RecordBase() = default;

    /// @brief Personnel ID as it appeared in the input (all digits)
    virtual std::string id() const = 0;

    /// @brief Record type name ("Person", "Account")
    virtual const char* typeName() const = 0;
};

} // namespace UserGen
