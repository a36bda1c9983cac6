#pragma once
/// @file PersonRecord.hpp
/// @brief One parsed personnel line

#include "RecordBase.hpp"

#include <string>
#include <utility>

namespace UserGen {

/// @brief Identity and department data of one input line
/// @details Built by the record parser once a line has passed every shape
///          check, then only read. The middle name may be empty; the surname
///          never is. The department keeps any ':' re-joined from excess fields.
class PersonRecord : public RecordBase {
  public:
    PersonRecord() = default;
    PersonRecord(std::string id, std::string givenName, std::string middleName,
                 std::string surname, std::string department)
        : id_(std::move(id)), givenName_(std::move(givenName)),
          middleName_(std::move(middleName)), surname_(std::move(surname)),
          department_(std::move(department)) {}

    std::string id() const override { return id_; }
    const char* typeName() const override { return "Person"; }

    const std::string& givenName() const { return givenName_; }
    const std::string& middleName() const { return middleName_; }
    const std::string& surname() const { return surname_; }
    const std::string& department() const { return department_; }

    bool operator==(const PersonRecord& o) const {
        return id_ == o.id_ && givenName_ == o.givenName_ && middleName_ == o.middleName_ &&
               surname_ == o.surname_ && department_ == o.department_;
    }
    bool operator!=(const PersonRecord& o) const { return !(*this == o); }

  private:
    std::string id_;
    std::string givenName_;
    std::string middleName_;
    std::string surname_;
    std::string department_;
};

} // namespace UserGen
