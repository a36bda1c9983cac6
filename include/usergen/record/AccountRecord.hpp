#pragma once
/// @file AccountRecord.hpp
/// @brief Output record: a person plus the login issued to it

#include "PersonRecord.hpp"

#include <string>
#include <utility>

namespace UserGen {

/// @brief A PersonRecord with its assigned login
/// @details Serializes as ID:login:given:middle:surname:department. An empty
///          middle name gives an empty field ("::").
class AccountRecord : public RecordBase {
  public:
    AccountRecord(PersonRecord person, std::string login)
        : person_(std::move(person)), login_(std::move(login)) {}

    std::string id() const override { return person_.id(); }
    const char* typeName() const override { return "Account"; }

    const PersonRecord& person() const { return person_; }
    const std::string& login() const { return login_; }

    /// @brief Output line without the trailing newline
    std::string formatLine() const;

  private:
    PersonRecord person_;
    std::string login_;
};

} // namespace UserGen
