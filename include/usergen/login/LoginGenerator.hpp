#pragma once
/// @file LoginGenerator.hpp
/// @brief Login name derivation and collision resolution

#include "LoginRegistry.hpp"

#include <cstddef>
#include <string>

namespace UserGen {

/// Maximum length, in characters, of a login before a collision suffix.
constexpr size_t kMaxBaseLength = 8;

/// @brief Unsuffixed login candidate for a name
/// @details First letter of the given name, first letter of the middle name
///          (if any) and the whole surname, lowercased and cut to
///          kMaxBaseLength characters. Characters are UTF-8 code points;
///          lowercasing is the simple Unicode mapping.
std::string makeBaseLogin(const std::string& givenName, const std::string& middleName,
                          const std::string& surname);

/// @brief Derives a login that is not yet in @p registry and registers it
/// @details Returns the base login when it is free, otherwise the base followed
///          by the smallest counter (1, 2, ...) that is free. The counter is
///          appended to the full base, so a suffixed login may be longer than
///          kMaxBaseLength.
/// @param givenName Given name, may be empty
/// @param middleName Middle name, may be empty
/// @param surname Surname
/// @param registry Logins issued so far; gains the returned login
/// @return The new login
std::string createLoginName(const std::string& givenName, const std::string& middleName,
                            const std::string& surname, LoginRegistry& registry);

} // namespace UserGen
