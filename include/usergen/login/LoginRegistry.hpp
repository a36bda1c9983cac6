#pragma once
/// @file LoginRegistry.hpp
/// @brief Set of logins issued during one run

#include <cstddef>
#include <string>
#include <unordered_set>

namespace UserGen {

/// @brief Logins already handed out in the current run
/// @details Owned by whoever drives the run and passed by reference to every
///          parser and generator call, so separate runs in one process never
///          share state. Membership is the uniqueness contract: the generator
///          never returns a login that is already registered.
class LoginRegistry {
  public:
    LoginRegistry() = default;

    LoginRegistry(const LoginRegistry&) = delete;
    LoginRegistry& operator=(const LoginRegistry&) = delete;
    LoginRegistry(LoginRegistry&&) = default;
    LoginRegistry& operator=(LoginRegistry&&) = default;

    bool contains(const std::string& login) const;

    /// @brief Registers @p login
    /// @return false if it was already registered
    bool insert(const std::string& login);

    size_t size() const noexcept { return logins_.size(); }
    bool empty() const noexcept { return logins_.empty(); }

  private:
    std::unordered_set<std::string> logins_;
};

} // namespace UserGen
