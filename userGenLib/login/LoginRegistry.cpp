#include <usergen/login/LoginRegistry.hpp>

namespace UserGen {

bool LoginRegistry::contains(const std::string& login) const {
    return logins_.find(login) != logins_.end();
}

bool LoginRegistry::insert(const std::string& login) { return logins_.insert(login).second; }

} // namespace UserGen
