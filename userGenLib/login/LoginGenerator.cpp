#include <usergen/login/LoginGenerator.hpp>
#include <usergen/util/textFormatUtil.hpp>

namespace UserGen {

std::string makeBaseLogin(const std::string& givenName, const std::string& middleName,
                          const std::string& surname) {
    std::string initials = util::utf8Prefix(givenName, 1);
    if (!middleName.empty())
        initials += util::utf8Prefix(middleName, 1);

    return util::utf8Prefix(util::toLowerUtf8(initials + surname), kMaxBaseLength);
}

std::string createLoginName(const std::string& givenName, const std::string& middleName,
                            const std::string& surname, LoginRegistry& registry) {
    const std::string base = makeBaseLogin(givenName, middleName, surname);

    std::string login = base;
    for (unsigned long counter = 1; registry.contains(login); ++counter)
        login = base + std::to_string(counter);

    registry.insert(login);
    return login;
}

} // namespace UserGen
