#include <usergen/record/AccountRecord.hpp>
#include <usergen/util/textFormatUtil.hpp>

namespace UserGen {

std::string AccountRecord::formatLine() const {
    const char sep = util::kFieldSeparator;
    std::string out;
    out.reserve(person_.id().size() + login_.size() + person_.givenName().size() +
                person_.middleName().size() + person_.surname().size() +
                person_.department().size() + 5);
    out += person_.id();
    out += sep;
    out += login_;
    out += sep;
    out += person_.givenName();
    out += sep;
    out += person_.middleName();
    out += sep;
    out += person_.surname();
    out += sep;
    out += person_.department();
    return out;
}

} // namespace UserGen
