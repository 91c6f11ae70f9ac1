#include <cctype> // for std::isprint
#include <sstream> // for std::ostringstream

#include "testbed/identifier.hpp"

namespace testbed {

auto identifier_checker::operator()(std::string v) const -> std::string
{
    if (v.empty()) {
        throw invalid_identifier{"identifier may not be empty"};
    }
    if (!is_identifier_start(v.front())) {
        std::ostringstream os;
        os << "identifier may not start with '" << v.front() << "'";
        throw invalid_identifier{os.str()};
    }
    for (auto&& c: v) {
        if (!is_identifier_part(c)) {
            std::ostringstream os;
            os << "identifier may not contain '";
            if (std::isprint(static_cast<unsigned char>(c))) {
                os << c;
            }
            else {
                os << "\\" << std::oct << int(static_cast<unsigned char>(c));
            }
            os << "', character not allowed";
            throw invalid_identifier{os.str()};
        }
    }
    return v;
}

auto operator<<(std::ostream& os, const identifier& value) -> std::ostream&
{
    os << value.get();
    return os;
}

}
