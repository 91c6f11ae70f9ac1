#include <iomanip> // for std::quoted

#include "testbed/syntax.hpp"

namespace testbed::syntax {

auto operator<<(std::ostream& os, const access& value) -> std::ostream&
{
    os << value.head;
    for (auto&& step: value.steps) {
        std::visit(detail::overloaded{
            [&os](const field_step& s) {
                os << "." << s.name;
            },
            [&os](const index_step& s) {
                os << "[";
                std::visit(detail::overloaded{
                    [&os](std::int64_t i) {
                        os << i;
                    },
                    [&os](const box<access>& a) {
                        os << *a;
                    },
                }, s.key);
                os << "]";
            },
        }, step);
    }
    return os;
}

auto operator<<(std::ostream& os, const string_builder& value)
    -> std::ostream&
{
    auto prefix = "";
    for (auto&& part: value.parts) {
        os << prefix;
        std::visit(detail::overloaded{
            [&os](const std::string& s) {
                os << std::quoted(s);
            },
            [&os](const access& a) {
                os << "[" << a << "]";
            },
        }, part);
        prefix = " + ";
    }
    return os;
}

}
