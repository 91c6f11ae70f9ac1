#ifndef evaluator_hpp
#define evaluator_hpp

#include <cstdint> // for std::int64_t
#include <string>
#include <vector>

#include "testbed/environment.hpp"
#include "testbed/syntax.hpp"
#include "testbed/value.hpp"

namespace testbed {

class template_driver;

/// @brief Evaluates expressions against an environment.
/// @note A bare access chain evaluates to an alias of the storage it names.
///   Everything else evaluates to a value of its own.
class evaluator
{
public:
    using result = variant<value, alias>;

    /// @param templates Driver used by <code>build(...)</code>, or
    ///   <code>nullptr</code> where building isn't allowed.
    explicit evaluator(environment& env,
                       template_driver* templates = nullptr) noexcept;

    [[nodiscard]] auto evaluate(const syntax::expression& e) const -> result;

    /// @brief Evaluates the given expression to a value of its own.
    [[nodiscard]] auto evaluate_value(const syntax::expression& e) const
        -> value;

    [[nodiscard]] auto evaluate_count(const syntax::count& c) const
        -> std::int64_t;

    [[nodiscard]] auto resolve(const syntax::access& a) const -> value_view;

    /// @brief Alias for the given access chain.
    /// @note Dynamic indices are evaluated now and the alias is checked
    ///   to resolve.
    [[nodiscard]] auto make_alias(const syntax::access& a) const -> alias;

    /// @brief Resolved steps of the given access chain.
    [[nodiscard]] auto path(const syntax::access& a) const
        -> std::vector<path_step>;

    [[nodiscard]] auto stringify(const syntax::string_builder& b) const
        -> std::string;

    /// @brief Truthiness of the given access chain.
    /// @return <code>false</code> if the access can't be resolved, or
    ///   resolves to the string <code>"false"</code> or the boolean false.
    [[nodiscard]] auto is_true(const syntax::access& a) const -> bool;

    [[nodiscard]] auto variables() const noexcept -> const environment&;

private:
    environment& env;
    template_driver* templates{};
};

}

#endif /* evaluator_hpp */
