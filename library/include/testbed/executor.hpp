#ifndef executor_hpp
#define executor_hpp

#include <ostream>

#include "testbed/environment.hpp"
#include "testbed/evaluator.hpp"
#include "testbed/syntax.hpp"

namespace testbed {

class scheduler;
class template_driver;

/// @brief Executes statements against an environment.
/// @note Errors propagate out of <code>execute</code> annotated with the
///   position of the innermost statement that was running.
class executor
{
public:
    /// @param diags Stream that <code>print</code> writes to.
    /// @param templates Driver for template-only statements, if any.
    /// @param processes Scheduler for commands-only statements, if any.
    executor(environment& env, std::ostream& diags,
             template_driver* templates = nullptr,
             scheduler* processes = nullptr);

    auto execute(const syntax::block& statements) -> void;

    auto execute(const syntax::statement& s) -> void;

private:
    auto execute(const syntax::loop& l) -> void;
    auto execute(const syntax::spawn_statement& s) -> void;
    [[nodiscard]] auto require_scheduler() const -> scheduler&;
    [[nodiscard]] auto require_driver() const -> template_driver&;

    environment& env;
    std::ostream& diags;
    template_driver* templates{};
    scheduler* processes{};
    evaluator eval;
};

}

#endif /* executor_hpp */
