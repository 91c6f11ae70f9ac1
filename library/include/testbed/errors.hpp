#ifndef errors_hpp
#define errors_hpp

#include <cstddef> // for std::size_t
#include <optional>
#include <ostream>
#include <stdexcept> // for std::runtime_error
#include <string>

namespace testbed {

/// @brief Position within a configuration source.
struct source_position
{
    /// @brief Name of the source, usually its file path.
    std::string origin;

    /// @brief One based line number.
    std::size_t line{};

    /// @brief One based column number.
    std::size_t column{};

    auto operator==(const source_position&) const -> bool = default;
};

auto operator<<(std::ostream& os, const source_position& value)
    -> std::ostream&;

/// @brief Malformed configuration source.
struct syntax_error: std::runtime_error
{
    syntax_error(source_position where,
                 std::string found,
                 std::string expected);

    [[nodiscard]] auto where() const noexcept -> const source_position&;
    [[nodiscard]] auto found() const -> std::string;
    [[nodiscard]] auto expected() const -> std::string;

private:
    source_position where_;
    std::string found_;
    std::string expected_;
};

/// @brief Base of all the errors that abort a run after parsing.
/// @note These can be annotated after the fact with the position of the
///   statement that was being executed.
struct run_error: std::runtime_error
{
    using runtime_error::runtime_error;

    /// @brief Annotates this error with the given position.
    /// @note Only the first call has any effect so the innermost statement
    ///   is the one reported.
    auto locate(const source_position& where) -> void;

    [[nodiscard]] auto where() const noexcept
        -> const std::optional<source_position>&;

    [[nodiscard]] auto what() const noexcept -> const char* override;

private:
    std::optional<source_position> where_;
    std::string located_what_;
};

struct eval_error: run_error
{
    using run_error::run_error;
};

struct undefined_variable: eval_error
{
    using eval_error::eval_error;
};

struct redeclaration_error: eval_error
{
    using eval_error::eval_error;
};

struct type_mismatch: eval_error
{
    using eval_error::eval_error;
};

struct index_out_of_range: eval_error
{
    using eval_error::eval_error;
};

struct field_not_found: eval_error
{
    using eval_error::eval_error;
};

struct shape_mismatch: eval_error
{
    using eval_error::eval_error;
};

struct load_error: run_error
{
    using run_error::run_error;
};

struct render_error: run_error
{
    using run_error::run_error;
};

struct spawn_error: run_error
{
    using run_error::run_error;
};

struct interrupted_error: run_error
{
    using run_error::run_error;
};

}

#endif /* errors_hpp */
