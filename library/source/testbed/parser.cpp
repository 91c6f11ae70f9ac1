#include <algorithm> // for std::find
#include <fstream>
#include <iterator> // for std::istreambuf_iterator
#include <set>
#include <sstream> // for std::ostringstream
#include <utility> // for std::move

#include "testbed/lexer.hpp"
#include "testbed/parser.hpp"

namespace testbed {

namespace {

enum class block_kind { globals, templates, commands };

auto operator<<(std::ostream& os, block_kind value) -> std::ostream&
{
    switch (value) {
    case block_kind::globals:
        os << "the globals block";
        break;
    case block_kind::templates:
        os << "template blocks";
        break;
    case block_kind::commands:
        os << "commands blocks";
        break;
    }
    return os;
}

/// @brief Order in which sections must appear.
enum class section_kind: int { includes, output, globals, templates, commands };

/// @brief Canonical paths of the files currently being parsed.
using include_stack = std::vector<std::filesystem::path>;

auto parse_unit(std::string_view text,
                const std::string& origin,
                const std::filesystem::path& base,
                include_stack& including,
                bool require_commands) -> syntax::program;

auto read_file(const std::filesystem::path& path) -> std::string
{
    std::ifstream stream{path};
    if (!stream) {
        throw syntax_error{source_position{path.string(), 0u, 0u},
            "unreadable file " + path.string(), "a readable configuration file"};
    }
    return {std::istreambuf_iterator<char>(stream),
            std::istreambuf_iterator<char>()};
}

auto merge(syntax::program& into, syntax::program&& from) -> void
{
    for (auto&& dir: from.includes) {
        into.includes.push_back(std::move(dir));
    }
    if (!from.output.empty()) {
        into.output = std::move(from.output);
    }
    for (auto&& s: from.globals) {
        into.globals.push_back(std::move(s));
    }
    for (auto&& s: from.templates) {
        into.templates.push_back(std::move(s));
    }
    for (auto&& s: from.commands) {
        into.commands.push_back(std::move(s));
    }
}

auto check_unique(const std::vector<syntax::section>& sections,
                  const std::string& kind) -> void
{
    auto names = std::set<identifier>{};
    for (auto&& s: sections) {
        if (!names.insert(s.name).second) {
            std::ostringstream os;
            os << "second " << kind;
            if (!s.name.get().empty()) {
                os << "." << s.name;
            }
            os << " section";
            throw syntax_error{s.where, os.str(), "uniquely named sections"};
        }
    }
}

class parser
{
public:
    parser(std::vector<token> t,
           std::filesystem::path b,
           include_stack& i):
        tokens{std::move(t)}, base{std::move(b)}, including{i}
    {
        // Intentionally empty.
    }

    auto parse_program(bool require_commands) -> syntax::program;
    auto parse_lone_access() -> syntax::access;

private:
    using kind = token::kind;

    [[nodiscard]] auto peek(std::size_t ahead = 0u) const noexcept
        -> const token&
    {
        const auto at = pos + ahead;
        return tokens[(at < tokens.size())? at: tokens.size() - 1u];
    }

    auto next() noexcept -> const token&
    {
        const auto& result = peek();
        if (pos + 1u < tokens.size()) {
            ++pos;
        }
        return result;
    }

    [[nodiscard]] auto is(kind k, std::size_t ahead = 0u) const noexcept
        -> bool
    {
        return peek(ahead).type == k;
    }

    [[nodiscard]] auto is_word(std::string_view word,
                               std::size_t ahead = 0u) const noexcept -> bool
    {
        return is(kind::identifier, ahead) && (peek(ahead).text == word);
    }

    auto accept(kind k) noexcept -> bool
    {
        if (is(k)) {
            next();
            return true;
        }
        return false;
    }

    [[noreturn]] auto fail(const std::string& expected) const -> void
    {
        throw syntax_error{peek().where, describe(peek()), expected};
    }

    auto expect(kind k) -> const token&
    {
        if (!is(k)) {
            std::ostringstream os;
            os << k;
            fail(os.str());
        }
        return next();
    }

    auto expect_word(std::string_view word) -> void
    {
        if (!is_word(word)) {
            fail("'" + std::string(word) + "'");
        }
        next();
    }

    auto parse_identifier() -> identifier
    {
        return identifier{expect(kind::identifier).text};
    }

    auto require(block_kind actual, block_kind needed,
                 const token& keyword) const -> void
    {
        if (actual != needed) {
            std::ostringstream os;
            os << "a statement allowed in " << actual;
            throw syntax_error{keyword.where,
                "'" + keyword.text + "' statement", os.str()};
        }
    }

    auto parse_section_header() -> std::pair<section_kind, syntax::section>;
    auto parse_includes(syntax::program& result) -> void;
    auto parse_section_body(block_kind k) -> syntax::block;
    auto parse_braced_block(block_kind k) -> syntax::block;
    auto parse_statement(block_kind k) -> syntax::statement;
    auto parse_conditional(block_kind k) -> syntax::conditional;
    auto parse_loop(block_kind k) -> syntax::loop;
    auto parse_spawn() -> syntax::spawn_statement;
    auto parse_output_map() -> syntax::output_map;
    auto parse_wait_for() -> syntax::wait_for_statement;
    auto parse_assignment_or_push(block_kind k) -> syntax::statement::variant_type;
    auto parse_expression(block_kind k, bool allow_object = true)
        -> syntax::expression;
    auto parse_bracketed(block_kind k, bool allow_object)
        -> syntax::expression::variant_type;
    auto parse_list(block_kind k) -> syntax::list_literal;
    auto parse_object_fields(block_kind k)
        -> std::vector<syntax::field_initializer>;
    auto parse_field_initializer(block_kind k) -> syntax::field_initializer;
    auto parse_string_builder() -> syntax::string_builder;
    auto continue_string_builder(syntax::string_builder& result) -> void;
    auto parse_string_operand() -> syntax::string_part;
    auto try_interpolation() -> std::optional<syntax::access>;
    auto parse_access() -> syntax::access;
    auto parse_count() -> syntax::count;

    std::vector<token> tokens;
    std::size_t pos{};
    std::filesystem::path base;
    include_stack& including;
};

auto parser::parse_program(bool require_commands) -> syntax::program
{
    auto result = syntax::program{};
    auto last = std::optional<section_kind>{};
    while (!is(kind::end)) {
        const auto header_token = peek(1u);
        auto [section, header] = parse_section_header();
        if (last && ((section < *last) ||
                     ((section == *last) && (section < section_kind::templates)))) {
            throw syntax_error{header.where,
                "section " + header_token.text + " out of order",
                "sections in the order includes, output, globals, templates, commands"};
        }
        last = section;
        switch (section) {
        case section_kind::includes:
            parse_includes(result);
            break;
        case section_kind::output:
            result.output = expect(kind::string).text;
            expect(kind::semicolon);
            break;
        case section_kind::globals:
            for (auto&& s: parse_section_body(block_kind::globals)) {
                result.globals.push_back(std::move(s));
            }
            break;
        case section_kind::templates:
            header.body = parse_section_body(block_kind::templates);
            result.templates.push_back(std::move(header));
            break;
        case section_kind::commands:
            header.body = parse_section_body(block_kind::commands);
            result.commands.push_back(std::move(header));
            break;
        }
    }
    if (require_commands && result.commands.empty()) {
        fail("a [commands] section");
    }
    return result;
}

auto parser::parse_lone_access() -> syntax::access
{
    auto result = parse_access();
    expect(kind::end);
    return result;
}

auto parser::parse_section_header() -> std::pair<section_kind, syntax::section>
{
    auto header = syntax::section{};
    header.where = peek().where;
    expect(kind::left_bracket);
    const auto& word = expect(kind::identifier);
    auto section = section_kind{};
    if (word.text == "includes") {
        section = section_kind::includes;
    }
    else if (word.text == "output") {
        section = section_kind::output;
    }
    else if (word.text == "globals") {
        section = section_kind::globals;
    }
    else if (word.text == "template") {
        section = section_kind::templates;
    }
    else if (word.text == "commands") {
        section = section_kind::commands;
    }
    else {
        throw syntax_error{word.where, describe(word),
            "one of includes, output, globals, template or commands"};
    }
    if (section == section_kind::templates) {
        expect(kind::dot);
        header.name = parse_identifier();
    }
    else if (section == section_kind::commands) {
        if (accept(kind::dot)) {
            header.name = parse_identifier();
        }
    }
    expect(kind::right_bracket);
    return {section, std::move(header)};
}

auto parser::parse_includes(syntax::program& result) -> void
{
    while (is(kind::string)) {
        const auto& t = next();
        auto path = base / std::filesystem::path{t.text};
        expect(kind::semicolon);
        auto ec = std::error_code{};
        if (!std::filesystem::is_regular_file(path, ec)) {
            result.includes.push_back(std::move(path));
            continue;
        }
        const auto canonical = std::filesystem::weakly_canonical(path, ec);
        const auto& key = ec? path: canonical;
        if (std::find(begin(including), end(including), key) != end(including)) {
            throw syntax_error{t.where, "include cycle through " + key.string(),
                "an include of a file that isn't already being included"};
        }
        including.push_back(key);
        auto unit = parse_unit(read_file(path), path.string(),
                               path.parent_path(), including, false);
        including.pop_back();
        merge(result, std::move(unit));
    }
}

auto parser::parse_section_body(block_kind k) -> syntax::block
{
    auto result = syntax::block{};
    while (!is(kind::end) && !is(kind::left_bracket)) {
        result.push_back(parse_statement(k));
    }
    return result;
}

auto parser::parse_braced_block(block_kind k) -> syntax::block
{
    expect(kind::left_brace);
    auto result = syntax::block{};
    while (!accept(kind::right_brace)) {
        if (is(kind::end)) {
            fail("'}'");
        }
        result.push_back(parse_statement(k));
    }
    return result;
}

auto parser::parse_statement(block_kind k) -> syntax::statement
{
    const auto keyword = peek();
    auto result = syntax::statement{};
    result.where = keyword.where;
    if (keyword.type != kind::identifier) {
        fail("a statement");
    }
    const auto& word = keyword.text;
    if (word == "if") {
        result.node = parse_conditional(k);
        return result;
    }
    if (word == "for") {
        result.node = parse_loop(k);
        return result;
    }
    if (word == "print" && is(kind::left_paren, 1u)) {
        next();
        expect(kind::left_paren);
        auto value = parse_expression(k);
        expect(kind::right_paren);
        expect(kind::semicolon);
        result.node = syntax::print_statement{std::move(value)};
        return result;
    }
    if (word == "yield") {
        require(k, block_kind::templates, keyword);
        next();
        auto value = parse_expression(k);
        expect(kind::semicolon);
        result.node = syntax::yield_statement{std::move(value)};
        return result;
    }
    if (word == "limit") {
        require(k, block_kind::commands, keyword);
        next();
        result.node = syntax::limit_statement{parse_count()};
        expect(kind::semicolon);
        return result;
    }
    if (word == "sleep") {
        require(k, block_kind::commands, keyword);
        next();
        result.node = syntax::sleep_statement{parse_count()};
        expect(kind::semicolon);
        return result;
    }
    if (word == "wait_all") {
        require(k, block_kind::commands, keyword);
        next();
        auto statement = syntax::wait_all_statement{};
        if (!is(kind::semicolon)) {
            statement.timeout = parse_count();
        }
        expect(kind::semicolon);
        result.node = std::move(statement);
        return result;
    }
    if (word == "wait_for") {
        require(k, block_kind::commands, keyword);
        result.node = parse_wait_for();
        return result;
    }
    if (word == "kill") {
        require(k, block_kind::commands, keyword);
        next();
        result.node = syntax::kill_statement{parse_count()};
        expect(kind::semicolon);
        return result;
    }
    if (word == "spawn") {
        require(k, block_kind::commands, keyword);
        result.node = parse_spawn();
        return result;
    }
    result.node = parse_assignment_or_push(k);
    return result;
}

auto parser::parse_conditional(block_kind k) -> syntax::conditional
{
    expect_word("if");
    auto result = syntax::conditional{};
    result.conditions.push_back(parse_access());
    while (!is(kind::left_brace)) {
        accept(kind::comma);
        result.conditions.push_back(parse_access());
    }
    result.body = parse_braced_block(k);
    return result;
}

auto parser::parse_loop(block_kind k) -> syntax::loop
{
    expect_word("for");
    auto result = syntax::loop{};
    if (is_word("group") && !is_word("in", 1u)) {
        next();
        result.kind = syntax::loop_kind::group;
    }
    if (accept(kind::left_paren)) {
        do {
            result.variables.push_back(parse_identifier());
        } while (accept(kind::comma));
        expect(kind::right_paren);
    }
    else {
        result.variables.push_back(parse_identifier());
    }
    const auto in_position = peek().where;
    expect_word("in");
    if (accept(kind::left_paren)) {
        do {
            result.iterables.push_back(parse_expression(k, false));
        } while (accept(kind::comma));
        expect(kind::right_paren);
    }
    else {
        result.iterables.push_back(parse_expression(k, false));
    }
    if (result.variables.size() != result.iterables.size()) {
        std::ostringstream os;
        os << result.variables.size() << " loop variables and ";
        os << result.iterables.size() << " iterables";
        throw syntax_error{in_position, os.str(),
            "as many iterables as loop variables"};
    }
    result.body = parse_braced_block(k);
    return result;
}

auto parser::parse_spawn() -> syntax::spawn_statement
{
    expect_word("spawn");
    auto result = syntax::spawn_statement{};
    if (is(kind::integer)) {
        result.id = next().integer;
    }
    auto seen = std::set<std::string>{};
    while (is(kind::identifier) && is(kind::left_paren, 1u)) {
        const auto& option = peek();
        if (option.text != "dir" && option.text != "stdout" &&
            option.text != "stderr") {
            fail("one of dir(, stdout( or stderr(, or the program");
        }
        if (!seen.insert(option.text).second) {
            fail("at most one " + option.text + "(...) option");
        }
        next();
        expect(kind::left_paren);
        if (option.text == "dir") {
            result.directory = parse_string_builder();
        }
        else if (option.text == "stdout") {
            result.out = parse_output_map();
        }
        else {
            result.err = parse_output_map();
        }
        expect(kind::right_paren);
    }
    result.program = parse_string_builder();
    while (!accept(kind::semicolon)) {
        if (accept(kind::left_brace)) {
            result.arguments.emplace_back(parse_access());
            expect(kind::right_brace);
        }
        else if (is(kind::string) || is(kind::left_bracket)) {
            result.arguments.emplace_back(parse_string_builder());
        }
        else {
            fail("an argument or ';'");
        }
    }
    return result;
}

auto parser::parse_output_map() -> syntax::output_map
{
    using mode = syntax::output_map::mode;
    if (is_word("print")) {
        next();
        return {mode::inherit, {}};
    }
    if (is_word("append")) {
        next();
        expect(kind::left_paren);
        auto path = parse_string_builder();
        expect(kind::right_paren);
        return {mode::append, std::move(path)};
    }
    return {mode::truncate, parse_string_builder()};
}

auto parser::parse_wait_for() -> syntax::wait_for_statement
{
    expect_word("wait_for");
    auto result = syntax::wait_for_statement{parse_count(), {}, {}};
    if (!is(kind::semicolon)) {
        result.timeout = parse_count();
        result.retries = parse_count();
    }
    expect(kind::semicolon);
    return result;
}

auto parser::parse_assignment_or_push(block_kind k)
    -> syntax::statement::variant_type
{
    auto target = parse_access();
    if (is(kind::equals) || is(kind::colon_equals)) {
        if (!target.steps.empty()) {
            fail("'.push(' since only variables can be assigned");
        }
        const auto how = (next().type == kind::equals)
            ? syntax::assignment_kind::declare
            : syntax::assignment_kind::reassign;
        auto value = parse_expression(k);
        expect(kind::semicolon);
        return syntax::assignment{std::move(target.head), how, std::move(value)};
    }
    if (!target.steps.empty() && is(kind::left_paren)) {
        const auto p = std::get_if<syntax::field_step>(&target.steps.back());
        if (p && p->name.get() == "push") {
            target.steps.pop_back();
            next();
            auto value = parse_expression(k);
            expect(kind::right_paren);
            expect(kind::semicolon);
            return syntax::push_statement{std::move(target), std::move(value)};
        }
    }
    fail("'=', ':=' or '.push('");
}

auto parser::parse_expression(block_kind k, bool allow_object)
    -> syntax::expression
{
    auto result = syntax::expression{};
    result.where = peek().where;
    const auto& t = peek();
    switch (t.type) {
    case kind::star:
        next();
        result.node = syntax::clone{parse_access()};
        return result;
    case kind::integer: {
        const auto first = next().integer;
        if (accept(kind::dot_dot)) {
            result.node = syntax::range_literal{first, parse_count()};
        }
        else {
            result.node = syntax::integer_literal{first};
        }
        return result;
    }
    case kind::string: {
        auto builder = parse_string_builder();
        if (allow_object && is(kind::left_brace)) {
            result.node = syntax::object_literal{std::move(builder),
                parse_object_fields(k)};
        }
        else {
            result.node = std::move(builder);
        }
        return result;
    }
    case kind::left_bracket:
        result.node = parse_bracketed(k, allow_object);
        return result;
    case kind::identifier:
        if (t.text == "load" && is(kind::left_paren, 1u)) {
            next();
            expect(kind::left_paren);
            auto path = parse_string_builder();
            expect(kind::right_paren);
            result.node = syntax::load_call{std::move(path)};
            return result;
        }
        if (t.text == "build" && is(kind::left_paren, 1u)) {
            require(k, block_kind::templates, t);
            next();
            expect(kind::left_paren);
            auto call = syntax::build_call{};
            call.template_path = parse_string_builder();
            expect(kind::comma);
            call.output_path = parse_string_builder();
            while (accept(kind::comma)) {
                call.properties.push_back(parse_field_initializer(k));
            }
            expect(kind::right_paren);
            result.node = std::move(call);
            return result;
        }
        result.node = parse_access();
        return result;
    default:
        break;
    }
    fail("an expression");
}

auto parser::parse_bracketed(block_kind k, bool allow_object)
    -> syntax::expression::variant_type
{
    auto interpolated = try_interpolation();
    if (!interpolated) {
        return parse_list(k);
    }
    if (accept(kind::dot_dot)) {
        return syntax::range_literal{std::move(*interpolated), parse_count()};
    }
    auto builder = syntax::string_builder{};
    builder.parts.emplace_back(std::move(*interpolated));
    continue_string_builder(builder);
    if (allow_object && is(kind::left_brace)) {
        return syntax::object_literal{std::move(builder),
            parse_object_fields(k)};
    }
    return builder;
}

auto parser::parse_list(block_kind k) -> syntax::list_literal
{
    expect(kind::left_bracket);
    auto result = syntax::list_literal{};
    while (!accept(kind::right_bracket)) {
        result.elements.push_back(parse_expression(k));
        if (!accept(kind::comma) && !is(kind::right_bracket)) {
            fail("',' or ']'");
        }
    }
    return result;
}

auto parser::parse_object_fields(block_kind k)
    -> std::vector<syntax::field_initializer>
{
    expect(kind::left_brace);
    auto result = std::vector<syntax::field_initializer>{};
    while (!accept(kind::right_brace)) {
        result.push_back(parse_field_initializer(k));
        if (!accept(kind::comma) && !is(kind::right_brace)) {
            fail("',' or '}'");
        }
    }
    return result;
}

auto parser::parse_field_initializer(block_kind k)
    -> syntax::field_initializer
{
    auto name = parse_identifier();
    expect(kind::equals);
    return syntax::field_initializer{std::move(name), parse_expression(k)};
}

auto parser::parse_string_builder() -> syntax::string_builder
{
    auto result = syntax::string_builder{};
    result.parts.push_back(parse_string_operand());
    continue_string_builder(result);
    return result;
}

auto parser::continue_string_builder(syntax::string_builder& result) -> void
{
    while (accept(kind::plus)) {
        result.parts.push_back(parse_string_operand());
    }
}

auto parser::parse_string_operand() -> syntax::string_part
{
    if (is(kind::string)) {
        return next().text;
    }
    if (is(kind::left_bracket)) {
        if (auto interpolated = try_interpolation()) {
            return std::move(*interpolated);
        }
        fail("an interpolation like [name]");
    }
    fail("a string or an interpolation like [name]");
}

auto parser::try_interpolation() -> std::optional<syntax::access>
{
    const auto saved = pos;
    expect(kind::left_bracket);
    if (is(kind::identifier)) {
        auto result = parse_access();
        if (accept(kind::right_bracket)) {
            return result;
        }
    }
    pos = saved;
    return {};
}

auto parser::parse_access() -> syntax::access
{
    auto result = syntax::access{};
    result.head = parse_identifier();
    for (;;) {
        if (is(kind::dot) && is(kind::identifier, 1u)) {
            next();
            result.steps.emplace_back(syntax::field_step{parse_identifier()});
        }
        else if (is(kind::left_bracket) &&
                 (is(kind::integer, 1u) || is(kind::identifier, 1u))) {
            next();
            if (is(kind::integer)) {
                result.steps.emplace_back(syntax::index_step{next().integer});
            }
            else {
                result.steps.emplace_back(syntax::index_step{
                    syntax::box<syntax::access>{parse_access()}});
            }
            expect(kind::right_bracket);
        }
        else {
            break;
        }
    }
    return result;
}

auto parser::parse_count() -> syntax::count
{
    if (is(kind::integer)) {
        return next().integer;
    }
    if (is(kind::left_bracket)) {
        if (auto interpolated = try_interpolation()) {
            return std::move(*interpolated);
        }
    }
    fail("an integer or an interpolation like [name]");
}

auto parse_unit(std::string_view text,
                const std::string& origin,
                const std::filesystem::path& base,
                include_stack& including,
                bool require_commands) -> syntax::program
{
    auto p = parser{tokenize(text, origin), base, including};
    return p.parse_program(require_commands);
}

}

auto parse(std::string_view text,
           const std::string& origin,
           const std::filesystem::path& base) -> syntax::program
{
    auto including = include_stack{};
    auto result = parse_unit(text, origin, base, including, true);
    check_unique(result.templates, "template");
    check_unique(result.commands, "commands");
    return result;
}

auto parse_file(const std::filesystem::path& path) -> syntax::program
{
    auto ec = std::error_code{};
    const auto canonical = std::filesystem::weakly_canonical(path, ec);
    auto including = include_stack{ec? path: canonical};
    auto result = parse_unit(read_file(path), path.string(),
                             path.parent_path(), including, true);
    check_unique(result.templates, "template");
    check_unique(result.commands, "commands");
    return result;
}

auto parse_access(std::string_view text, const std::string& origin)
    -> syntax::access
{
    auto including = include_stack{};
    auto p = parser{tokenize(text, origin), {}, including};
    return p.parse_lone_access();
}

}
