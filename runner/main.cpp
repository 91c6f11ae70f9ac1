#include <charconv> // for std::from_chars
#include <chrono>
#include <exception> // for std::exception
#include <filesystem>
#include <fstream>
#include <iomanip> // for std::quoted
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept> // for std::invalid_argument
#include <string>
#include <string_view>
#include <utility> // for std::move
#include <vector>

#include "testbed/identifier.hpp"
#include "testbed/parser.hpp"
#include "testbed/runner.hpp"
#include "testbed/signal.hpp"

namespace {

constexpr auto program_name = "testbed";
constexpr auto exit_failure_code = 1;
constexpr auto exit_usage_code = 2;

const auto commands_prefix = std::string{"--commands="};
const auto output_prefix = std::string{"--output="};
const auto poll_prefix = std::string{"--poll="};
const auto parse_only_argument = std::string{"--parse-only"};
const auto quiet_argument = std::string{"--quiet"};
const auto help_argument = std::string{"--help"};

auto usage(std::ostream& os) -> void
{
    os << "usage: " << program_name;
    os << " [" << commands_prefix << "<name>]...";
    os << " [" << output_prefix << "<dir>]";
    os << " [" << poll_prefix << "<ms>]";
    os << " [" << parse_only_argument << "]";
    os << " [" << quiet_argument << "]";
    os << " [" << help_argument << "]";
    os << " <file>\n";
}

auto parse_milliseconds(std::string_view text)
    -> std::optional<std::chrono::milliseconds>
{
    auto count = 0;
    const auto last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, count);
    if (ec != std::errc{} || ptr != last || count <= 0) {
        return {};
    }
    return std::chrono::milliseconds{count};
}

auto show_summary(std::ostream& os, const testbed::syntax::program& program)
    -> void
{
    for (auto&& dir: program.includes) {
        os << "include " << dir << "\n";
    }
    if (!program.output.empty()) {
        os << "output " << program.output << "\n";
    }
    os << "globals: " << size(program.globals) << " statement(s)\n";
    for (auto&& section: program.templates) {
        os << "template." << section.name << ": ";
        os << size(section.body) << " statement(s)\n";
    }
    for (auto&& section: program.commands) {
        os << (section.name.get().empty()? "commands": "commands.");
        os << section.name << ": ";
        os << size(section.body) << " statement(s)\n";
    }
}

}

auto main(int argc, const char * argv[]) -> int
{
    auto options = testbed::run_options{};
    auto parse_only = false;
    auto quiet = false;
    auto file = std::string{};
    for (auto&& arg: std::span(argv, static_cast<std::size_t>(argc)).subspan(1u)) {
        const auto value = std::string_view{arg};
        if (value == help_argument) {
            usage(std::cout);
            return 0;
        }
        if (value.starts_with(commands_prefix)) {
            if (!options.commands) {
                options.commands.emplace();
            }
            options.commands->emplace_back(value.substr(size(commands_prefix)));
            continue;
        }
        if (value.starts_with(output_prefix)) {
            options.output = std::filesystem::path{value.substr(size(output_prefix))};
            continue;
        }
        if (value.starts_with(poll_prefix)) {
            const auto interval = parse_milliseconds(value.substr(size(poll_prefix)));
            if (!interval) {
                std::cerr << program_name << ": bad poll interval ";
                std::cerr << std::quoted(value) << "\n";
                usage(std::cerr);
                return exit_usage_code;
            }
            options.poll_interval = *interval;
            continue;
        }
        if (value == parse_only_argument) {
            parse_only = true;
            continue;
        }
        if (value == quiet_argument) {
            quiet = true;
            continue;
        }
        if (value.starts_with("-") || !file.empty()) {
            std::cerr << program_name << ": unrecognized argument ";
            std::cerr << std::quoted(value) << "\n";
            usage(std::cerr);
            return exit_usage_code;
        }
        file = value;
    }
    if (file.empty()) {
        std::cerr << program_name << ": no file specified\n";
        usage(std::cerr);
        return exit_usage_code;
    }

    try {
        auto program = testbed::parse_file(file);
        if (parse_only) {
            show_summary(std::cout, program);
            return 0;
        }
        auto null_stream = std::ofstream{};
        if (quiet) {
            null_stream.open("/dev/null");
            options.process_diags = &null_stream;
        }
        testbed::reset_signal_handler(testbed::signals::child());
        testbed::set_signal_handler(testbed::signals::interrupt());
        testbed::set_signal_handler(testbed::signals::terminate());
        testbed::sigsafe_counter_reset();
        auto runner = std::optional<testbed::runner>{};
        try {
            runner.emplace(std::move(program), std::cout, std::move(options));
        }
        catch (const std::invalid_argument& ex) {
            std::cerr << program_name << ": " << ex.what() << "\n";
            usage(std::cerr);
            return exit_usage_code;
        }
        runner->run();
    }
    catch (const std::exception& ex) {
        std::cout.flush();
        std::cerr << program_name << ": " << ex.what() << "\n";
        return exit_failure_code;
    }
    return 0;
}
