#include "./dispatch_main.hpp"

#include "./error_handler.hpp"
#include "./options.hpp"

#include <urnkit/error/on_error.hpp>
#include <urnkit/util/log.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <fmt/ostream.h>
#include <neo/assert.hpp>

#include <iostream>
#include <optional>

using namespace urnkit;

namespace urnkit::cli {

namespace cmd {
using command = int(const options&);

command parse;
command compose;
command validate;
command normalize;
command get;
command vendor;
command attrs;
command set;
command remove;
command generate;

}  // namespace cmd

int dispatch_main(const options& opts) noexcept {
    return urnkit::handle_cli_errors([&] {
        URNKIT_E_SCOPE(opts.subcommand);
        switch (opts.subcommand) {
        case subcommand::parse:
            return cmd::parse(opts);
        case subcommand::compose:
            return cmd::compose(opts);
        case subcommand::validate:
            return cmd::validate(opts);
        case subcommand::normalize:
            return cmd::normalize(opts);
        case subcommand::get:
            return cmd::get(opts);
        case subcommand::vendor:
            return cmd::vendor(opts);
        case subcommand::attrs:
            return cmd::attrs(opts);
        case subcommand::set:
            return cmd::set(opts);
        case subcommand::remove:
            return cmd::remove(opts);
        case subcommand::generate:
            return cmd::generate(opts);
        case subcommand::_none_:;
        }
        neo::unreachable();
    });
}

int main_fn(std::string_view program_name, const std::vector<std::string>& argv) {
    options opts;

    auto result = boost::leaf::try_catch(
        [&]() -> std::optional<int> {
            opts.parse_argv(argv);
            return std::nullopt;
        },
        [&](const help_request&) {
            std::cout << options::help_string(program_name);
            return 0;
        },
        [&](const unrecognized_argument& exc, e_arg_spelling arg) {
            std::cerr << options::usage_string(program_name) << '\n';
            fmt::print(std::cerr, "{} (Got \"{}\")\n", exc.what(), arg.value);
            return 2;
        },
        [&](const invalid_arguments& exc) {
            std::cerr << options::usage_string(program_name) << '\n';
            fmt::print(std::cerr, "Error: {}\n", exc.what());
            return 2;
        });
    if (result) {
        // Argument parsing decided the exit code on its own
        return *result;
    }

    log::init_logger(opts.use_color);
    log::current_log_level = opts.log_level;
    return dispatch_main(opts);
}

}  // namespace urnkit::cli
