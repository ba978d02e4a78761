#include "./options.hpp"

#include <urnkit/util/env.hpp>

#include <boost/leaf/exception.hpp>
#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <neo/assert.hpp>

using namespace urnkit;
using namespace urnkit::cli;

namespace po = boost::program_options;

namespace urnkit::log {

// Found by Boost.program_options to convert the value of '--log-level'
void validate(boost::any& out, const std::vector<std::string>& given, level*, int) {
    po::validators::check_first_occurrence(out);
    auto& spelling = po::validators::get_single_string(given);
    auto  lvl      = level_from_string(spelling);
    if (!lvl) {
        throw po::invalid_option_value(spelling);
    }
    out = *lvl;
}

}  // namespace urnkit::log

namespace {

struct subcommand_info {
    enum subcommand  cmd;
    std::string_view name;
    std::string_view args;
    std::string_view help;
    int              min_positional;
    // Negative for "no limit"
    int max_positional;
};

constexpr subcommand_info subcommands[] = {
    {subcommand::parse, "parse", "<urn> [--json]", "Print the components of a URN", 1, 1},
    {subcommand::compose,
     "compose",
     "<entity> <id> [<key>=<value> ...]",
     "Compose a URN from its components",
     2,
     -1},
    {subcommand::validate,
     "validate",
     "<urn> [<urn> ...]",
     "Check URNs, explaining any that are invalid",
     1,
     -1},
    {subcommand::normalize, "normalize", "<urn>", "Lowercase the entity of a URN", 1, 1},
    {subcommand::get, "get", "<urn> <key>", "Print the value of an attribute", 2, 2},
    {subcommand::vendor, "vendor", "<urn>", "Print the 'vendor' attribute", 1, 1},
    {subcommand::attrs, "attrs", "<urn> [--json]", "Print every attribute of a URN", 1, 1},
    {subcommand::set, "set", "<urn> <key> <value>", "Add or replace an attribute", 3, 3},
    {subcommand::remove, "remove", "<urn> <key>", "Remove an attribute", 2, 2},
    {subcommand::generate,
     "generate",
     "<entity> [--count <n>]",
     "Generate URNs with random UUID identifiers",
     1,
     1},
};

const subcommand_info* find_subcommand(std::string_view name) noexcept {
    for (auto& info : subcommands) {
        if (info.name == name) {
            return &info;
        }
    }
    return nullptr;
}

const subcommand_info& info_for(enum subcommand cmd) noexcept {
    for (auto& info : subcommands) {
        if (info.cmd == cmd) {
            return info;
        }
    }
    neo::unreachable();
}

/**
 * The flags accepted by urnkit. Used both to parse argv and to render help.
 */
po::options_description flag_options() {
    po::options_description desc{"Options"};
    // clang-format off
    desc.add_options()
        ("help,h", "Print this help message and exit")
        ("log-level",
         po::value<log::level>()->value_name("<level>"),
         "Minimum level of log messages to print (trace, debug, info, warn, error, critical, "
         "silent)")
        ("no-color", po::bool_switch(), "Do not color log output")
        ("json", po::bool_switch(), "Print JSON output ('parse' and 'attrs' only)")
        ("count", po::value<int>()->value_name("<n>"), "Number of URNs to emit ('generate' only)");
    // clang-format on
    return desc;
}

po::variables_map parse_flags(const std::vector<std::string>& argv) {
    po::options_description positional_opts;
    positional_opts.add_options()                               //
        ("subcommand", po::value<std::string>())                //
        ("args", po::value<std::vector<std::string>>());
    po::options_description all_opts;
    all_opts.add(flag_options()).add(positional_opts);

    po::positional_options_description positional;
    positional.add("subcommand", 1).add("args", -1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argv).options(all_opts).positional(positional).run(), vm);
    } catch (const po::unknown_option& exc) {
        BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument(
                                       fmt::format("Unrecognized argument '{}'",
                                                   exc.get_option_name())),
                                   e_arg_spelling{exc.get_option_name()});
    } catch (const po::error& exc) {
        BOOST_LEAF_THROW_EXCEPTION(invalid_arguments(exc.what()));
    }
    return vm;
}

// Reject a flag that was given to a subcommand that does not take it
void reject_flag_for(std::string_view flag, enum subcommand cmd) {
    BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument(
                                   fmt::format("'{}' does not accept '{}'",
                                               cli::subcommand_name(cmd),
                                               flag)),
                               e_arg_spelling{std::string(flag)});
}

}  // namespace

std::string_view cli::subcommand_name(enum subcommand cmd) noexcept {
    if (cmd == subcommand::_none_) {
        return "<none>";
    }
    return info_for(cmd).name;
}

void options::parse_argv(const std::vector<string>& argv) {
    auto vm = parse_flags(argv);
    if (vm.count("help")) {
        throw help_request();
    }

    if (vm.count("log-level")) {
        log_level = vm["log-level"].as<log::level>();
    }
    if (vm["no-color"].as<bool>()) {
        use_color = false;
    }

    if (!vm.count("subcommand")) {
        BOOST_LEAF_THROW_EXCEPTION(missing_required("A subcommand is required"));
    }
    auto sub_str = vm["subcommand"].as<std::string>();
    auto info    = find_subcommand(sub_str);
    if (!info) {
        BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument(
                                       fmt::format("Unknown subcommand '{}'", sub_str)),
                                   e_arg_spelling{sub_str});
    }
    subcommand = info->cmd;

    json = vm["json"].as<bool>();
    if (json && subcommand != subcommand::parse && subcommand != subcommand::attrs) {
        reject_flag_for("--json", subcommand);
    }
    if (vm.count("count")) {
        if (subcommand != subcommand::generate) {
            reject_flag_for("--count", subcommand);
        }
        generate.count = vm["count"].as<int>();
        if (generate.count < 1) {
            BOOST_LEAF_THROW_EXCEPTION(
                invalid_arguments(fmt::format("'--count' must be at least 1 (Got {})",
                                              generate.count)),
                e_arg_spelling{"--count"});
        }
    }

    std::vector<std::string> positional;
    if (vm.count("args")) {
        positional = vm["args"].as<std::vector<std::string>>();
    }
    const int n_pos = static_cast<int>(positional.size());
    if (n_pos < info->min_positional) {
        BOOST_LEAF_THROW_EXCEPTION(
            missing_required(fmt::format("'{}' expects the arguments {}", info->name, info->args)));
    }
    if (info->max_positional >= 0 && n_pos > info->max_positional) {
        BOOST_LEAF_THROW_EXCEPTION(unrecognized_argument(
                                       fmt::format("Unexpected argument '{}' for '{}'",
                                                   positional[info->max_positional],
                                                   info->name)),
                                   e_arg_spelling{positional[info->max_positional]});
    }

    switch (subcommand) {
    case subcommand::compose:
        compose.entity = positional[0];
        compose.id     = positional[1];
        compose.attrs.assign(positional.begin() + 2, positional.end());
        for (auto& attr : compose.attrs) {
            if (attr.find('=') == attr.npos) {
                BOOST_LEAF_THROW_EXCEPTION(invalid_arguments(
                    fmt::format("Attribute '{}' must be given as <key>=<value>", attr)));
            }
        }
        return;
    case subcommand::validate:
        validate.urns = positional;
        return;
    case subcommand::generate:
        generate.entity = positional[0];
        return;
    case subcommand::set:
        set.value = positional[2];
        [[fallthrough]];
    case subcommand::get:
    case subcommand::remove:
        key = positional[1];
        [[fallthrough]];
    case subcommand::parse:
    case subcommand::normalize:
    case subcommand::vendor:
    case subcommand::attrs:
        urn_str = positional[0];
        return;
    case subcommand::_none_:;
    }
    neo::unreachable();
}

std::string options::usage_string(std::string_view program_name) noexcept {
    return fmt::format("Usage: {} [--log-level <level>] [--no-color] <subcommand> ...",
                       program_name);
}

std::string options::help_string(std::string_view program_name) {
    auto ret = usage_string(program_name);
    ret += "\n\nManipulate URNs of the form 'urn:<entity>:<id>[:<key>:<value>]*'\n\nSubcommands:\n";
    for (auto& info : subcommands) {
        ret += fmt::format("  {:<10} {}\n  {:<10}   {}\n", info.name, info.args, "", info.help);
    }
    ret += fmt::format("\n{}", fmt::streamed(flag_options()));
    ret += "\nUse '--' to pass an argument that begins with '-', e.g. 'set <urn> -- -h on'\n";
    ret += "\nEnvironment:\n"
           "  URNKIT_LOG_LEVEL   Default for '--log-level' (trace, debug, info, warn, error, ...)\n"
           "  URNKIT_NO_COLOR    If set to a true value, disable colored log output\n";
    return ret;
}

log::level options::default_log_level() noexcept {
    return urnkit::getenv_log_level("URNKIT_LOG_LEVEL", log::level::info);
}

bool options::default_use_color() noexcept { return !urnkit::getenv_flag("URNKIT_NO_COLOR"); }
