#pragma once

#include <urnkit/util/log.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace urnkit::cli {

/// Thrown when the user passes `--help` or `-h`
struct help_request : std::exception {};

struct invalid_arguments : std::runtime_error {
    using runtime_error::runtime_error;
};

struct unrecognized_argument : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

struct missing_required : invalid_arguments {
    using invalid_arguments::invalid_arguments;
};

/// The argument as it was spelled on the command line
struct e_arg_spelling {
    std::string value;
};

/**
 * @brief Top-level urnkit subcommands
 */
enum class subcommand {
    _none_,
    parse,
    compose,
    validate,
    normalize,
    get,
    vendor,
    attrs,
    set,
    remove,
    generate,
};

std::string_view subcommand_name(subcommand) noexcept;

/**
 * @brief Complete aggregate of all urnkit command-line options
 */
struct options {
    using string = std::string;

    // The `--log-level` argument, defaulting to $URNKIT_LOG_LEVEL
    log::level log_level = default_log_level();
    // Disabled with `--no-color` or $URNKIT_NO_COLOR
    bool use_color = default_use_color();
    // `--json` on 'parse' and 'attrs'
    bool json = false;

    // The selected subcommand
    enum subcommand subcommand = subcommand::_none_;

    // The URN that most subcommands operate on
    string urn_str;
    // The attribute key for 'get', 'set', and 'remove'
    string key;

    /**
     * @brief Parameters specific to 'urnkit compose'
     */
    struct {
        string entity;
        string id;
        /// Attributes given as 'key=value'
        std::vector<string> attrs;
    } compose;

    /**
     * @brief Parameters specific to 'urnkit validate'
     */
    struct {
        std::vector<string> urns;
    } validate;

    /**
     * @brief Parameters specific to 'urnkit set'
     */
    struct {
        string value;
    } set;

    /**
     * @brief Parameters specific to 'urnkit generate'
     */
    struct {
        string entity;
        int    count = 1;
    } generate;

    /**
     * @brief Fill this object from the given command-line arguments (not including argv[0]).
     *
     * Throws help_request if help was requested, and invalid_arguments (or a subclass) for bad
     * arguments. Arguments after a bare '--' are always positional.
     */
    void parse_argv(const std::vector<string>& argv);

    static string usage_string(std::string_view program_name) noexcept;
    static string help_string(std::string_view program_name);

    static log::level default_log_level() noexcept;
    static bool       default_use_color() noexcept;
};

}  // namespace urnkit::cli
