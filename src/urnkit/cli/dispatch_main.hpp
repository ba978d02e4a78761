#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace urnkit::cli {

struct options;

/**
 * @brief Run the subcommand selected by the given options, returning the process exit code.
 */
int dispatch_main(const options&) noexcept;

/**
 * @brief The whole program: parse the arguments (not including argv[0]), set up logging, and
 * dispatch.
 *
 * Returns 2 for bad arguments, 0 after printing help, otherwise the result of dispatch_main().
 */
int main_fn(std::string_view program_name, const std::vector<std::string>& argv);

}  // namespace urnkit::cli
