#pragma once

#include <functional>

namespace urnkit {

/**
 * @brief Invoke the given function, converting any error that escapes it into a log message and
 * a process exit code.
 */
int handle_cli_errors(std::function<int()>) noexcept;

}  // namespace urnkit
