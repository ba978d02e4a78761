#pragma once

#include <urnkit/util/log.hpp>

#include <optional>
#include <string>

namespace urnkit {

/// Read the named environment variable. Returns nullopt if it is not set.
std::optional<std::string> getenv(const std::string& varname) noexcept;

/**
 * @brief Read the named environment variable as an on/off flag.
 *
 * "1", "true", "on", and "yes" (in any letter case) turn the flag on. Any other value, or an
 * unset variable, leaves it off.
 */
bool getenv_flag(const std::string& varname) noexcept;

/**
 * @brief Read the named environment variable as a log level name.
 *
 * If the variable is unset, returns `fallback`. If it names no log level, a warning is logged and
 * `fallback` is returned.
 */
log::level getenv_log_level(const std::string& varname, log::level fallback) noexcept;

}  // namespace urnkit
