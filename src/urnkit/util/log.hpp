#pragma once

#include <fmt/core.h>

#include <optional>
#include <string_view>

namespace urnkit::log {

enum class level : int {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    silent,
};

/// Messages below this level are discarded before they are formatted
inline level current_log_level = level::info;

void log_print(level l, std::string_view s) noexcept;

/**
 * @brief Route log output to stderr, optionally without ANSI colors.
 */
void init_logger(bool use_color = true) noexcept;

/// Parse a level name such as "debug" or "warn". Returns nullopt for unknown names.
std::optional<level> level_from_string(std::string_view) noexcept;

template <typename T>
concept formattable = requires(const T item) {
    fmt::format("{}", item);
};

template <formattable... Args>
void log(level l, std::string_view s, const Args&... args) noexcept {
    if (int(l) >= int(current_log_level)) {
        auto message = fmt::format(fmt::runtime(s), args...);
        log_print(l, message);
    }
}

#define urnkit_log(Level, str, ...)                                                                \
    do {                                                                                           \
        if (int(urnkit::log::level::Level) >= int(urnkit::log::current_log_level)) {               \
            ::urnkit::log::log(::urnkit::log::level::Level, str __VA_OPT__(, ) __VA_ARGS__);       \
        }                                                                                          \
    } while (0)

}  // namespace urnkit::log
