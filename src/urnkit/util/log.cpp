#include "./log.hpp"

#include <neo/assert.hpp>
#include <neo/utility.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

void urnkit::log::init_logger(bool use_color) noexcept {
    auto mode   = use_color ? spdlog::color_mode::automatic : spdlog::color_mode::never;
    auto sink   = std::make_shared<spdlog::sinks::stderr_color_sink_mt>(mode);
    // Replaces (rather than registers) the logger, so this may be called more than once
    auto logger = std::make_shared<spdlog::logger>("urnkit", std::move(sink));
    // Filtering happens against current_log_level, so the sink accepts everything
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%^%-5l%$] %v");
}

void urnkit::log::log_print(level l, std::string_view msg) noexcept {
    const auto lvl = [&] {
        switch (l) {
        case level::trace:
            return spdlog::level::trace;
        case level::debug:
            return spdlog::level::debug;
        case level::info:
            return spdlog::level::info;
        case level::warn:
            return spdlog::level::warn;
        case level::error:
            return spdlog::level::err;
        case level::critical:
            return spdlog::level::critical;
        case level::silent:
            return spdlog::level::off;
        }
        neo_assert_always(invariant, false, "Invalid log level", msg, int(l));
    }();

    // Not cached: init_logger() may replace the default logger after messages were already logged
    spdlog::default_logger_raw()->log(lvl, "{}", msg);
}

std::optional<urnkit::log::level> urnkit::log::level_from_string(std::string_view s) noexcept {
    if (s == "trace") {
        return level::trace;
    } else if (s == "debug") {
        return level::debug;
    } else if (s == "info") {
        return level::info;
    } else if (s == neo::oper::any_of("warn", "warning")) {
        return level::warn;
    } else if (s == "error") {
        return level::error;
    } else if (s == "critical") {
        return level::critical;
    } else if (s == neo::oper::any_of("silent", "off")) {
        return level::silent;
    }
    return std::nullopt;
}
