#include "./env.hpp"

#include <neo/utility.hpp>

#include <cstdlib>

std::optional<std::string> urnkit::getenv(const std::string& varname) noexcept {
    if (auto cptr = std::getenv(varname.c_str())) {
        return std::string(cptr);
    }
    return std::nullopt;
}

bool urnkit::getenv_flag(const std::string& varname) noexcept {
    auto given = getenv(varname);
    if (!given) {
        return false;
    }
    for (char& c : *given) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return *given == neo::oper::any_of("1", "true", "on", "yes");
}

urnkit::log::level urnkit::getenv_log_level(const std::string& varname,
                                            log::level         fallback) noexcept {
    auto given = getenv(varname);
    if (!given) {
        return fallback;
    }
    auto lvl = log::level_from_string(*given);
    if (!lvl) {
        urnkit_log(warn, "Ignoring unknown log level '{}' given in ${}", *given, varname);
        return fallback;
    }
    return *lvl;
}
