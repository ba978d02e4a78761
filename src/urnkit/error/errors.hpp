#pragma once

#include <fmt/core.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace urnkit {

/**
 * @brief The reasons a URN string can fail to parse or compose.
 *
 * Every failure is reported as a single error kind (malformed_urn), with one of these
 * values attached as the reason.
 */
enum class urn_errc {
    none = 0,
    missing_scheme,
    missing_component,
    empty_component,
    unpaired_attribute,
    empty_attribute,
    compose_missing_component,
    too_long,
};

std::string_view explanation_of(urn_errc) noexcept;
std::string_view default_error_string(urn_errc) noexcept;
std::string_view errc_name(urn_errc) noexcept;

class malformed_urn : public std::runtime_error {
    urn_errc _reason;

public:
    malformed_urn(urn_errc reason, std::string message)
        : runtime_error(std::move(message))
        , _reason(reason) {}

    explicit malformed_urn(urn_errc reason)
        : malformed_urn(reason, std::string(default_error_string(reason))) {}

    urn_errc         reason() const noexcept { return _reason; }
    std::string_view explanation() const noexcept { return explanation_of(_reason); }
};

/// The URN string that was being processed when an error occurred
struct e_urn_string {
    std::string value;
};

/// The attribute key that was being processed when an error occurred
struct e_attribute_key {
    std::string value;
};

template <urn_errc Reason, typename... Args>
auto make_malformed_urn(fmt::format_string<Args...> fmt_str, Args&&... args) {
    return malformed_urn(Reason, fmt::format(fmt_str, std::forward<Args>(args)...));
}

template <urn_errc Reason>
auto make_malformed_urn() {
    return malformed_urn(Reason);
}

}  // namespace urnkit
