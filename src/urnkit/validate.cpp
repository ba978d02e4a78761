#include "./validate.hpp"

#include "./urn.hpp"

#include <urnkit/error/errors.hpp>
#include <urnkit/error/on_error.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <ctre.hpp>
#include <neo/assert.hpp>

#include <ostream>

using namespace urnkit;

using err_reason = invalid_entity_reason;

static err_reason calc_invalid_entity_reason(std::string_view str) noexcept {
    constexpr ctll::fixed_string alnum_start   = "^[A-Za-z0-9]";
    constexpr ctll::fixed_string invalid_chars = "[^A-Za-z0-9\\-]";
    if (str.empty()) {
        return err_reason::empty;
    } else if (!ctre::search<alnum_start>(str)) {
        return err_reason::initial_not_alnum;
    } else if (ctre::search<invalid_chars>(str)) {
        return err_reason::invalid_char;
    } else if (str.size() < 3) {
        return err_reason::too_short;
    } else if (str.size() > 32) {
        return err_reason::too_long;
    } else {
        neo_assert(invariant,
                   false,
                   "Expected to be able to determine an error-reason for the given invalid entity",
                   str);
    }
}

std::string_view urnkit::invalid_entity_reason_str(err_reason e) noexcept {
    switch (e) {
    case err_reason::empty:
        return "Entity cannot be empty";
    case err_reason::too_short:
        return "Entity must be at least three characters long";
    case err_reason::too_long:
        return "Entity must be at most 32 characters long";
    case err_reason::initial_not_alnum:
        return "Entity must begin with a letter or a digit";
    case err_reason::invalid_char:
        return "Entity may only contain letters, digits, and hyphens";
    }
    neo::unreachable();
}

result<void> urnkit::check_entity(std::string_view entity) noexcept {
    constexpr ctll::fixed_string entity_re = "^[A-Za-z0-9][A-Za-z0-9\\-]{1,31}$";

    if (!ctre::match<entity_re>(entity)) {
        return new_error(URNKIT_E_ARG(e_entity_str{std::string(entity)}),
                         URNKIT_E_ARG(calc_invalid_entity_reason(entity)));
    }
    return {};
}

bool urnkit::is_valid(std::string_view urn_str) noexcept {
    if (urn_str.empty() || urn_str.size() > max_urn_length) {
        return false;
    }
    return boost::leaf::try_catch(
        [&] {
            auto parsed = urn::parse(urn_str);
            return bool(check_entity(parsed.entity));
        },
        [](const malformed_urn&) { return false; });
}

std::ostream& urnkit::operator<<(std::ostream& out, invalid_entity_reason r) {
    out << invalid_entity_reason_str(r);
    return out;
}
