#pragma once

#include <urnkit/error/result.hpp>

#include <iosfwd>
#include <string>
#include <string_view>

namespace urnkit {

enum class invalid_entity_reason {
    empty,
    too_short,
    too_long,
    initial_not_alnum,
    invalid_char,
};

std::ostream& operator<<(std::ostream& out, invalid_entity_reason);

std::string_view invalid_entity_reason_str(invalid_entity_reason) noexcept;

struct e_entity_str {
    std::string value;
};

/**
 * @brief Check that the given string is a valid URN entity name.
 *
 * A valid entity is 3 to 32 characters long, begins with an ASCII letter or digit, and contains
 * only letters, digits, and hyphens. On failure, the error carries an e_entity_str and an
 * invalid_entity_reason.
 */
result<void> check_entity(std::string_view entity) noexcept;

/**
 * @brief Determine whether the given string is a valid URN.
 *
 * The string must be non-empty, no longer than `max_urn_length`, parse successfully, and have
 * an entity that passes check_entity(). Never throws.
 */
bool is_valid(std::string_view urn_str) noexcept;

}  // namespace urnkit
