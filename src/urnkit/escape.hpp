#pragma once

#include <string>
#include <string_view>

namespace urnkit {

/**
 * @brief Percent-escape a single URN component (entity, id, attribute key or value).
 *
 * Letters, digits, and the marks `- . _ ~ $ & + = @` are kept as-is. A '%' that already begins
 * a valid `%XX` triplet is kept as-is, so escaping an escaped string is a no-op. Every other byte
 * (including ':') is written as `%XX` with uppercase hex digits.
 */
std::string escape_component(std::string_view s);

/// Returns `true` if `escape_component(s) == s`
bool is_escaped(std::string_view s) noexcept;

}  // namespace urnkit
