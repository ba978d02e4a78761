#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace urnkit {

/*
 * Convenience operations over URN strings. Each of these parses its input with urn::parse()
 * and lets any malformed_urn propagate unchanged. The editing operations compose a new string
 * and never modify their input.
 */

/// Get the entity component of the given URN
std::string entity_of(std::string_view urn_str);

/// Get the identifier component of the given URN
std::string id_of(std::string_view urn_str);

/**
 * @brief Look up the value of an attribute by its key.
 *
 * If the key appears more than once, the first occurrence wins. Returns nullopt if the key is
 * absent.
 */
std::optional<std::string> value_of(std::string_view urn_str, std::string_view key);

/// Shorthand for `value_of(urn_str, "vendor")`
std::optional<std::string> vendor_of(std::string_view urn_str);

/**
 * @brief Get every attribute of the given URN as a map.
 *
 * If a key appears more than once, the last occurrence wins. Note that this is the opposite of
 * value_of().
 */
std::map<std::string, std::string> all_attributes(std::string_view urn_str);

/**
 * @brief Set an attribute, replacing the value of an existing key in-place, or appending a new
 * key/value pair to the end.
 *
 * The key and value are escaped before they are compared or stored.
 */
std::string
add_or_update_attribute(std::string_view urn_str, std::string_view key, std::string_view value);

/**
 * @brief Remove every attribute whose stored key is exactly `key`. Removing an absent key is not
 * an error: The result is the canonical form of the input.
 */
std::string remove_attribute(std::string_view urn_str, std::string_view key);

/// Lowercase the entity of the given URN. The identifier and attributes are left alone.
std::string normalize(std::string_view urn_str);

}  // namespace urnkit
