#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace urnkit {

/// The maximum length of a composed URN string, in bytes
constexpr std::size_t max_urn_length = 255;

/**
 * @brief A single key/value pair trailing the identifier of a URN.
 */
struct attribute {
    std::string key;
    std::string value;

    friend bool operator==(const attribute&, const attribute&) = default;
};

using attribute_list = std::vector<attribute>;

/**
 * @brief Compose a URN string from an entity, an identifier, and an ordered list of attributes.
 *
 * Each component is passed through escape_component(). Throws malformed_urn if the entity or the
 * identifier is empty, or if the result is longer than `max_urn_length`.
 */
std::string
compose(std::string_view entity, std::string_view id, const attribute_list& attrs = {});

/**
 * @brief Compose a URN with attributes taken from a map, in the map's iteration order.
 */
std::string compose(std::string_view                          entity,
                    std::string_view                          id,
                    const std::map<std::string, std::string>& attrs);

/**
 * Represents a parsed URN of the form `urn:<entity>:<id>[:<key>:<value>]*`.
 *
 * Components are stored exactly as they appeared in the parsed string: no percent-unescaping is
 * performed. The `parse` and `to_string` methods convert between the textual representation and
 * this struct, and support full round-trips of any string that is already in canonical form.
 */
struct urn {
    /// The resource category
    std::string entity;
    /// The resource identifier within the entity
    std::string id;
    /// Trailing attributes, in the order they appeared. Keys may repeat.
    attribute_list attributes;

    /**
     * Parse the given string into a urn object. Throws malformed_urn on failure.
     */
    static urn parse(std::string_view);

    /**
     * Compose this URN back into its canonical string form.
     */
    std::string to_string() const;

    /// Find the first attribute with the given key, or `nullptr` if there is none
    const attribute* find(std::string_view key) const noexcept;

    /// Obtain the attributes keyed by name. If a key repeats, the last occurrence wins.
    std::map<std::string, std::string> attribute_map() const;

    friend bool operator==(const urn&, const urn&) = default;
};

}  // namespace urnkit
