#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace urnkit {

/**
 * @brief A source of unique identifiers in canonical 8-4-4-4-12 lowercase-hex form.
 */
using uuid_source = std::function<std::string()>;

/**
 * @brief Generate a random (version 4) UUID string.
 *
 * Each thread draws from its own random engine, so this may be called concurrently.
 */
std::string random_uuid();

/**
 * @brief Compose `urn:<entity>:<uuid>` using an identifier obtained from `source`.
 *
 * Throws malformed_urn if the entity is empty or the result is too long.
 */
std::string generate_uuid_urn(std::string_view entity, const uuid_source& source = random_uuid);

}  // namespace urnkit
