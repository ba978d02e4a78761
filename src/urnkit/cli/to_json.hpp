#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace urnkit {

struct urn;

namespace cli {

/**
 * @brief JSON form of a parsed URN, as printed by 'urnkit parse --json'.
 *
 * Attributes are an array of {"key", "value"} objects in their original order, so that repeated
 * keys survive.
 */
nlohmann::json to_json(const urn&);

/// JSON object form of an attribute map, as printed by 'urnkit attrs --json'
nlohmann::json to_json(const std::map<std::string, std::string>&);

}  // namespace cli

}  // namespace urnkit
