#include "./attributes.hpp"

#include "./escape.hpp"
#include "./urn.hpp"

#include <urnkit/error/errors.hpp>
#include <urnkit/error/on_error.hpp>
#include <urnkit/util/log.hpp>

#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>

using namespace urnkit;

std::string urnkit::entity_of(std::string_view urn_str) { return urn::parse(urn_str).entity; }

std::string urnkit::id_of(std::string_view urn_str) { return urn::parse(urn_str).id; }

std::optional<std::string> urnkit::value_of(std::string_view urn_str, std::string_view key) {
    auto parsed = urn::parse(urn_str);
    auto found  = parsed.find(key);
    if (!found) {
        return std::nullopt;
    }
    return found->value;
}

std::optional<std::string> urnkit::vendor_of(std::string_view urn_str) {
    return value_of(urn_str, "vendor");
}

std::map<std::string, std::string> urnkit::all_attributes(std::string_view urn_str) {
    return urn::parse(urn_str).attribute_map();
}

std::string urnkit::add_or_update_attribute(std::string_view urn_str,
                                            std::string_view key,
                                            std::string_view value) {
    URNKIT_E_SCOPE(e_attribute_key{std::string(key)});
    auto parsed     = urn::parse(urn_str);
    auto safe_key   = escape_component(key);
    auto safe_value = escape_component(value);

    auto existing = ranges::find_if(parsed.attributes,
                                    [&](const attribute& attr) { return attr.key == safe_key; });
    if (existing != parsed.attributes.end()) {
        urnkit_log(trace, "Replacing value of attribute '{}' in [{}]", safe_key, urn_str);
        existing->value = std::move(safe_value);
    } else {
        urnkit_log(trace, "Appending attribute '{}' to [{}]", safe_key, urn_str);
        parsed.attributes.push_back({std::move(safe_key), std::move(safe_value)});
    }
    return parsed.to_string();
}

std::string urnkit::remove_attribute(std::string_view urn_str, std::string_view key) {
    URNKIT_E_SCOPE(e_attribute_key{std::string(key)});
    auto parsed = urn::parse(urn_str);
    parsed.attributes
        = parsed.attributes
        | ranges::views::filter([&](const attribute& attr) { return attr.key != key; })
        | ranges::to<attribute_list>();
    return parsed.to_string();
}

std::string urnkit::normalize(std::string_view urn_str) {
    auto parsed = urn::parse(urn_str);
    for (char& c : parsed.entity) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return parsed.to_string();
}
