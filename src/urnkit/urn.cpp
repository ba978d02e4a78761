#include "./urn.hpp"

#include "./escape.hpp"

#include <urnkit/error/errors.hpp>
#include <urnkit/error/on_error.hpp>

#include <boost/leaf/exception.hpp>
#include <range/v3/algorithm/find_if.hpp>

using namespace urnkit;

namespace {

bool has_scheme(std::string_view s) noexcept {
    constexpr std::string_view scheme = "urn:";
    if (s.size() < scheme.size()) {
        return false;
    }
    for (std::size_t i = 0; i < scheme.size(); ++i) {
        auto c = s[i];
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
        if (c != scheme[i]) {
            return false;
        }
    }
    return true;
}

// Split on every ':', keeping empty segments
std::vector<std::string_view> split_segments(std::string_view s) {
    std::vector<std::string_view> ret;
    while (true) {
        auto colon = s.find(':');
        ret.push_back(s.substr(0, colon));
        if (colon == s.npos) {
            break;
        }
        s = s.substr(colon + 1);
    }
    return ret;
}

void append_component(std::string& out, std::string_view part) {
    out.push_back(':');
    out.append(escape_component(part));
}

template <typename Attrs>
std::string compose_impl(std::string_view entity, std::string_view id, const Attrs& attrs) {
    if (entity.empty() || id.empty()) {
        BOOST_LEAF_THROW_EXCEPTION(make_malformed_urn<urn_errc::compose_missing_component>());
    }

    std::string ret = "urn";
    append_component(ret, entity);
    append_component(ret, id);
    for (auto&& [key, value] : attrs) {
        append_component(ret, key);
        append_component(ret, value);
    }

    if (ret.size() > max_urn_length) {
        BOOST_LEAF_THROW_EXCEPTION(make_malformed_urn<urn_errc::too_long>(
                                       "Composed URN is too long ({} chars, max {})",
                                       ret.size(),
                                       max_urn_length),
                                   e_urn_string{ret});
    }
    return ret;
}

}  // namespace

std::string
urnkit::compose(std::string_view entity, std::string_view id, const attribute_list& attrs) {
    return compose_impl(entity, id, attrs);
}

std::string urnkit::compose(std::string_view                          entity,
                            std::string_view                          id,
                            const std::map<std::string, std::string>& attrs) {
    return compose_impl(entity, id, attrs);
}

urn urn::parse(const std::string_view s) {
    URNKIT_E_SCOPE(e_urn_string{std::string(s)});
    if (!has_scheme(s)) {
        BOOST_LEAF_THROW_EXCEPTION(make_malformed_urn<urn_errc::missing_scheme>());
    }

    auto parts = split_segments(s.substr(4));
    if (parts.size() < 2) {
        BOOST_LEAF_THROW_EXCEPTION(make_malformed_urn<urn_errc::missing_component>());
    }

    urn ret;
    ret.entity = std::string(parts[0]);
    ret.id     = std::string(parts[1]);
    if (ret.entity.empty() || ret.id.empty()) {
        BOOST_LEAF_THROW_EXCEPTION(make_malformed_urn<urn_errc::empty_component>());
    }

    if ((parts.size() - 2) % 2 != 0) {
        BOOST_LEAF_THROW_EXCEPTION(make_malformed_urn<urn_errc::unpaired_attribute>(),
                                   e_attribute_key{std::string(parts.back())});
    }

    for (std::size_t i = 2; i < parts.size(); i += 2) {
        auto key   = parts[i];
        auto value = parts[i + 1];
        if (key.empty() || value.empty()) {
            BOOST_LEAF_THROW_EXCEPTION(make_malformed_urn<urn_errc::empty_attribute>(
                                           "Invalid URN: Attribute {} missing value",
                                           key),
                                       e_attribute_key{std::string(key)});
        }
        ret.attributes.push_back({std::string(key), std::string(value)});
    }
    return ret;
}

std::string urn::to_string() const { return compose(entity, id, attributes); }

const attribute* urn::find(std::string_view key) const noexcept {
    auto it = ranges::find_if(attributes, [&](const attribute& attr) { return attr.key == key; });
    if (it == attributes.end()) {
        return nullptr;
    }
    return &*it;
}

std::map<std::string, std::string> urn::attribute_map() const {
    std::map<std::string, std::string> ret;
    for (auto& [key, value] : attributes) {
        ret.insert_or_assign(key, value);
    }
    return ret;
}
