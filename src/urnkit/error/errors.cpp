#include "./errors.hpp"

#include <neo/assert.hpp>

using namespace urnkit;

std::string_view urnkit::explanation_of(urn_errc ec) noexcept {
    switch (ec) {
    case urn_errc::missing_scheme:
        return R"(
A URN string must begin with the 'urn:' scheme. The scheme is matched without
regard to case, so 'URN:' and 'Urn:' are also accepted.
)";
    case urn_errc::missing_component:
        return R"(
A URN must contain at least an entity and an identifier, separated by a colon:
'urn:<entity>:<id>'.
)";
    case urn_errc::empty_component:
        return R"(
Neither the entity nor the identifier of a URN may be empty. Check for doubled
colons such as in 'urn::1234' or 'urn:order:'.
)";
    case urn_errc::unpaired_attribute:
        return R"(
Attributes follow the identifier as colon-separated key/value pairs. The URN
ended with a key that was not followed by a value.
)";
    case urn_errc::empty_attribute:
        return R"(
Every attribute must have both a non-empty key and a non-empty value.
)";
    case urn_errc::compose_missing_component:
        return R"(
Composing a URN requires both an entity and an identifier. One of them was
given as an empty string.
)";
    case urn_errc::too_long:
        return R"(
A composed URN may be at most 255 characters long, after escaping has been
applied to every component. Shorten the identifier or drop some attributes.
)";
    case urn_errc::none:
        break;
    }
    neo::unreachable();
}

std::string_view urnkit::default_error_string(urn_errc ec) noexcept {
    switch (ec) {
    case urn_errc::missing_scheme:
        return "Invalid URN: Must start with the 'urn:' scheme";
    case urn_errc::missing_component:
        return "Invalid URN: Missing entity or ID component";
    case urn_errc::empty_component:
        return "Invalid URN: Entity or ID is empty";
    case urn_errc::unpaired_attribute:
        return "Invalid URN: Attribute key without value";
    case urn_errc::empty_attribute:
        return "Invalid URN: Attribute missing value";
    case urn_errc::compose_missing_component:
        return "Cannot compose URN: 'entity' and 'id' are required";
    case urn_errc::too_long:
        return "Composed URN is too long";
    case urn_errc::none:
        break;
    }
    neo::unreachable();
}

std::string_view urnkit::errc_name(urn_errc ec) noexcept {
    switch (ec) {
    case urn_errc::none:
        return "none";
    case urn_errc::missing_scheme:
        return "missing-scheme";
    case urn_errc::missing_component:
        return "missing-component";
    case urn_errc::empty_component:
        return "empty-component";
    case urn_errc::unpaired_attribute:
        return "unpaired-attribute";
    case urn_errc::empty_attribute:
        return "empty-attribute";
    case urn_errc::compose_missing_component:
        return "compose-missing-component";
    case urn_errc::too_long:
        return "too-long";
    }
    neo::unreachable();
}
