#include "../options.hpp"

#include <urnkit/attributes.hpp>
#include <urnkit/urn.hpp>
#include <urnkit/util/log.hpp>

#include <fmt/core.h>

namespace urnkit::cli::cmd {

int compose(const options& opts) {
    attribute_list attrs;
    for (std::string_view given : opts.compose.attrs) {
        // The presence of '=' was checked while parsing arguments
        auto eq_pos = given.find('=');
        attrs.push_back({std::string(given.substr(0, eq_pos)),
                         std::string(given.substr(eq_pos + 1))});
    }
    urnkit_log(debug,
               "Composing URN for entity '{}' with {} attribute(s)",
               opts.compose.entity,
               attrs.size());
    fmt::print("{}\n", urnkit::compose(opts.compose.entity, opts.compose.id, attrs));
    return 0;
}

int set(const options& opts) {
    fmt::print("{}\n", add_or_update_attribute(opts.urn_str, opts.key, opts.set.value));
    return 0;
}

int remove(const options& opts) {
    if (!value_of(opts.urn_str, opts.key)) {
        urnkit_log(info, "URN has no attribute '{}', nothing to remove", opts.key);
    }
    fmt::print("{}\n", remove_attribute(opts.urn_str, opts.key));
    return 0;
}

int normalize(const options& opts) {
    fmt::print("{}\n", urnkit::normalize(opts.urn_str));
    return 0;
}

}  // namespace urnkit::cli::cmd
