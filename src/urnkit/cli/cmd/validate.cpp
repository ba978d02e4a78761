#include "../options.hpp"

#include <urnkit/error/errors.hpp>
#include <urnkit/error/result.hpp>
#include <urnkit/urn.hpp>
#include <urnkit/validate.hpp>
#include <urnkit/util/log.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <fmt/core.h>

namespace urnkit::cli::cmd {

namespace {

// Log the reason that the given URN is not valid
void explain_invalid(std::string_view urn_str) {
    if (urn_str.empty()) {
        urnkit_log(error, "An empty string is not a valid URN");
        return;
    }
    if (urn_str.size() > max_urn_length) {
        urnkit_log(error,
                   "URN is {} characters long, but at most {} are allowed",
                   urn_str.size(),
                   max_urn_length);
        return;
    }
    boost::leaf::try_catch(
        [&] {
            auto parsed = urn::parse(urn_str);
            boost::leaf::try_handle_all(
                [&]() -> result<void> { return check_entity(parsed.entity); },
                [&](e_entity_str ent, invalid_entity_reason why) {
                    urnkit_log(error,
                               "Invalid entity '{}': {}",
                               ent.value,
                               invalid_entity_reason_str(why));
                },
                [&] { urnkit_log(error, "Invalid entity '{}'", parsed.entity); });
        },
        [&](const malformed_urn& exc) { urnkit_log(error, "{}", exc.what()); });
}

}  // namespace

int validate(const options& opts) {
    int n_invalid = 0;
    for (auto& urn_str : opts.validate.urns) {
        if (is_valid(urn_str)) {
            fmt::print("valid:   {}\n", urn_str);
            continue;
        }
        ++n_invalid;
        fmt::print("invalid: {}\n", urn_str);
        explain_invalid(urn_str);
    }
    urnkit_log(debug,
               "Checked {} URN(s), {} invalid",
               opts.validate.urns.size(),
               n_invalid);
    return n_invalid == 0 ? 0 : 1;
}

}  // namespace urnkit::cli::cmd
