#include "../options.hpp"

#include <urnkit/uuid.hpp>
#include <urnkit/validate.hpp>
#include <urnkit/util/log.hpp>

#include <fmt/core.h>

namespace urnkit::cli::cmd {

int generate(const options& opts) {
    if (!check_entity(opts.generate.entity)) {
        urnkit_log(warn,
                   "Entity '{}' is not a valid entity name. Generated URNs will not pass validation.",
                   opts.generate.entity);
    }
    for (int i = 0; i < opts.generate.count; ++i) {
        fmt::print("{}\n", generate_uuid_urn(opts.generate.entity));
    }
    return 0;
}

}  // namespace urnkit::cli::cmd
