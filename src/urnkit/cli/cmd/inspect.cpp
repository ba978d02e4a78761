#include "../options.hpp"
#include "../to_json.hpp"

#include <urnkit/attributes.hpp>
#include <urnkit/urn.hpp>
#include <urnkit/util/log.hpp>

#include <fmt/core.h>

namespace urnkit::cli::cmd {

int parse(const options& opts) {
    auto parsed = urn::parse(opts.urn_str);
    if (opts.json) {
        fmt::print("{}\n", to_json(parsed).dump(2));
        return 0;
    }
    fmt::print("entity: {}\n", parsed.entity);
    fmt::print("id:     {}\n", parsed.id);
    for (auto& [key, value] : parsed.attributes) {
        fmt::print("  {} = {}\n", key, value);
    }
    return 0;
}

int get(const options& opts) {
    auto value = value_of(opts.urn_str, opts.key);
    if (!value) {
        urnkit_log(error, "URN [{}] has no attribute '{}'", opts.urn_str, opts.key);
        return 1;
    }
    fmt::print("{}\n", *value);
    return 0;
}

int vendor(const options& opts) {
    auto value = vendor_of(opts.urn_str);
    if (!value) {
        urnkit_log(error, "URN [{}] does not name a vendor", opts.urn_str);
        return 1;
    }
    fmt::print("{}\n", *value);
    return 0;
}

int attrs(const options& opts) {
    auto map = all_attributes(opts.urn_str);
    if (opts.json) {
        fmt::print("{}\n", to_json(map).dump(2));
        return 0;
    }
    for (auto& [key, value] : map) {
        fmt::print("{}={}\n", key, value);
    }
    return 0;
}

}  // namespace urnkit::cli::cmd
