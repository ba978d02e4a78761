#include "./error_handler.hpp"
#include "./options.hpp"

#include <urnkit/error/errors.hpp>
#include <urnkit/util/log.hpp>

#include <boost/leaf/handle_errors.hpp>
#include <boost/leaf/pred.hpp>
#include <fmt/ostream.h>

#include <system_error>
#include <tuple>

using namespace urnkit;

namespace {

auto handlers = std::tuple(  //
    [](const malformed_urn&     exc,
       cli::subcommand          cmd,
       const e_urn_string*      urn_str,
       const e_attribute_key*   key) {
        urnkit_log(error, "{}", exc.what());
        if (urn_str) {
            urnkit_log(error, "  (While processing [{}])", urn_str->value);
        }
        if (key && exc.reason() == urn_errc::empty_attribute) {
            urnkit_log(error, "  (The offending attribute key is '{}')", key->value);
        }
        urnkit_log(error, "{}", exc.explanation());
        urnkit_log(debug,
                   "Error reason: {} (in subcommand '{}')",
                   errc_name(exc.reason()),
                   cli::subcommand_name(cmd));
        return 1;
    },
    [](const malformed_urn& exc) {
        urnkit_log(error, "{}", exc.what());
        urnkit_log(error, "{}", exc.explanation());
        return 1;
    },
    [](const std::system_error& exc, boost::leaf::verbose_diagnostic_info const& diag) {
        urnkit_log(critical,
                   "An unhandled std::system_error arose. THIS IS AN URNKIT BUG! Info: {}",
                   fmt::streamed(diag));
        urnkit_log(critical,
                   "Exception message from std::system_error: {}",
                   exc.code().message());
        return 42;
    },
    [](boost::leaf::verbose_diagnostic_info const& diag) {
        urnkit_log(critical,
                   "An unhandled error arose. THIS IS AN URNKIT BUG! Info: {}",
                   fmt::streamed(diag));
        return 42;
    });
}  // namespace

int urnkit::handle_cli_errors(std::function<int()> fn) noexcept {
    return boost::leaf::try_catch(fn, handlers);
}
