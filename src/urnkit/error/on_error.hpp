#pragma once

#include <neo/pp.hpp>

#include <boost/leaf/on_error.hpp>

/**
 * Wrap an error object expression so that it is only evaluated if an error actually occurs.
 * Accepted by boost::leaf::new_error() and boost::leaf::on_error().
 */
#define URNKIT_E_ARG(...) ([&] { return __VA_ARGS__; })

/**
 * Attach the given error object (e.g. the URN text being parsed) to any error that leaves the
 * enclosing scope, whether thrown as an exception or returned in a result<>.
 */
#define URNKIT_E_SCOPE(...)                                                                        \
    auto NEO_CONCAT(_urnkit_e_scope_, __LINE__)                                                    \
        = boost::leaf::on_error(URNKIT_E_ARG(__VA_ARGS__))
