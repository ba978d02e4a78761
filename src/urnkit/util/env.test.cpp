#include "./env.hpp"

#include <catch2/catch.hpp>

#include <stdlib.h>

TEST_CASE("Read a plain environment variable") {
    ::setenv("URNKIT_TEST_ENV_VALUE", "hello", 1);
    ::unsetenv("URNKIT_TEST_ENV_MISSING");

    CHECK(urnkit::getenv("URNKIT_TEST_ENV_VALUE") == "hello");
    CHECK_FALSE(urnkit::getenv("URNKIT_TEST_ENV_MISSING"));
}

TEST_CASE("Flags that turn on") {
    auto given = GENERATE(Catch::Generators::values<std::string>({
        "1",
        "true",
        "TRUE",
        "True",
        "on",
        "ON",
        "yes",
        "Yes",
    }));
    ::setenv("URNKIT_TEST_ENV_FLAG", given.c_str(), 1);
    CAPTURE(given);
    CHECK(urnkit::getenv_flag("URNKIT_TEST_ENV_FLAG"));
}

TEST_CASE("Flags that stay off") {
    auto given = GENERATE(Catch::Generators::values<std::string>({
        "",
        "0",
        "false",
        "off",
        "no",
        "anything",
    }));
    ::setenv("URNKIT_TEST_ENV_FLAG", given.c_str(), 1);
    CAPTURE(given);
    CHECK_FALSE(urnkit::getenv_flag("URNKIT_TEST_ENV_FLAG"));

    ::unsetenv("URNKIT_TEST_ENV_FLAG");
    CHECK_FALSE(urnkit::getenv_flag("URNKIT_TEST_ENV_FLAG"));
}

TEST_CASE("Log levels from the environment") {
    using urnkit::log::level;
    ::unsetenv("URNKIT_TEST_ENV_LEVEL");
    CHECK(urnkit::getenv_log_level("URNKIT_TEST_ENV_LEVEL", level::info) == level::info);

    ::setenv("URNKIT_TEST_ENV_LEVEL", "debug", 1);
    CHECK(urnkit::getenv_log_level("URNKIT_TEST_ENV_LEVEL", level::info) == level::debug);

    ::setenv("URNKIT_TEST_ENV_LEVEL", "warning", 1);
    CHECK(urnkit::getenv_log_level("URNKIT_TEST_ENV_LEVEL", level::info) == level::warn);

    // Unknown names fall back rather than fail
    ::setenv("URNKIT_TEST_ENV_LEVEL", "loud", 1);
    CHECK(urnkit::getenv_log_level("URNKIT_TEST_ENV_LEVEL", level::error) == level::error);
    ::unsetenv("URNKIT_TEST_ENV_LEVEL");
}
