#include "./uuid.hpp"

#include <urnkit/error/errors.hpp>
#include <urnkit/urn.hpp>

#include <catch2/catch.hpp>

#include <ctre.hpp>

#include <set>
#include <string>

namespace {

constexpr ctll::fixed_string uuid_urn_re = "urn:session:[0-9a-f\\-]{36}";
constexpr ctll::fixed_string uuid_re
    = "[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}";

}  // namespace

TEST_CASE("Random UUIDs are version 4 in canonical form") {
    for (int i = 0; i < 100; ++i) {
        auto id = urnkit::random_uuid();
        CAPTURE(id);
        CHECK(id.size() == 36);
        CHECK(bool(ctre::match<uuid_re>(id)));
    }
}

TEST_CASE("Generate a UUID URN") {
    auto s = urnkit::generate_uuid_urn("session");
    CAPTURE(s);
    CHECK(bool(ctre::match<uuid_urn_re>(s)));
    CHECK(urnkit::urn::parse(s).entity == "session");
}

TEST_CASE("Generated URNs are distinct") {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(urnkit::generate_uuid_urn("session"));
    }
    CHECK(seen.size() == 1000);
}

TEST_CASE("Generate with an injected identifier source") {
    int  n_calls = 0;
    auto source  = [&] {
        ++n_calls;
        return std::string("00000000-0000-4000-8000-000000000000");
    };
    CHECK(urnkit::generate_uuid_urn("session", source)
          == "urn:session:00000000-0000-4000-8000-000000000000");
    CHECK(n_calls == 1);
}

TEST_CASE("Generation propagates composition errors") {
    CHECK_THROWS_AS(urnkit::generate_uuid_urn(""), urnkit::malformed_urn);
    auto huge = [] { return std::string(300, 'f'); };
    CHECK_THROWS_AS(urnkit::generate_uuid_urn("session", huge), urnkit::malformed_urn);
}
