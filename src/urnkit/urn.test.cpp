#include "./urn.hpp"

#include <urnkit/error/errors.hpp>

#include <catch2/catch.hpp>

#include <string>

using urnkit::urn_errc;

namespace {

urn_errc parse_error_of(std::string_view s) {
    try {
        urnkit::urn::parse(s);
    } catch (const urnkit::malformed_urn& err) {
        return err.reason();
    }
    return urn_errc::none;
}

urn_errc compose_error_of(std::string_view entity,
                          std::string_view id,
                          const urnkit::attribute_list& attrs = {}) {
    try {
        urnkit::compose(entity, id, attrs);
    } catch (const urnkit::malformed_urn& err) {
        return err.reason();
    }
    return urn_errc::none;
}

}  // namespace

TEST_CASE("Parse a simple URN") {
    auto u = urnkit::urn::parse("urn:orders:1234");
    CHECK(u.entity == "orders");
    CHECK(u.id == "1234");
    CHECK(u.attributes.empty());
    CHECK(u.to_string() == "urn:orders:1234");
}

TEST_CASE("Parse a URN with attributes") {
    auto u = urnkit::urn::parse("urn:product:65b2713b1267994147953b27:vendor:foo:sku:999");
    CHECK(u.entity == "product");
    CHECK(u.id == "65b2713b1267994147953b27");
    REQUIRE(u.attributes.size() == 2);
    CHECK(u.attributes[0] == urnkit::attribute{"vendor", "foo"});
    CHECK(u.attributes[1] == urnkit::attribute{"sku", "999"});
}

TEST_CASE("The scheme is matched without regard to case") {
    auto u = urnkit::urn::parse("URN:EXAMPLE:Animal:Ferret:Nose");
    CHECK(u.entity == "EXAMPLE");
    CHECK(u.id == "Animal");
    CHECK(u.find("Ferret")->value == "Nose");
    CHECK(urnkit::urn::parse("uRn:a:b").entity == "a");
}

TEST_CASE("Invalid URN strings") {
    struct case_ {
        std::string_view given;
        urn_errc         expect;
    };
    auto [given, expect] = GENERATE(Catch::Generators::values<case_>({
        {"", urn_errc::missing_scheme},
        {"invalidURN", urn_errc::missing_scheme},
        {"invalid:orders:1234", urn_errc::missing_scheme},
        {"urn", urn_errc::missing_scheme},
        {"urn:", urn_errc::missing_component},
        {"urn:orders", urn_errc::missing_component},
        {"urn::", urn_errc::empty_component},
        {"urn::1234", urn_errc::empty_component},
        {"urn:orders:", urn_errc::empty_component},
        {"urn:orders:1234:status", urn_errc::unpaired_attribute},
        {"urn:orders:1234:a:b:c", urn_errc::unpaired_attribute},
        {"urn:orders:1234::value", urn_errc::empty_attribute},
        {"urn:orders:1234:status:", urn_errc::empty_attribute},
        {"urn:orders:1234:a:b:::", urn_errc::unpaired_attribute},
        {"urn:orders:1234:a:b::", urn_errc::empty_attribute},
    }));

    CAPTURE(given);
    CHECK(parse_error_of(given) == expect);
}

TEST_CASE("Error messages") {
    CHECK_THROWS_WITH(urnkit::urn::parse("invalidURN"),
                      Catch::Contains("Must start with the 'urn:' scheme"));
    CHECK_THROWS_WITH(urnkit::urn::parse("urn::"), Catch::Contains("Entity or ID is empty"));
    CHECK_THROWS_WITH(urnkit::urn::parse("urn:orders:1234:status"),
                      Catch::Contains("Attribute key without value"));
    CHECK_THROWS_WITH(urnkit::urn::parse("urn:orders:1234:status:"),
                      Catch::Contains("Attribute status missing value"));
    CHECK_THROWS_AS(urnkit::compose("", "123"), urnkit::malformed_urn);
}

TEST_CASE("Compose a URN") {
    auto s = urnkit::compose("order",
                             "12345",
                             urnkit::attribute_list{{"vendor", "amazon"}, {"status", "shipped"}});
    CHECK(s == "urn:order:12345:vendor:amazon:status:shipped");

    auto u = urnkit::urn::parse(s);
    CHECK(u.entity == "order");
    CHECK(u.id == "12345");
    CHECK(u.attribute_map()
          == std::map<std::string, std::string>{{"vendor", "amazon"}, {"status", "shipped"}});
}

TEST_CASE("Compose a URN from an attribute map") {
    std::map<std::string, std::string> attrs = {{"vendor", "amazon"}, {"status", "shipped"}};
    // Maps are composed in their iteration order
    CHECK(urnkit::compose("order", "12345", attrs)
          == "urn:order:12345:status:shipped:vendor:amazon");
}

TEST_CASE("Compose requires an entity and an identifier") {
    CHECK(compose_error_of("", "123") == urn_errc::compose_missing_component);
    CHECK(compose_error_of("order", "") == urn_errc::compose_missing_component);
    CHECK(compose_error_of("", "") == urn_errc::compose_missing_component);
    CHECK(compose_error_of("order", "1", {}) == urn_errc::none);
}

TEST_CASE("Components are escaped when composing") {
    auto s = urnkit::compose("my:entity", "a/b", urnkit::attribute_list{{"k y", "v:1"}});
    CHECK(s == "urn:my%3Aentity:a%2Fb:k%20y:v%3A1");
    // Parsing does not undo the escaping
    auto u = urnkit::urn::parse(s);
    CHECK(u.entity == "my%3Aentity");
    CHECK(u.id == "a%2Fb");
    CHECK(u.find("k%20y")->value == "v%3A1");
    CHECK(u.find("k y") == nullptr);
    // Re-composing an already-escaped record does not escape it a second time
    CHECK(u.to_string() == s);
}

TEST_CASE("Round-trip parse and compose") {
    struct case_ {
        std::string_view       entity;
        std::string_view       id;
        urnkit::attribute_list attrs;
    };
    auto given = GENERATE(Catch::Generators::values<case_>({
        {"orders", "1234", {}},
        {"session", "0f8fad5b-d9cb-469f-a165-70867728950e", {}},
        {"product", "sku-1", {{"vendor", "acme"}}},
        {"a", "b", {{"x", "1"}, {"y", "2"}, {"x", "3"}}},
    }));

    auto u = urnkit::urn::parse(urnkit::compose(given.entity, given.id, given.attrs));
    CHECK(u.entity == given.entity);
    CHECK(u.id == given.id);
    CHECK(u.attributes == given.attrs);
}

TEST_CASE("Composed URNs may be at most 255 characters") {
    // "urn:order:" is 10 characters
    auto at_limit = urnkit::compose("order", std::string(245, 'x'));
    CHECK(at_limit.size() == 255);
    CHECK(compose_error_of("order", std::string(246, 'x')) == urn_errc::too_long);

    // Escaping is applied before the length is checked. Each ':' becomes three characters.
    // "urn:abc:" is 8 characters, and 82 escaped colons are 246 characters.
    auto colons = std::string(82, ':');
    CHECK(urnkit::compose("abc", colons + "x").size() == 255);
    CHECK(compose_error_of("abc", colons + "xy") == urn_errc::too_long);
    CHECK_THROWS_WITH(urnkit::compose("abc", colons + "xy"),
                      Catch::Contains("(256 chars, max 255)"));

    // Attributes count toward the length
    CHECK(compose_error_of("order", std::string(241, 'x'), {{"k", "v"}}) == urn_errc::none);
    CHECK(compose_error_of("order", std::string(242, 'x'), {{"k", "v"}}) == urn_errc::too_long);
}

TEST_CASE("First match and last match attribute lookups") {
    auto u = urnkit::urn::parse("urn:orders:1234:status:new:status:shipped");
    REQUIRE(u.find("status"));
    CHECK(u.find("status")->value == "new");
    CHECK(u.attribute_map().at("status") == "shipped");
    CHECK(u.find("missing") == nullptr);
}
