#include "path/PathResolver.hpp"

#include <doctest/doctest.h>

#include <utility>

using namespace DJ;

namespace {
auto sampleJar() -> Nodes {
    return Nodes{
            Node{"greeting", Text{"Hello World"}},
            Node{"config", Dictionary{Nodes{Node{"theme", Text{"dark"}}, Node{"fontSize", Number{14}}}}},
            Node{"users", List{Nodes{
                                  Node{"0", Dictionary{Nodes{Node{"name", Text{"Alice"}}}}},
                                  Node{"1", Dictionary{Nodes{Node{"name", Text{"Bob"}}}}},
                          }}},
    };
}
} // namespace

TEST_SUITE("path.resolver") {
    TEST_CASE("Resolves by name") {
        auto const jar = sampleJar();

        auto const* theme = resolve(jar, "config.theme");
        REQUIRE(theme != nullptr);
        CHECK(std::get<Text>(theme->payload).value == "dark");

        auto const* greeting = resolve(jar, "greeting");
        REQUIRE(greeting != nullptr);
        CHECK(greeting->name == "greeting");

        auto const* name = resolve(jar, "users.1.name");
        REQUIRE(name != nullptr);
        CHECK(std::get<Text>(name->payload).value == "Bob");
    }

    TEST_CASE("Falls back to position") {
        auto jar = sampleJar();
        // Deleting the first user keeps the remaining name "1" at position 0.
        jar[2].children()->erase(jar[2].children()->begin());

        auto const* byName = resolve(jar, "users.1.name");
        REQUIRE(byName != nullptr);
        CHECK(std::get<Text>(byName->payload).value == "Bob");

        auto const* byPosition = resolve(jar, "users.0.name");
        REQUIRE(byPosition != nullptr);
        CHECK(std::get<Text>(byPosition->payload).value == "Bob");

        auto const* rootPosition = resolve(jar, "0");
        REQUIRE(rootPosition != nullptr);
        CHECK(rootPosition->name == "greeting");
    }

    TEST_CASE("Misses") {
        auto const jar = sampleJar();
        CHECK(resolve(jar, "missing") == nullptr);
        CHECK(resolve(jar, "config.missing") == nullptr);
        CHECK(resolve(jar, "greeting.length") == nullptr);
        CHECK(resolve(jar, "users.5") == nullptr);
        CHECK(resolve(jar, "") == nullptr);
        CHECK(resolve(jar, "config..theme") == nullptr);
        CHECK(resolve(jar, "config theme") == nullptr);
    }

    TEST_CASE("Mutable lookup") {
        auto jar = sampleJar();
        auto* size = resolve(jar, "config.fontSize");
        REQUIRE(size != nullptr);
        size->payload = Number{16};
        CHECK(std::get<Number>(resolve(std::as_const(jar), "config.fontSize")->payload).value == 16);
    }
}
