#include "path/PathResolver.hpp"
#include "persistence/JarStore.hpp"
#include "trigger/TriggerRequest.hpp"

#include <doctest/doctest.h>

#include <cmath>

using namespace DJ;

TEST_SUITE("trigger.request") {
    TEST_CASE("Query parsing") {
        SUBCASE("Full URL") {
            auto request = parseTriggerQuery("https://jar.example/app?key=config.theme&value=light&type=text&action=set");
            REQUIRE(request.has_value());
            CHECK(request->key == "config.theme");
            CHECK(request->value == "light");
            CHECK(request->type == "text");
        }

        SUBCASE("Bare query with defaults") {
            auto request = parseTriggerQuery("key=flag");
            REQUIRE(request.has_value());
            CHECK(request->value.empty());
            CHECK(request->type == "text");
        }

        SUBCASE("Decoding") {
            auto request = parseTriggerQuery("?key=greeting&value=Hello+big%20World%21&type=text#frag");
            REQUIRE(request.has_value());
            CHECK(request->value == "Hello big World!");
        }

        SUBCASE("First occurrence wins") {
            auto request = parseTriggerQuery("?key=a&key=b&value=1&value=2");
            REQUIRE(request.has_value());
            CHECK(request->key == "a");
            CHECK(request->value == "1");
        }

        SUBCASE("Empty type means text") {
            auto request = parseTriggerQuery("?key=a&type=");
            REQUIRE(request.has_value());
            CHECK(request->type == "text");
        }

        SUBCASE("No key") {
            CHECK_FALSE(parseTriggerQuery("").has_value());
            CHECK_FALSE(parseTriggerQuery("?value=1").has_value());
            CHECK_FALSE(parseTriggerQuery("?key=&value=1").has_value());
        }
    }

    TEST_CASE("Payload coercion") {
        auto number = triggerPayload(TriggerRequest{.key = "n", .value = "42", .type = "number"});
        REQUIRE(number.has_value());
        CHECK(std::get<Number>(*number).value == 42);

        auto boolean = triggerPayload(TriggerRequest{.key = "b", .value = "yes", .type = "boolean"});
        REQUIRE(boolean.has_value());
        CHECK_FALSE(std::get<Boolean>(*boolean).value);

        auto list = triggerPayload(TriggerRequest{.key = "l", .value = "x", .type = "list"});
        REQUIRE(list.has_value());
        CHECK(kindOf(*list) == NodeKind::List);

        for (auto type : {"expression", "object", "Number"}) {
            auto rejected = triggerPayload(TriggerRequest{.key = "k", .value = "v", .type = type});
            REQUIRE_FALSE(rejected.has_value());
            CHECK(rejected.error().code == Error::Code::InvalidType);
        }
    }

    TEST_CASE("Applying a trigger") {
        auto const jar = defaultJar();

        auto applied = applyTrigger(jar, TriggerRequest{.key = "config.theme", .value = "light"});
        REQUIRE(applied.has_value());
        CHECK(applied->acknowledgement == "Updated key \"config.theme\"");
        CHECK(applied->set.outcome == DeepSetOutcome::Replaced);
        CHECK(std::get<Text>(resolve(applied->set.root, "config.theme")->payload).value == "light");

        auto created = applyTrigger(jar, TriggerRequest{.key = "stats.visits", .value = "3", .type = "number"});
        REQUIRE(created.has_value());
        CHECK(created->set.outcome == DeepSetOutcome::Created);
        CHECK(std::get<Number>(resolve(created->set.root, "stats.visits")->payload).value == 3);

        auto blocked = applyTrigger(jar, TriggerRequest{.key = "price.amount", .value = "1", .type = "number"});
        REQUIRE(blocked.has_value());
        CHECK(blocked->set.outcome == DeepSetOutcome::Blocked);
        CHECK(blocked->acknowledgement.find("blocked") != std::string::npos);
        CHECK(structurallyEqual(blocked->set.root, jar));

        auto invalid = applyTrigger(jar, TriggerRequest{.key = "bad key", .value = "1"});
        REQUIRE_FALSE(invalid.has_value());
        CHECK(invalid.error().code == Error::Code::InvalidPath);
    }

    TEST_CASE("URL building") {
        TriggerRequest const request{.key = "config.theme", .value = "dark & stormy/50%", .type = "text"};
        auto const url = buildTriggerUrl("https://jar.example/", request);
        CHECK(url == "https://jar.example/?key=config.theme&value=dark+%26+stormy%2F50%25&type=text&action=set");

        auto parsed = parseTriggerQuery(url);
        REQUIRE(parsed.has_value());
        CHECK(parsed->key == request.key);
        CHECK(parsed->value == request.value);
        CHECK(parsed->type == request.type);
    }

    TEST_CASE("Percent coding") {
        CHECK(percentEncode("a-b_c.d*e") == "a-b_c.d*e");
        CHECK(percentEncode("a b") == "a+b");
        CHECK(percentEncode("{{x}}") == "%7B%7Bx%7D%7D");
        CHECK(percentDecode("%7b%7Bx%7D%7d") == "{{x}}");
        CHECK(percentDecode("100%") == "100%");
        CHECK(percentDecode("%zz") == "%zz");
    }
}

TEST_SUITE("trigger.inbox") {
    TEST_CASE("take hands the request out once") {
        TriggerInbox inbox;
        CHECK_FALSE(inbox.pending());
        CHECK_FALSE(inbox.take().has_value());

        inbox.post(std::string_view{"?key=a&value=1"});
        CHECK(inbox.pending());
        auto first = inbox.take();
        REQUIRE(first.has_value());
        CHECK(first->key == "a");

        CHECK_FALSE(inbox.pending());
        CHECK_FALSE(inbox.take().has_value());
    }

    TEST_CASE("A post without a key clears the inbox") {
        TriggerInbox inbox;
        inbox.post(TriggerRequest{.key = "a"});
        CHECK(inbox.pending());
        inbox.post(std::string_view{"?value=1"});
        CHECK_FALSE(inbox.pending());

        inbox.post(TriggerRequest{.key = "b"});
        inbox.post(TriggerRequest{});
        CHECK_FALSE(inbox.pending());
    }
}
