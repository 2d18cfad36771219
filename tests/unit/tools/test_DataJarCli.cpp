#include <doctest/doctest.h>

#include "tools/cli/DataJarCli.hpp"

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using DJ::Tools::CLI::DataJarCli;

namespace {
auto make_argv(std::initializer_list<const char*> list) {
    return std::vector<const char*>(list);
}

auto quiet(DataJarCli& cli, std::vector<std::string>& errors) {
    cli.set_error_logger([&errors](std::string const& message) { errors.push_back(message); });
}
} // namespace

TEST_SUITE("tools.cli.parser") {
    TEST_CASE("Values in both spellings and flags") {
        DataJarCli cli;
        std::vector<std::string> errors;
        quiet(cli, errors);

        std::optional<std::string> key;
        std::optional<std::string> type;
        bool help = false;
        cli.add_value("--key", {.on_value = [&](std::optional<std::string_view> value) -> DataJarCli::ParseError {
                           key = std::string(*value);
                           return std::nullopt;
                       }});
        cli.add_value("--type", {.on_value = [&](std::optional<std::string_view> value) -> DataJarCli::ParseError {
                           type = std::string(*value);
                           return std::nullopt;
                       }});
        cli.add_flag("--help", {.on_set = [&] { help = true; }});
        cli.add_alias("-h", "--help");

        auto argv = make_argv({"datajar", "--key", "config.theme", "--type=number", "-h"});
        CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
        CHECK(key == "config.theme");
        CHECK(type == "number");
        CHECK(help);
        CHECK(errors.empty());
    }

    TEST_CASE("Positionals are collected in order") {
        DataJarCli cli;
        std::vector<std::string> positionals;
        cli.set_positional_handler([&](std::string_view token) -> DataJarCli::ParseError {
            positionals.emplace_back(token);
            return std::nullopt;
        });
        int indent = 0;
        cli.add_int("--indent", {.on_value = [&](int value) { indent = value; }});

        auto argv = make_argv({"datajar", "eval", "--indent", "4", "-5 * 2", "--", "--not-an-option"});
        CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
        CHECK(indent == 4);
        CHECK(positionals == std::vector<std::string>{"eval", "-5 * 2", "--not-an-option"});
    }

    TEST_CASE("Values may start with a dash") {
        DataJarCli cli;
        std::optional<std::string> value;
        cli.add_value("--value", {.on_value = [&](std::optional<std::string_view> token) -> DataJarCli::ParseError {
                           value = std::string(*token);
                           return std::nullopt;
                       }});

        auto argv = make_argv({"datajar", "--value", "-12.5"});
        CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
        CHECK(value == "-12.5");
    }

    TEST_CASE("Errors") {
        SUBCASE("Missing value") {
            DataJarCli cli;
            std::vector<std::string> errors;
            quiet(cli, errors);
            cli.add_value("--key", {.on_value = [](std::optional<std::string_view>) -> DataJarCli::ParseError { return std::nullopt; }});
            cli.add_flag("--help", {.on_set = [] {}});

            auto argv = make_argv({"datajar", "--key", "--help"});
            CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
            CHECK(cli.had_errors());
            REQUIRE(errors.size() == 1);
            CHECK(errors[0] == "datajar: --key requires a value");
        }

        SUBCASE("Unknown option fails by default") {
            DataJarCli cli;
            std::vector<std::string> errors;
            quiet(cli, errors);
            auto argv = make_argv({"datajar", "--mystery"});
            CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
            REQUIRE(errors.size() == 1);
            CHECK(errors[0].find("--mystery") != std::string::npos);
        }

        SUBCASE("Unknown handler can accept") {
            DataJarCli cli;
            bool called = false;
            cli.set_unknown_argument_handler([&](std::string_view) {
                called = true;
                return true;
            });
            auto argv = make_argv({"datajar", "--mystery"});
            CHECK(cli.parse(static_cast<int>(argv.size()), argv.data()));
            CHECK(called);
        }

        SUBCASE("Flags take no value") {
            DataJarCli cli;
            std::vector<std::string> errors;
            quiet(cli, errors);
            cli.add_flag("--help", {.on_set = [] {}});
            auto argv = make_argv({"datajar", "--help=yes"});
            CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
        }

        SUBCASE("Integer options") {
            DataJarCli cli;
            std::vector<std::string> errors;
            quiet(cli, errors);
            cli.add_int("--indent", {.on_value = [](int) {}});
            auto argv = make_argv({"datajar", "--indent=two"});
            CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
            REQUIRE(errors.size() == 1);
            CHECK(errors[0] == "datajar: --indent expects a numeric value");
        }

        SUBCASE("Alias for a missing option") {
            DataJarCli cli;
            std::vector<std::string> errors;
            quiet(cli, errors);
            cli.add_alias("-x", "--nothing");
            CHECK(errors.size() == 1);
        }

        SUBCASE("Positional handler errors are reported") {
            DataJarCli cli;
            std::vector<std::string> errors;
            quiet(cli, errors);
            cli.set_program_name("jar");
            cli.set_positional_handler([](std::string_view) -> DataJarCli::ParseError { return std::string{"too many arguments"}; });
            auto argv = make_argv({"datajar", "extra"});
            CHECK_FALSE(cli.parse(static_cast<int>(argv.size()), argv.data()));
            REQUIRE(errors.size() == 1);
            CHECK(errors[0] == "jar: too many arguments");
        }
    }
}
