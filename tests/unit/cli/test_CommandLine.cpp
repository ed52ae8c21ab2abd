#include <doctest/doctest.h>
#include "cli/CommandLine.hpp"

#include <optional>
#include <string>
#include <vector>

using GS::Cli::CommandLine;

namespace {

struct Parsed {
    bool                       help = false;
    std::optional<std::string> config;
    std::optional<long long>   seed;
    std::optional<double>      scale;
};

auto makeParser(Parsed& parsed, std::vector<std::string>& errors) -> CommandLine {
    CommandLine cli;
    cli.set_program_name("groundsynth_cli generate");
    cli.set_error_logger([&errors](std::string const& message) { errors.push_back(message); });
    cli.add_flag("--help", {.on_set = [&parsed] { parsed.help = true; }});
    cli.add_value("--config", {.on_value = [&parsed](std::string_view value) -> CommandLine::ParseError {
                      parsed.config = std::string(value);
                      return std::nullopt;
                  }});
    cli.add_int("--seed", {.on_value = [&parsed](long long value) -> CommandLine::ParseError {
                    if (value < 0)
                        return std::string{"--seed must be non-negative"};
                    parsed.seed = value;
                    return std::nullopt;
                }});
    cli.add_double("--scale", {.on_value = [&parsed](double value) -> CommandLine::ParseError {
                       parsed.scale = value;
                       return std::nullopt;
                   }});
    cli.add_alias("-c", "--config");
    cli.add_alias("-h", "--help");
    return cli;
}

} // namespace

TEST_SUITE("cli.command_line") {

TEST_CASE("options, aliases and positionals") {
    Parsed                   parsed;
    std::vector<std::string> errors;
    auto                     cli = makeParser(parsed, errors);

    char const* argv[] = {"groundsynth_cli", "generate", "-c", "run.json", "--seed=42", "out", "--scale", "0.5", "-h"};
    REQUIRE(cli.parse(9, argv, 2));
    CHECK(errors.empty());
    CHECK(parsed.help);
    CHECK(parsed.config == "run.json");
    CHECK(parsed.seed == 42);
    CHECK(parsed.scale == doctest::Approx(0.5));
    CHECK(cli.positionals() == std::vector<std::string>{"out"});
}

TEST_CASE("double dash ends option parsing") {
    Parsed                   parsed;
    std::vector<std::string> errors;
    auto                     cli = makeParser(parsed, errors);

    char const* argv[] = {"tool", "--", "--help", "-x"};
    REQUIRE(cli.parse(4, argv));
    CHECK_FALSE(parsed.help);
    CHECK(cli.positionals() == std::vector<std::string>{"--help", "-x"});
}

TEST_CASE("bad values are reported with the program name") {
    Parsed                   parsed;
    std::vector<std::string> errors;
    auto                     cli = makeParser(parsed, errors);

    SUBCASE("not an integer") {
        char const* argv[] = {"tool", "--seed", "7x"};
        CHECK_FALSE(cli.parse(3, argv));
        REQUIRE(errors.size() == 1);
        CHECK(errors[0] == "groundsynth_cli generate: --seed expects an integer, got '7x'");
        CHECK_FALSE(parsed.seed.has_value());
    }
    SUBCASE("handler rejects the value") {
        char const* argv[] = {"tool", "--seed", "-3"};
        CHECK_FALSE(cli.parse(3, argv));
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].find("--seed must be non-negative") != std::string::npos);
    }
    SUBCASE("not a number") {
        char const* argv[] = {"tool", "--scale=fast"};
        CHECK_FALSE(cli.parse(2, argv));
        CHECK(cli.had_errors());
    }
    SUBCASE("value missing at the end") {
        char const* argv[] = {"tool", "--config"};
        CHECK_FALSE(cli.parse(2, argv));
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].find("--config requires a value") != std::string::npos);
    }
    SUBCASE("flag given a value") {
        char const* argv[] = {"tool", "--help=yes"};
        CHECK_FALSE(cli.parse(2, argv));
        CHECK_FALSE(parsed.help);
    }
}

TEST_CASE("unknown options") {
    Parsed                   parsed;
    std::vector<std::string> errors;
    auto                     cli = makeParser(parsed, errors);

    char const* argv[] = {"tool", "--frobnicate", "data"};
    CHECK_FALSE(cli.parse(3, argv));
    REQUIRE(errors.size() == 1);
    CHECK(errors[0].find("unknown option '--frobnicate'") != std::string::npos);
}

TEST_CASE("alias to a missing option is an error") {
    CommandLine              cli;
    std::vector<std::string> errors;
    cli.set_error_logger([&errors](std::string const& message) { errors.push_back(message); });
    cli.add_alias("-z", "--zoom");
    CHECK(cli.had_errors());
    REQUIRE(errors.size() == 1);
    CHECK(errors[0] == "groundsynth: missing option for alias '--zoom'");
}

} // TEST_SUITE
