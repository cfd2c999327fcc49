#include <doctest/doctest.h>
#include <navstack/config.hpp>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace navstack;

TEST_CASE("config defaults") {
    auto result = parse_config("{}");
    REQUIRE(result.ok);
    CHECK(result.config.log_level == spdlog::level::warn);
    CHECK(result.config.warnings.empty());
    CHECK(result.warnings.empty());
}

TEST_CASE("config parses log level and warning policy") {
    const char* json = R"({
        "log_level": "DEBUG",
        "warnings": {
            "duplicate_record_key": "error",
            "pop_at_root": "ignore"
        }
    })";
    auto result = parse_config(json, "navstack.json");
    REQUIRE(result.ok);
    CHECK(result.config.source_path == "navstack.json");
    CHECK(result.config.log_level == spdlog::level::debug);
    REQUIRE(result.config.warnings.size() == 2);
    CHECK(result.config.warnings["duplicate_record_key"] == WarningAction::Error);
    CHECK(result.config.warnings["pop_at_root"] == WarningAction::Ignore);
}

TEST_CASE("config reports unknown entries as warnings") {
    const char* json = R"({
        "log_level": "loud",
        "warnings": {
            "not_a_warning": "error",
            "pop_to_missing": "explode",
            "pop_at_root": 3
        }
    })";
    auto result = parse_config(json);
    REQUIRE(result.ok);
    CHECK(result.config.log_level == spdlog::level::warn);
    CHECK(result.config.warnings.empty());
    CHECK(result.warnings.size() == 4);
}

TEST_CASE("config rejects malformed documents") {
    SUBCASE("invalid JSON") {
        auto result = parse_config("{");
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("JSON parse error") == 0);
    }

    SUBCASE("root is not an object") {
        auto result = parse_config("[]");
        CHECK_FALSE(result.ok);
    }

    SUBCASE("warnings is not an object") {
        auto result = parse_config(R"({"warnings": ["pop_at_root"]})");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "warnings must be an object");
    }

    SUBCASE("log_level is not a string") {
        auto result = parse_config(R"({"log_level": 1})");
        CHECK_FALSE(result.ok);
    }
}

TEST_CASE("parse_log_level accepts spdlog names") {
    CHECK(parse_log_level("trace") == spdlog::level::trace);
    CHECK(parse_log_level("warning") == spdlog::level::warn);
    CHECK(parse_log_level("error") == spdlog::level::err);
    CHECK(parse_log_level("OFF") == spdlog::level::off);
    CHECK_FALSE(parse_log_level("verbose").has_value());
}

TEST_CASE("load_config reads files") {
    std::string path = "navstack_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"log_level": "info"})";
    }

    auto result = load_config(path);
    std::remove(path.c_str());

    REQUIRE(result.ok);
    CHECK(result.config.log_level == spdlog::level::info);
    CHECK(result.config.source_path == path);

    auto missing = load_config("does/not/exist.json");
    CHECK_FALSE(missing.ok);
}

TEST_CASE("resolve_config_path prefers explicit path") {
    CHECK(resolve_config_path(std::string("explicit.json")) == "explicit.json");

#ifndef _WIN32
    setenv("NAVSTACK_CONFIG", "from_env.json", 1);
    CHECK(resolve_config_path(std::nullopt) == "from_env.json");
    CHECK(resolve_config_path(std::string("explicit.json")) == "explicit.json");
    unsetenv("NAVSTACK_CONFIG");
    CHECK_FALSE(resolve_config_path(std::nullopt).has_value());
#endif
}
