/**
 * Unit tests for screen, script and stack JSON handling
 */

#include <doctest/doctest.h>
#include <navstack/json.hpp>

#include <string>

using namespace navstack;

TEST_CASE("parse_screen") {
    SUBCASE("name only") {
        auto result = json::parse_screen(std::string(R"({"name": "home"})"));
        REQUIRE(result.ok);
        CHECK(result.value.name == "home");
        CHECK(result.value.params.empty());
    }

    SUBCASE("with params") {
        auto result = json::parse_screen(std::string(R"({
            "name": "details",
            "params": {"id": "42", "tab": "photos"}
        })"));
        REQUIRE(result.ok);
        CHECK(result.value.params.size() == 2);
        CHECK(result.value.params["id"] == "42");
        CHECK(result.warnings.empty());
    }

    SUBCASE("non-string params are kept with a warning") {
        auto result = json::parse_screen(std::string(R"({"name": "details", "params": {"id": 42}})"));
        REQUIRE(result.ok);
        CHECK(result.value.params["id"] == "42");
        CHECK(result.warnings.size() == 1);
    }

    SUBCASE("missing name") {
        auto result = json::parse_screen(std::string(R"({"params": {}})"));
        CHECK_FALSE(result.ok);
        CHECK(result.error == "screen.name must be a string");
    }

    SUBCASE("empty name") {
        auto result = json::parse_screen(std::string(R"({"name": ""})"));
        CHECK_FALSE(result.ok);
    }

    SUBCASE("invalid JSON") {
        auto result = json::parse_screen(std::string("{not json"));
        CHECK_FALSE(result.ok);
        CHECK(result.error.find("JSON parse error") != std::string::npos);
    }
}

TEST_CASE("screen_to_json omits empty params") {
    auto j = json::screen_to_json(Screen("home"));
    CHECK(j["name"] == "home");
    CHECK_FALSE(j.contains("params"));

    auto with_params = json::screen_to_json(Screen("details", {{"id", "7"}}));
    CHECK(with_params["params"]["id"] == "7");
}

TEST_CASE("to_string renders screens") {
    CHECK(to_string(Screen("home")) == "home");
    CHECK(to_string(Screen("details", {{"tab", "info"}, {"id", "7"}})) == "details{id=7,tab=info}");
}

TEST_CASE("parse_nav_script") {
    SUBCASE("top-level array") {
        auto result = json::parse_nav_script(R"([
            {"op": "go_to", "screen": {"name": "home"}},
            {"op": "go_to", "screen": {"name": "details", "params": {"id": "1"}}},
            {"op": "pop"},
            {"op": "pop_to", "screen": {"name": "home"}},
            {"op": "reset_root", "screen": {"name": "about"}}
        ])");
        REQUIRE(result.ok);
        REQUIRE(result.value.size() == 5);
        CHECK(result.value[0].type == NavEventType::GoTo);
        CHECK(result.value[1].destination->params.at("id") == "1");
        CHECK(result.value[2].type == NavEventType::Pop);
        CHECK_FALSE(result.value[2].destination.has_value());
        CHECK(result.value[3].type == NavEventType::PopTo);
        CHECK(result.value[4].type == NavEventType::ResetRoot);
    }

    SUBCASE("events object") {
        auto result = json::parse_nav_script(R"({"events": [{"op": "pop"}]})");
        REQUIRE(result.ok);
        CHECK(result.value.size() == 1);
    }

    SUBCASE("unknown op reports its index") {
        auto result = json::parse_nav_script(R"([{"op": "pop"}, {"op": "jump"}])", "nav.json");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "nav.json[1]: unknown op: jump");
    }

    SUBCASE("go_to without screen") {
        auto result = json::parse_nav_script(R"([{"op": "go_to"}])");
        CHECK_FALSE(result.ok);
        CHECK(result.error == "script[0]: go_to requires a screen");
    }

    SUBCASE("pop with screen warns") {
        auto result = json::parse_nav_script(R"([{"op": "pop", "screen": {"name": "x"}}])");
        REQUIRE(result.ok);
        REQUIRE(result.warnings.size() == 1);
        CHECK(result.warnings[0] == "script[0]: pop ignores screen");
    }

    SUBCASE("object without events") {
        auto result = json::parse_nav_script(R"({"steps": []})");
        CHECK_FALSE(result.ok);
    }
}

TEST_CASE("nav_event_to_json") {
    auto j = json::nav_event_to_json(NavEvent<Screen>::pop_to(Screen("home")));
    CHECK(j["op"] == "pop_to");
    CHECK(j["screen"]["name"] == "home");

    auto pop = json::nav_event_to_json(NavEvent<Screen>::pop());
    CHECK(pop["op"] == "pop");
    CHECK_FALSE(pop.contains("screen"));
}

TEST_CASE("stack_to_json lists records top-first") {
    ScreenBackStack stack;
    stack.push(ScreenRecord("a", Screen("home")));
    stack.push(ScreenRecord("b", Screen("details", {{"id", "3"}})));

    auto j = json::stack_to_json(stack);
    CHECK(j["size"] == 2);
    CHECK(j["version"] == 2);
    REQUIRE(j["records"].size() == 2);
    CHECK(j["records"][0]["key"] == "b");
    CHECK(j["records"][0]["screen"]["params"]["id"] == "3");
    CHECK(j["records"][1]["key"] == "a");
    CHECK(j["records"][1]["screen"]["name"] == "home");
}
