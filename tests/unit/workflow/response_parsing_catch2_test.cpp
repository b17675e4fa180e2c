// Catch2 tests for model response parsing

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

#include <evistore/workflow/response_parsing.h>

using namespace evistore::workflow;

TEST_CASE("ResponseParsing - extractJson", "[workflow][parsing][catch2]") {
    SECTION("fenced object") {
        auto j = extractJson("Summary text.\n```json\n{\"age\": \"25-34\", \"n\": 3}\n```");
        REQUIRE(j.is_object());
        CHECK(j["age"] == "25-34");
        CHECK(j["n"] == 3);
    }
    SECTION("no object") {
        CHECK(extractJson("plain prose only").empty());
    }
    SECTION("broken object") {
        CHECK(extractJson("text {not: json} more").empty());
    }
    SECTION("array is not an object") {
        CHECK(extractJson("[1, 2]").empty());
    }
}

TEST_CASE("ResponseParsing - formatResponse strips trailing JSON", "[workflow][parsing][catch2]") {
    CHECK(formatResponse("  Insight one.\n```json\n{\"a\": 1}\n```\n") == "Insight one.");
    CHECK(formatResponse("Insight two.\n{\"a\": 1}") == "Insight two.");
    CHECK(formatResponse("Just text {inline} here.") == "Just text {inline} here.");
    CHECK(formatResponse("   ") == "");
}

TEST_CASE("ResponseParsing - extractBullets", "[workflow][parsing][catch2]") {
    SECTION("bullet and dash lines") {
        auto bullets = extractBullets("Intro line\n  \xE2\x80\xA2 First idea\n- Second idea\n"
                                      "not a bullet\n");
        CHECK(bullets == std::vector<std::string>{"\xE2\x80\xA2 First idea", "- Second idea"});
    }
    SECTION("no bullets wraps the whole response") {
        CHECK(extractBullets("  Offer a student discount.  ") ==
              std::vector<std::string>{"\xE2\x80\xA2 Offer a student discount."});
    }
    SECTION("empty response") {
        CHECK(extractBullets("").empty());
        CHECK(extractBullets(" \n ").empty());
    }
}
