#include <doctest/doctest.h>
#include <genspec/stream/LineParser.hpp>

using namespace GS;
using namespace GS::Stream;

TEST_SUITE_BEGIN("stream.lines");

TEST_CASE("Stream line classification") {
    SUBCASE("Blank and comments") {
        CHECK(ParseStreamLine("").kind == LineKind::Empty);
        CHECK(ParseStreamLine("   \t").kind == LineKind::Empty);
        CHECK(ParseStreamLine("// building the header").kind == LineKind::Comment);
    }

    SUBCASE("Commentary is kept as text") {
        auto line = ParseStreamLine("  Sure! Here is your dashboard.  ");
        CHECK(line.kind == LineKind::Commentary);
        CHECK(line.text == "Sure! Here is your dashboard.");
        CHECK_FALSE(line.problem.has_value());
    }

    SUBCASE("Patch") {
        auto line = ParseStreamLine(R"({"op":"add","path":"/root","value":"page"})");
        REQUIRE(line.kind == LineKind::Patch);
        REQUIRE(line.patches.size() == 1);
        CHECK(line.patches[0].path == "/root");
        CHECK(line.strippedChars == 0);
    }

    SUBCASE("Batch of patches") {
        auto line = ParseStreamLine(R"([{"op":"add","path":"/root","value":"a"},{"op":"bogus","path":"/x"},{"op":"remove","path":"/state"}])");
        REQUIRE(line.kind == LineKind::Patch);
        CHECK(line.patches.size() == 2);
        CHECK(line.problem.has_value());
    }

    SUBCASE("Usage telemetry") {
        auto line = ParseStreamLine(R"({"__meta":"usage","promptTokens":120,"completionTokens":80,"totalTokens":200})");
        REQUIRE(line.kind == LineKind::Usage);
        REQUIRE(line.usage.has_value());
        CHECK(line.usage->promptTokens == 120);
        CHECK(line.usage->completionTokens == 80);
        CHECK(line.usage->totalTokens == 200);
    }

    SUBCASE("Valid JSON that is not a patch") {
        auto line = ParseStreamLine(R"({"hello":"world"})");
        CHECK(line.kind == LineKind::Ignored);
        CHECK(line.problem.has_value());
        CHECK(ParseStreamLine("[1, 2]").kind == LineKind::Ignored);
    }
}

TEST_CASE("Stream line recovery") {
    SUBCASE("One extra closer") {
        auto line = ParseStreamLine(R"({"op":"add","path":"/nodes/a","value":{"type":"Text"}}})");
        REQUIRE(line.kind == LineKind::Patch);
        CHECK(line.strippedChars == 1);
        CHECK(line.patches[0].value == Json::parse(R"({"type":"Text"})"));
    }

    SUBCASE("Three extra closers") {
        auto line = ParseStreamLine(R"({"op":"add","path":"/root","value":"a"}]}])");
        REQUIRE(line.kind == LineKind::Patch);
        CHECK(line.strippedChars == 3);
    }

    SUBCASE("Four extra closers are too many") {
        auto line = ParseStreamLine(R"({"op":"add","path":"/root","value":"a"}}}}})");
        CHECK(line.kind == LineKind::Malformed);
        CHECK(line.patches.empty());
    }

    SUBCASE("Truncated lines are malformed") {
        CHECK(ParseStreamLine(R"({"op":"add","path":"/root","val)").kind == LineKind::Malformed);
        CHECK(ParseStreamLine("{").kind == LineKind::Malformed);
        CHECK(ParseStreamLine("}").kind == LineKind::Commentary);
    }

    CHECK(lineKindName(LineKind::Malformed) == "malformed");
    CHECK(lineKindName(LineKind::Commentary) == "commentary");
}

TEST_CASE("Line splitter") {
    LineSplitter splitter;
    CHECK(splitter.push("{\"a\":").empty());
    auto lines = splitter.push("1}\n{\"b\":2}\n{\"c\"");
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "{\"a\":1}");
    CHECK(lines[1] == "{\"b\":2}");
    CHECK(splitter.push(":3}").empty());
    CHECK(splitter.finish() == std::optional<std::string>{"{\"c\":3}"});
    CHECK_FALSE(splitter.finish().has_value());

    auto blanks = splitter.push("\n\nx\n");
    CHECK(blanks == std::vector<std::string>{"", "", "x"});

    splitter.push("partial");
    splitter.reset();
    CHECK_FALSE(splitter.finish().has_value());
}

TEST_SUITE_END();
