#include <doctest/doctest.h>
#include <genspec/expr/ExpressionResolver.hpp>

using namespace GS;
using namespace GS::Expr;

namespace {

auto context_for(Json const& state) -> ResolveContext {
    return MakeContext(std::make_shared<Json const>(state));
}

auto repeat_context(Json const& state, Json item, std::size_t index, std::string base) -> ResolveContext {
    auto ctx           = context_for(state);
    ctx.repeatItem     = std::move(item);
    ctx.repeatIndex    = index;
    ctx.repeatBasePath = std::move(base);
    return ctx;
}

} // namespace

TEST_SUITE_BEGIN("expr.resolver");

TEST_CASE("Resolver values") {
    ExpressionResolver resolver;
    auto ctx = context_for(Json::parse(R"({"user": {"name": "Ada", "admin": true}, "count": 5, "items": [10, 20]})"));

    SUBCASE("Literals pass through") {
        CHECK(resolver.resolve(Json("plain"), ctx) == Json("plain"));
        CHECK(resolver.resolve(Json(nullptr), ctx) == Json(nullptr));
    }

    SUBCASE("State references") {
        CHECK(resolver.resolve(Json::parse(R"({"$state": "/user/name"})"), ctx) == Json("Ada"));
        CHECK(resolver.resolve(Json::parse(R"({"$state": "/items/1"})"), ctx) == Json(20));
        CHECK_FALSE(resolver.resolve(Json::parse(R"({"$state": "/missing"})"), ctx).has_value());
    }

    SUBCASE("Nested containers") {
        auto value = resolver.resolve(Json::parse(R"({"label": {"$state": "/user/name"}, "list": [{"$state": "/count"}, {"$state": "/nope"}], "gone": {"$state": "/nope"}})"), ctx);
        REQUIRE(value.has_value());
        CHECK((*value)["label"] == "Ada");
        CHECK((*value)["list"] == Json::parse("[5, null]"));
        CHECK_FALSE(value->contains("gone"));
    }

    SUBCASE("Conditional values") {
        auto expr = Json::parse(R"({"$cond": {"$state": "/user/admin"}, "$then": "Admin", "$else": "User"})");
        CHECK(resolver.resolve(expr, ctx) == Json("Admin"));
        auto other = Json::parse(R"({"$cond": {"$state": "/count", "lt": 3}, "$then": "few", "$else": "many"})");
        CHECK(resolver.resolve(other, ctx) == Json("many"));
    }

    SUBCASE("Re-evaluation sees new state") {
        StateStore store{Json::parse(R"({"n": 1})")};
        auto       expr = ParseExpression(Json::parse(R"({"$state": "/n"})"));
        CHECK(resolver.resolve(*expr, MakeContext(store.snapshot())) == Json(1));
        store.set("/n", Json(2));
        CHECK(resolver.resolve(*expr, MakeContext(store.snapshot())) == Json(2));
    }
}

TEST_CASE("Resolver computed functions") {
    ExpressionResolver resolver;
    resolver.registerFunction("fullName", [](Json const& args) {
        return Json(args.value("first", std::string{}) + " " + args.value("last", std::string{}));
    });
    CHECK(resolver.hasFunction("fullName"));
    CHECK_FALSE(resolver.hasFunction("missing"));

    auto ctx = context_for(Json::parse(R"({"first": "Ada", "last": "Lovelace"})"));
    auto expr = Json::parse(R"({"$computed": "fullName", "args": {"first": {"$state": "/first"}, "last": {"$state": "/last"}}})");
    CHECK(resolver.resolve(expr, ctx) == Json("Ada Lovelace"));

    SUBCASE("Unknown function resolves to nothing") {
        CHECK_FALSE(resolver.resolve(Json::parse(R"({"$computed": "missing"})"), ctx).has_value());
    }

    SUBCASE("Functions given at construction") {
        FunctionMap functions;
        functions.emplace("answer", [](Json const&) { return Json(42); });
        ExpressionResolver seeded{std::move(functions)};
        CHECK(seeded.resolve(Json::parse(R"({"$computed": "answer"})"), ctx) == Json(42));
    }
}

TEST_CASE("Resolver repeat scope") {
    ExpressionResolver resolver;
    Json state = Json::parse(R"({"todos": [{"title": "a", "done": false}, {"title": "b", "done": true}]})");
    auto ctx   = repeat_context(state, state["todos"][1], 1, "/todos/1");

    CHECK(resolver.resolve(Json::parse(R"({"$item": "title"})"), ctx) == Json("b"));
    CHECK(resolver.resolve(Json::parse(R"({"$item": ""})"), ctx) == state["todos"][1]);
    CHECK(resolver.resolve(Json::parse(R"({"$index": true})"), ctx) == Json(1));

    SUBCASE("Outside a repeat") {
        auto plain = context_for(state);
        CHECK_FALSE(resolver.resolve(Json::parse(R"({"$item": "title"})"), plain).has_value());
        CHECK_FALSE(resolver.resolve(Json::parse(R"({"$index": true})"), plain).has_value());
    }

    SUBCASE("Bindings") {
        auto props    = Json::parse(R"({"checked": {"$bindItem": "done"}, "value": {"$bindState": "/filter"}, "label": "x"})");
        auto bindings = resolver.resolveBindings(props, ctx);
        CHECK(bindings.size() == 2);
        CHECK(bindings.at("checked") == "/todos/1/done");
        CHECK(bindings.at("value") == "/filter");
        CHECK(resolver.resolveBindings(props, context_for(state)).size() == 1);
    }

    SUBCASE("Action params resolve $item to a path") {
        auto params = resolver.resolveActionParams(Json::parse(R"({"statePath": {"$item": "done"}, "value": {"$state": "/todos/0/title"}, "n": 3})"), ctx);
        CHECK(params["statePath"] == "/todos/1/done");
        CHECK(params["value"] == "a");
        CHECK(params["n"] == 3);
    }

    SUBCASE("Bound values resolve to current data") {
        CHECK(resolver.resolve(Json::parse(R"({"$bindItem": "done"})"), ctx) == Json(true));
        CHECK_FALSE(resolver.resolve(Json::parse(R"({"$bindState": "/filter"})"), ctx).has_value());
    }
}

TEST_CASE("Resolver conditions") {
    ExpressionResolver resolver;
    auto ctx = context_for(Json::parse(R"({"flag": true, "off": false, "count": 3, "name": "", "role": "admin", "list": []})"));

    CHECK(resolver.evaluateCondition(Json(true), ctx));
    CHECK_FALSE(resolver.evaluateCondition(Json(false), ctx));
    CHECK(resolver.evaluateCondition(Json::parse(R"({"$state": "/flag"})"), ctx));
    CHECK_FALSE(resolver.evaluateCondition(Json::parse(R"({"$state": "/off"})"), ctx));
    CHECK_FALSE(resolver.evaluateCondition(Json::parse(R"({"$state": "/name"})"), ctx));
    CHECK_FALSE(resolver.evaluateCondition(Json::parse(R"({"$state": "/missing"})"), ctx));
    CHECK(resolver.evaluateCondition(Json::parse(R"({"$state": "/list"})"), ctx));
    CHECK(resolver.evaluateCondition(Json::parse(R"({"$state": "/off", "not": true})"), ctx));

    SUBCASE("Comparisons") {
        CHECK(resolver.evaluateCondition(Json::parse(R"({"$state": "/role", "eq": "admin"})"), ctx));
        CHECK(resolver.evaluateCondition(Json::parse(R"({"$state": "/role", "neq": "guest"})"), ctx));
        CHECK(resolver.evaluateCondition(Json::parse(R"({"$state": "/count", "gte": 3})"), ctx));
        CHECK_FALSE(resolver.evaluateCondition(Json::parse(R"({"$state": "/count", "gt": 3})"), ctx));
        CHECK(resolver.evaluateCondition(Json::parse(R"({"$state": "/count", "lt": {"$state": "/limit"}, "not": true})"), ctx));
        CHECK_FALSE(resolver.evaluateCondition(Json::parse(R"({"$state": "/role", "gt": 1})"), ctx));
        CHECK(resolver.evaluateCondition(Json::parse(R"({"$state": "/missing", "eq": {"$state": "/alsoMissing"}})"), ctx));
    }

    SUBCASE("Logic") {
        CHECK(resolver.evaluateCondition(Json::parse(R"([{"$state": "/flag"}, {"$state": "/count", "eq": 3}])"), ctx));
        CHECK_FALSE(resolver.evaluateCondition(Json::parse(R"([{"$state": "/flag"}, {"$state": "/off"}])"), ctx));
        CHECK(resolver.evaluateCondition(Json::parse(R"({"$or": [{"$state": "/off"}, {"$state": "/flag"}]})"), ctx));
        CHECK(resolver.evaluateCondition(Json::parse(R"({"$not": {"$state": "/off"}})"), ctx));
        CHECK(resolver.evaluateCondition(Json::parse(R"({"$and": []})"), ctx));
        CHECK_FALSE(resolver.evaluateCondition(Json::parse(R"({"$or": []})"), ctx));
    }

    SUBCASE("Visibility") {
        CHECK(resolver.evaluateVisibility(std::nullopt, ctx));
        CHECK_FALSE(resolver.evaluateVisibility(Json::parse(R"({"$state": "/off"})"), ctx));
    }
}

TEST_CASE("Resolver props") {
    ExpressionResolver resolver;
    auto ctx   = context_for(Json::parse(R"({"title": "Hello"})"));
    auto props = resolver.resolveProps(Json::parse(R"({"text": {"$state": "/title"}, "size": 2, "missing": {"$state": "/x"}})"), ctx);
    CHECK(props == Json::parse(R"({"text": "Hello", "size": 2})"));
    CHECK(resolver.resolveProps(Json("not an object"), ctx) == Json::object());
}

TEST_CASE("Truthiness and interpolation") {
    CHECK_FALSE(IsTruthy(std::nullopt));
    CHECK_FALSE(IsTruthy(Json(nullptr)));
    CHECK_FALSE(IsTruthy(Json(0)));
    CHECK_FALSE(IsTruthy(Json(0.0)));
    CHECK_FALSE(IsTruthy(Json("")));
    CHECK(IsTruthy(Json("0")));
    CHECK(IsTruthy(Json(-1)));
    CHECK(IsTruthy(Json::object()));
    CHECK(IsTruthy(Json::array()));

    Json state = Json::parse(R"({"user": {"name": "Ada"}, "count": 3, "tags": ["a"]})");
    CHECK(InterpolateString("Delete ${/user/name}?", state) == "Delete Ada?");
    CHECK(InterpolateString("${/count} items", state) == "3 items");
    CHECK(InterpolateString("Tags: ${/tags}", state) == R"(Tags: ["a"])");
    CHECK(InterpolateString("Hi ${/missing}!", state) == "Hi !");
    CHECK(InterpolateString("No close ${/user", state) == "No close ${/user");
    CHECK(InterpolateString("Empty ${}", state) == "Empty ${}");
}

TEST_SUITE_END();
