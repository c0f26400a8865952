#include <doctest/doctest.h>
#include <genspec/GenSpec.hpp>

#include <string>
#include <vector>

using namespace GS;

namespace {

class CannedTransport final : public Stream::GenerationTransport {
public:
    explicit CannedTransport(std::string body) : body(std::move(body)) {}

    auto stream(Stream::GenerationRequest const&, Stream::ChunkSink const& sink) -> Expected<void> override {
        if (!sink(this->body)) {
            return std::unexpected(Error{Error::Code::Cancelled, "aborted"});
        }
        return {};
    }

    std::string body;
};

} // namespace

TEST_CASE("Generated counter drives state through actions") {
    CannedTransport transport{
            "Counter screen.\n"
            R"({"op":"add","path":"/root","value":"screen"})"
            "\n"
            R"({"op":"add","path":"/nodes/screen","value":{"type":"Stack","children":["label","bump"]}})"
            "\n"
            R"({"op":"add","path":"/nodes/label","value":{"type":"Text","props":{"text":{"$state":"/count"}},"visible":{"$state":"/count","gt":0}}})"
            "\n"
            R"({"op":"add","path":"/nodes/bump","value":{"type":"Button","props":{"label":"+1"},"on":{"press":{"action":"bump","params":{"by":2}}}}})"
            "\n"};

    Stream::GenerationOptions options;
    options.validate = true;
    Stream::StreamIngester ingester{transport, options};
    auto                   generated = ingester.generate("A counter");
    REQUIRE(generated.status == Stream::GenerationStatus::Complete);

    auto const& spec  = generated.spec;
    auto        label = spec.find("label");
    auto        bump  = spec.find("bump");
    REQUIRE(label);
    REQUIRE(bump);

    StateStore               store{Json{{"count", 0}}};
    Expr::ExpressionResolver resolver;
    Action::ActionDispatcher dispatcher{store, resolver};
    dispatcher.registerHandler("bump", [](Json const& params, Action::ActionContext& ctx) -> Expected<void> {
        auto current = ctx.store().get("/count").value_or(Json(0));
        ctx.store().set("/count", Json(current.get<int>() + params.at("by").get<int>()));
        return {};
    });

    int                       notifications = 0;
    [[maybe_unused]] auto     subscription  = store.subscribe([&](auto const&, auto const&) { ++notifications; });
    auto                      ctx           = Expr::MakeContext(store.snapshot());
    CHECK_FALSE(resolver.evaluateVisibility(label->visible, ctx));
    CHECK(resolver.resolveProps(label->props, ctx)["text"] == Json(0));

    REQUIRE(bump->on.has_value());
    auto binding = Action::ParseActionBinding(bump->on->at("press"));
    REQUIRE(binding.has_value());
    CHECK(dispatcher.execute(*binding).has_value());
    CHECK(notifications == 1);

    ctx = Expr::MakeContext(store.snapshot());
    CHECK(resolver.evaluateVisibility(label->visible, ctx));
    CHECK(resolver.resolveProps(label->props, ctx)["text"] == Json(2));
}
