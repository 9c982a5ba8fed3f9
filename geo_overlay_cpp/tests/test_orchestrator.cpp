#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/image/codec.hpp"
#include "geo_overlay/render/orchestrator.hpp"

#include <functional>

#include <catch2/catch_test_macros.hpp>

using namespace geo_overlay;

namespace {

class ScriptedRenderer : public render::Renderer {
public:
    ScriptedRenderer(std::string name, std::function<RasterImage(const RenderRequest&)> fn)
        : name_(std::move(name)), fn_(std::move(fn)) {}

    std::string name() const override { return name_; }

    RasterImage render(const RenderRequest& request) override {
        ++calls;
        return fn_(request);
    }

    int calls = 0;

private:
    std::string name_;
    std::function<RasterImage(const RenderRequest&)> fn_;
};

RasterImage solid(const RenderRequest& req, cv::Vec4b color) {
    return RasterImage(req.height, req.width, color);
}

RenderRequest small_request(const std::string& name) {
    RenderRequest req;
    req.name = name;
    req.polygon = {{0, 0}, {0, 1}, {1, 1}};
    req.width = 32;
    req.height = 24;
    return req;
}

} // namespace

TEST_CASE("live_success_skips_composite") {
    ScriptedRenderer live("live", [](const RenderRequest& r) { return solid(r, {1, 2, 3, 255}); });
    ScriptedRenderer composite("composite", [](const RenderRequest& r) { return solid(r, {9, 9, 9, 255}); });

    render::RenderOrchestrator orchestrator({&live, &composite});
    RenderOutcome out = orchestrator.render(small_request("a"));

    REQUIRE(out.rendered());
    REQUIRE(out.renderer == "live");
    REQUIRE(live.calls == 1);
    REQUIRE(composite.calls == 0);
    REQUIRE(out.attempts.size() == 1);
    REQUIRE(out.image(0, 0) == cv::Vec4b(1, 2, 3, 255));

    RasterImage decoded = image::decode_image(out.png);
    REQUIRE(decoded.cols == 32);
    REQUIRE(decoded.rows == 24);
}

TEST_CASE("live_failure_invokes_composite_exactly_once") {
    ScriptedRenderer live("live", [](const RenderRequest&) -> RasterImage {
        throw RenderTimeoutError("no completion signal within 15000 ms");
    });
    ScriptedRenderer composite("composite", [](const RenderRequest& r) { return solid(r, {9, 9, 9, 255}); });

    render::RenderOrchestrator orchestrator({&live, &composite});
    RenderOutcome out = orchestrator.render(small_request("a"));

    REQUIRE(out.status == RenderStatus::RENDERED);
    REQUIRE(out.renderer == "composite");
    REQUIRE(live.calls == 1);
    REQUIRE(composite.calls == 1);
    REQUIRE(out.attempts.size() == 2);
    REQUIRE_FALSE(out.attempts[0].success);
    REQUIRE(out.attempts[0].error.find("Render timeout") != std::string::npos);
    REQUIRE(out.attempts[1].success);
    REQUIRE(out.image(0, 0) == cv::Vec4b(9, 9, 9, 255));
}

TEST_CASE("both_failing_gives_failed_outcome_not_exception") {
    ScriptedRenderer live("live", [](const RenderRequest&) -> RasterImage {
        throw ConfigurationError("basemap API key is not set");
    });
    ScriptedRenderer composite("composite", [](const RenderRequest&) -> RasterImage {
        throw CompositeError("cannot decode image (6 bytes)");
    });

    render::RenderOrchestrator orchestrator({&live, &composite});
    RenderOutcome out;
    REQUIRE_NOTHROW(out = orchestrator.render(small_request("a")));

    REQUIRE(out.status == RenderStatus::FAILED);
    REQUIRE_FALSE(out.rendered());
    REQUIRE(out.png.empty());
    REQUIRE(out.reason.find("composite") != std::string::npos);
    REQUIRE(out.reason.find("cannot decode") != std::string::npos);
    REQUIRE(live.calls == 1);
    REQUIRE(composite.calls == 1);
    REQUIRE(render_status_to_string(out.status) == "failed");
}

TEST_CASE("non_library_exceptions_are_contained") {
    ScriptedRenderer broken("live", [](const RenderRequest&) -> RasterImage {
        throw std::runtime_error("unexpected");
    });
    render::RenderOrchestrator orchestrator({&broken});
    RenderOutcome out = orchestrator.render(small_request("a"));
    REQUIRE(out.status == RenderStatus::FAILED);
    REQUIRE(out.reason == "live: unexpected");
}

TEST_CASE("empty_image_counts_as_failure") {
    ScriptedRenderer empty("live", [](const RenderRequest&) { return RasterImage(); });
    ScriptedRenderer composite("composite", [](const RenderRequest& r) { return solid(r, {9, 9, 9, 255}); });
    render::RenderOrchestrator orchestrator({&empty, &composite});
    RenderOutcome out = orchestrator.render(small_request("a"));
    REQUIRE(out.renderer == "composite");
}

TEST_CASE("wrong_sized_image_is_fitted_to_request") {
    ScriptedRenderer live("live", [](const RenderRequest&) { return RasterImage(10, 10, cv::Vec4b(5, 5, 5, 255)); });
    render::RenderOrchestrator orchestrator({&live});
    RenderOutcome out = orchestrator.render(small_request("a"));
    REQUIRE(out.rendered());
    REQUIRE(out.image.cols == 32);
    REQUIRE(out.image.rows == 24);
}

TEST_CASE("no_renderers_fails_cleanly") {
    render::RenderOrchestrator orchestrator(std::vector<render::Renderer*>{});
    RenderOutcome out = orchestrator.render(small_request("a"));
    REQUIRE(out.status == RenderStatus::FAILED);
    REQUIRE(out.attempts.empty());
    REQUIRE_FALSE(out.reason.empty());
}

TEST_CASE("batch_continues_past_failed_items") {
    ScriptedRenderer live("live", [](const RenderRequest& r) -> RasterImage {
        if (r.name == "bad") throw BrowserError("Target.createTarget: browser is not running");
        return solid(r, {1, 1, 1, 255});
    });
    ScriptedRenderer composite("composite", [](const RenderRequest& r) -> RasterImage {
        if (r.name == "bad") throw CompositeError("no overlay thumbnail supplied");
        return solid(r, {2, 2, 2, 255});
    });

    render::RenderOrchestrator orchestrator({&live, &composite});
    std::vector<RenderRequest> batch = {small_request("one"), small_request("bad"), small_request("three")};

    std::vector<size_t> seen;
    auto outcomes = orchestrator.render_batch(batch, [&](size_t i, const RenderRequest&, const RenderOutcome&) {
        seen.push_back(i);
    });

    REQUIRE(outcomes.size() == 3);
    REQUIRE(outcomes[0].rendered());
    REQUIRE_FALSE(outcomes[1].rendered());
    REQUIRE(outcomes[2].rendered());
    REQUIRE(seen == std::vector<size_t>{0, 1, 2});
    // live attempted once per item, composite only for the failing one
    REQUIRE(live.calls == 3);
    REQUIRE(composite.calls == 1);
}
