#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/core/utils.hpp"
#include "geo_overlay/image/codec.hpp"
#include "geo_overlay/render/composite_renderer.hpp"
#include "geo_overlay/render/orchestrator.hpp"

#include <filesystem>
#include <map>

#include <catch2/catch_test_macros.hpp>

using namespace geo_overlay;

namespace {

std::vector<uint8_t> solid_png(int w, int h, cv::Vec4b color) {
    return image::encode_png(RasterImage(h, w, color));
}

class FakeHttpClient : public io::HttpClient {
public:
    std::map<std::string, std::vector<uint8_t>> responses;
    std::vector<std::string> requested;

    std::vector<uint8_t> fetch(const std::string& url) override {
        requested.push_back(url);
        auto it = responses.find(url);
        if (it == responses.end()) {
            throw NetworkError("GET " + url + " failed: HTTP 404", 404);
        }
        return it->second;
    }
};

RenderRequest square_request(int size) {
    RenderRequest req;
    req.name = "field";
    req.polygon = {{0, 0}, {0, 1}, {1, 1}, {1, 0}};
    req.width = size;
    req.height = size;
    req.opacity = 1.0;
    return req;
}

const cv::Vec4b kBlack(0, 0, 0, 255);
const cv::Vec4b kWhite(255, 255, 255, 255);

} // namespace

TEST_CASE("composite_from_bytes_masks_overlay_to_polygon") {
    RenderRequest req = square_request(100);
    req.base_thumbnail = solid_png(100, 100, kBlack);
    req.overlay_thumbnail = solid_png(100, 100, kWhite);

    render::CompositeRenderer renderer(nullptr);
    REQUIRE(renderer.name() == "composite");

    RasterImage out = renderer.render(req);
    REQUIRE(out.cols == 100);
    REQUIRE(out.rows == 100);

    // Padding 5% puts the polygon edge at 100 * 0.05 / 1.1 ~ 4.5 px
    REQUIRE(out(0, 0) == kBlack);
    REQUIRE(out(99, 99) == kBlack);
    REQUIRE(out(50, 50) == kWhite);
    REQUIRE(out(20, 80) == kWhite);
}

TEST_CASE("composite_applies_opacity_inside_polygon") {
    RenderRequest req = square_request(100);
    req.opacity = 0.5;
    req.base_thumbnail = solid_png(100, 100, kBlack);
    req.overlay_thumbnail = solid_png(100, 100, kWhite);

    render::CompositeRenderer renderer(nullptr);
    RasterImage out = renderer.render(req);

    REQUIRE(out(50, 50)[0] == 128);
    REQUIRE(out(50, 50)[3] == 255);
}

TEST_CASE("composite_output_has_requested_size_when_sources_differ") {
    RenderRequest req = square_request(120);
    req.base_thumbnail = solid_png(60, 80, kBlack);
    req.overlay_thumbnail = solid_png(30, 30, kWhite);

    render::CompositeRenderer renderer(nullptr);
    RasterImage out = renderer.render(req);
    REQUIRE(out.cols == 120);
    REQUIRE(out.rows == 120);
    REQUIRE(out(60, 60) == kWhite);
}

TEST_CASE("composite_downloads_thumbnails_by_url") {
    FakeHttpClient http;
    http.responses["https://img.example/base.png"] = solid_png(64, 64, kBlack);
    http.responses["https://img.example/ndvi.png"] = solid_png(64, 64, kWhite);

    RenderRequest req = square_request(64);
    req.base_thumbnail_url = "https://img.example/base.png";
    req.overlay_thumbnail_url = "https://img.example/ndvi.png";

    render::CompositeRenderer renderer(&http);
    RasterImage out = renderer.render(req);
    REQUIRE(http.requested.size() == 2);
    REQUIRE(out(32, 32) == kWhite);
}

TEST_CASE("composite_network_failure_propagates") {
    FakeHttpClient http;
    http.responses["https://img.example/base.png"] = solid_png(64, 64, kBlack);

    RenderRequest req = square_request(64);
    req.base_thumbnail_url = "https://img.example/base.png";
    req.overlay_thumbnail_url = "https://img.example/missing.png";

    render::CompositeRenderer renderer(&http);
    REQUIRE_THROWS_AS(renderer.render(req), NetworkError);
}

TEST_CASE("composite_reads_thumbnail_files_when_rendering") {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "geo_overlay_test_thumbs";
    fs::create_directories(dir);
    core::write_bytes(dir / "base.png", solid_png(64, 64, kBlack));
    core::write_bytes(dir / "ndvi.png", solid_png(64, 64, kWhite));

    RenderRequest req = square_request(64);
    req.base_thumbnail_path = (dir / "base.png").string();
    req.overlay_thumbnail_path = (dir / "ndvi.png").string();

    render::CompositeRenderer renderer(nullptr);
    RasterImage out = renderer.render(req);
    REQUIRE(out(32, 32) == kWhite);
    REQUIRE(out(0, 0) == kBlack);

    req.overlay_thumbnail_path = (dir / "missing.png").string();
    REQUIRE_THROWS_AS(renderer.render(req), IOError);

    fs::remove_all(dir);
}

TEST_CASE("missing_thumbnail_file_fails_only_its_own_item") {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "geo_overlay_test_thumbs_batch";
    fs::create_directories(dir);
    core::write_bytes(dir / "base.png", solid_png(40, 40, kBlack));
    core::write_bytes(dir / "ndvi.png", solid_png(40, 40, kWhite));

    RenderRequest good = square_request(40);
    good.name = "good";
    good.base_thumbnail_path = (dir / "base.png").string();
    good.overlay_thumbnail_path = (dir / "ndvi.png").string();

    RenderRequest bad = good;
    bad.name = "bad";
    bad.base_thumbnail_path = (dir / "does_not_exist.png").string();

    render::CompositeRenderer renderer(nullptr);
    render::RenderOrchestrator orchestrator({&renderer});
    auto outcomes = orchestrator.render_batch({good, bad, good});

    REQUIRE(outcomes.size() == 3);
    REQUIRE(outcomes[0].rendered());
    REQUIRE_FALSE(outcomes[1].rendered());
    REQUIRE(outcomes[1].reason.find("does_not_exist.png") != std::string::npos);
    REQUIRE(outcomes[2].rendered());

    fs::remove_all(dir);
}

TEST_CASE("composite_errors") {
    render::CompositeRenderer renderer(nullptr);

    SECTION("missing thumbnail") {
        RenderRequest req = square_request(50);
        req.base_thumbnail = solid_png(50, 50, kBlack);
        REQUIRE_THROWS_AS(renderer.render(req), CompositeError);
    }

    SECTION("url without http client") {
        RenderRequest req = square_request(50);
        req.base_thumbnail = solid_png(50, 50, kBlack);
        req.overlay_thumbnail_url = "https://img.example/ndvi.png";
        REQUIRE_THROWS_AS(renderer.render(req), CompositeError);
    }

    SECTION("too few vertices") {
        RenderRequest req = square_request(50);
        req.polygon = {{0, 0}, {1, 1}};
        req.base_thumbnail = solid_png(50, 50, kBlack);
        req.overlay_thumbnail = solid_png(50, 50, kWhite);
        REQUIRE_THROWS_AS(renderer.render(req), CompositeError);
    }

    SECTION("zero area") {
        RenderRequest req = square_request(50);
        req.polygon = {{0, 0}, {1, 1}, {2, 2}};
        req.base_thumbnail = solid_png(50, 50, kBlack);
        req.overlay_thumbnail = solid_png(50, 50, kWhite);
        REQUIRE_THROWS_AS(renderer.render(req), CompositeError);
    }

    SECTION("undecodable overlay") {
        RenderRequest req = square_request(50);
        req.base_thumbnail = solid_png(50, 50, kBlack);
        req.overlay_thumbnail = {'<', 'h', 't', 'm', 'l', '>'};
        REQUIRE_THROWS_AS(renderer.render(req), CompositeError);
    }

    SECTION("bad stroke colour") {
        RenderRequest req = square_request(50);
        req.stroke_color = "not-a-colour";
        req.base_thumbnail = solid_png(50, 50, kBlack);
        req.overlay_thumbnail = solid_png(50, 50, kWhite);
        REQUIRE_THROWS_AS(renderer.render(req), CompositeError);
    }
}

TEST_CASE("composite_index_overlay_draws_outline_over_overlay") {
    RasterImage base(200, 200, kBlack);
    RasterImage overlay(200, 200, kWhite);
    Polygon square = {{0, 0}, {0, 1}, {1, 1}, {1, 0}};

    render::CompositeOptions options;
    options.opacity = 1.0;
    options.stroke_width = 5;

    RasterImage out = render::composite_index_overlay(base, overlay, square, options);

    // Left edge at x = 200 * 0.05 / 1.1 ~ 9.1
    const cv::Vec4b edge = out(100, 9);
    REQUIRE(edge[1] > edge[0]);
    REQUIRE(edge[1] > edge[2]);
    REQUIRE(out(100, 100) == kWhite);
}
