#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/core/utils.hpp"
#include "geo_overlay/io/job_file.hpp"

#include <filesystem>

#include <catch2/catch_test_macros.hpp>

using namespace geo_overlay;
using json = nlohmann::json;

TEST_CASE("parse_polygon_accepts_objects_and_pairs") {
    Polygon a = io::parse_polygon(json::parse(R"([{"lat": 1.5, "lng": 2.5}, {"lat": 3, "lng": 4}])"));
    REQUIRE(a.size() == 2);
    REQUIRE(a[0].lat == 1.5);
    REQUIRE(a[1].lng == 4.0);

    Polygon b = io::parse_polygon(json::parse("[[10, 20], [11, 21], [12, 22]]"));
    REQUIRE(b.size() == 3);
    REQUIRE(b[2].lat == 12.0);
    REQUIRE(b[2].lng == 22.0);

    json round = io::polygon_to_json(b);
    REQUIRE(round[1]["lat"] == 11.0);
}

TEST_CASE("parse_polygon_rejects_malformed_points") {
    REQUIRE_THROWS_AS(io::parse_polygon(json::parse(R"({"lat": 1})")), ValidationError);
    REQUIRE_THROWS_AS(io::parse_polygon(json::parse("[[1, 2, 3]]")), ValidationError);
    REQUIRE_THROWS_AS(io::parse_polygon(json::parse(R"([{"lat": "1", "lng": 2}])")), ValidationError);
    REQUIRE_THROWS_AS(io::parse_polygon(json::parse(R"([{"x": 1, "y": 2}])")), ValidationError);
}

TEST_CASE("parse_job_fills_defaults_from_config") {
    config::Config cfg;
    cfg.render.width = 512;
    cfg.render.opacity = 0.6;

    json job = json::parse(R"({
        "items": [
            {"name": "north", "polygon": [[0, 0], [0, 1], [1, 1]],
             "tile_url_template": "https://t.example/{z}/{x}/{y}", "opacity": 0.9},
            {"polygon": [[0, 0], [0, 1], [1, 1]], "height": 256,
             "overlay_thumbnail_url": "https://img.example/ndvi.png"}
        ]
    })");

    auto reqs = io::parse_job(job, cfg, ".");
    REQUIRE(reqs.size() == 2);

    REQUIRE(reqs[0].name == "north");
    REQUIRE(reqs[0].opacity == 0.9);
    REQUIRE(reqs[0].width == 512);
    REQUIRE(reqs[0].tile_url_template == "https://t.example/{z}/{x}/{y}");

    REQUIRE(reqs[1].name == "item_1");
    REQUIRE(reqs[1].opacity == 0.6);
    REQUIRE(reqs[1].height == 256);
    REQUIRE(reqs[1].overlay_thumbnail_url == "https://img.example/ndvi.png");
    REQUIRE(reqs[1].base_thumbnail.empty());
}

TEST_CASE("parse_job_rejects_bad_structure") {
    config::Config cfg;
    REQUIRE_THROWS_AS(io::parse_job(json::array(), cfg, "."), ValidationError);
    REQUIRE_THROWS_AS(io::parse_job(json::parse(R"({"items": {}})"), cfg, "."), ValidationError);
    REQUIRE_THROWS_AS(io::parse_job(json::parse(R"({"items": [{"name": "x"}]})"), cfg, "."),
                      ValidationError);
    REQUIRE_THROWS_AS(io::parse_job(json::parse(R"({"items": [{"polygon": [[0,0],[0,1],[1,1]], "width": "big"}]})"),
                                    cfg, "."),
                      ValidationError);
}

TEST_CASE("load_job_resolves_thumbnail_files_relative_to_job") {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "geo_overlay_test_job";
    fs::create_directories(dir);

    core::write_text(dir / "job.json", R"({"items": [
        {"name": "a", "polygon": [{"lat": 0, "lng": 0}, {"lat": 0, "lng": 1}, {"lat": 1, "lng": 1}],
         "base_thumbnail": "base.png", "overlay_thumbnail": "/abs/ndvi.png"}
    ]})");
    core::write_text(dir / "broken.json", "{ not json");

    config::Config cfg;
    auto reqs = io::load_job(dir / "job.json", cfg);
    REQUIRE(reqs.size() == 1);
    REQUIRE(reqs[0].base_thumbnail_path == (dir / "base.png").string());
    REQUIRE(reqs[0].overlay_thumbnail_path == "/abs/ndvi.png");
    REQUIRE(reqs[0].base_thumbnail.empty());

    REQUIRE_THROWS_AS(io::load_job(dir / "broken.json", cfg), ValidationError);

    fs::remove_all(dir);
}

TEST_CASE("load_job_accepts_items_whose_thumbnail_files_are_missing") {
    namespace fs = std::filesystem;
    fs::path dir = fs::temp_directory_path() / "geo_overlay_test_job_missing";
    fs::create_directories(dir);

    core::write_text(dir / "job.json", R"({"items": [
        {"name": "good", "polygon": [[0, 0], [0, 1], [1, 1]],
         "tile_url_template": "https://t.example/{z}/{x}/{y}"},
        {"name": "bad", "polygon": [[0, 0], [0, 1], [1, 1]],
         "base_thumbnail": "does_not_exist.png", "overlay_thumbnail": "neither.png"},
        {"name": "also_good", "polygon": [[0, 0], [0, 1], [1, 1]],
         "tile_url_template": "https://t.example/{z}/{x}/{y}"}
    ]})");

    config::Config cfg;
    std::vector<RenderRequest> reqs;
    REQUIRE_NOTHROW(reqs = io::load_job(dir / "job.json", cfg));
    REQUIRE(reqs.size() == 3);
    REQUIRE(reqs[1].name == "bad");
    REQUIRE(reqs[1].base_thumbnail_path == (dir / "does_not_exist.png").string());

    fs::remove_all(dir);
}
