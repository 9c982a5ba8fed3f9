#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/geometry/projection.hpp"

#include <cmath>
#include <limits>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace geo_overlay;
using Catch::Approx;

TEST_CASE("bounding_box_unit_square_with_default_padding") {
    Polygon square = {{0, 0}, {0, 1}, {1, 1}, {1, 0}};
    BoundingBox b = geometry::bounding_box(square, 5.0);

    REQUIRE(b.min_lat == Approx(-0.05));
    REQUIRE(b.max_lat == Approx(1.05));
    REQUIRE(b.min_lng == Approx(-0.05));
    REQUIRE(b.max_lng == Approx(1.05));
}

TEST_CASE("bounding_box_pads_each_axis_by_its_own_range") {
    Polygon poly = {{10.0, 20.0}, {12.0, 20.5}, {11.0, 24.0}, {10.5, 21.0}};
    for (double pad : {0.0, 2.5, 5.0, 10.0, 50.0}) {
        BoundingBox b = geometry::bounding_box(poly, pad);
        const double lat_pad = 2.0 * pad / 100.0;
        const double lng_pad = 4.0 * pad / 100.0;
        REQUIRE(b.min_lat == Approx(10.0 - lat_pad));
        REQUIRE(b.max_lat == Approx(12.0 + lat_pad));
        REQUIRE(b.min_lng == Approx(20.0 - lng_pad));
        REQUIRE(b.max_lng == Approx(24.0 + lng_pad));

        if (pad > 0.0) {
            for (const auto& p : poly) {
                REQUIRE(b.contains(p));
            }
        }
    }
}

TEST_CASE("bounding_box_rejects_empty_and_flat_polygons") {
    REQUIRE_THROWS_AS(geometry::bounding_box({}, 5.0), ValidationError);
    Polygon line = {{1.0, 1.0}, {1.0, 2.0}, {1.0, 3.0}};
    REQUIRE_THROWS_AS(geometry::bounding_box(line, 5.0), ValidationError);
}

TEST_CASE("validate_polygon_checks_count_and_ranges") {
    REQUIRE_THROWS_AS(geometry::validate_polygon({{0, 0}, {1, 1}}), ValidationError);
    REQUIRE_THROWS_AS(geometry::validate_polygon({{0, 0}, {91, 1}, {1, 0}}), ValidationError);
    REQUIRE_THROWS_AS(geometry::validate_polygon({{0, 0}, {1, 181}, {1, 0}}), ValidationError);
    const double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(geometry::validate_polygon({{0, 0}, {nan, 1}, {1, 0}}), ValidationError);
    REQUIRE_NOTHROW(geometry::validate_polygon({{0, 0}, {0, 1}, {1, 1}}));
}

TEST_CASE("signed_area_of_unit_square") {
    Polygon ccw = {{0, 0}, {0, 1}, {1, 1}, {1, 0}};
    REQUIRE(std::abs(geometry::polygon_signed_area(ccw)) == Approx(1.0));
    Polygon reversed(ccw.rbegin(), ccw.rend());
    REQUIRE(geometry::polygon_signed_area(reversed) == Approx(-geometry::polygon_signed_area(ccw)));
}

TEST_CASE("project_to_pixel_maps_corners_with_inverted_y") {
    BoundingBox b{10.0, 20.0, 30.0, 50.0};

    PixelPoint nw = geometry::project_to_pixel({20.0, 30.0}, b, 400, 200);
    REQUIRE(nw.x == Approx(0.0));
    REQUIRE(nw.y == Approx(0.0));

    PixelPoint se = geometry::project_to_pixel({10.0, 50.0}, b, 400, 200);
    REQUIRE(se.x == Approx(400.0));
    REQUIRE(se.y == Approx(200.0));

    PixelPoint mid = geometry::project_to_pixel({15.0, 40.0}, b, 400, 200);
    REQUIRE(mid.x == Approx(200.0));
    REQUIRE(mid.y == Approx(100.0));
}

TEST_CASE("pixel_round_trip_within_one_pixel") {
    BoundingBox b{-33.95, -33.80, 18.35, 18.55};

    for (int w : {100, 640, 1200}) {
        for (int h : {100, 480, 1200}) {
            for (int i = 1; i < 10; ++i) {
                for (int j = 1; j < 10; ++j) {
                    GeoPoint p{b.min_lat + b.lat_span() * i / 10.0, b.min_lng + b.lng_span() * j / 10.0};
                    PixelPoint px = geometry::project_to_pixel(p, b, w, h);
                    GeoPoint back = geometry::pixel_to_geo(px, b, w, h);
                    PixelPoint again = geometry::project_to_pixel(back, b, w, h);

                    REQUIRE(std::abs(again.x - px.x) <= 1.0);
                    REQUIRE(std::abs(again.y - px.y) <= 1.0);
                    REQUIRE(back.lat == Approx(p.lat).margin(1e-9));
                    REQUIRE(back.lng == Approx(p.lng).margin(1e-9));
                }
            }
        }
    }
}

TEST_CASE("affine_transform_agrees_with_direct_projection") {
    BoundingBox b{0.0, 2.0, 0.0, 4.0};
    GeoTransform t = geometry::geo_to_pixel_transform(b, 200, 100);

    GeoPoint p{0.5, 3.0};
    Eigen::Vector3d g(p.lng, p.lat, 1.0);
    Eigen::Vector2d px = t * g;
    PixelPoint direct = geometry::project_to_pixel(p, b, 200, 100);

    REQUIRE(px(0) == Approx(direct.x));
    REQUIRE(px(1) == Approx(direct.y));
}

TEST_CASE("projection_rejects_bad_raster_size_and_bounds") {
    BoundingBox b{0.0, 1.0, 0.0, 1.0};
    REQUIRE_THROWS_AS(geometry::project_to_pixel({0.5, 0.5}, b, 0, 100), ValidationError);
    BoundingBox flat{1.0, 1.0, 0.0, 1.0};
    REQUIRE_THROWS_AS(geometry::project_to_pixel({0.5, 0.5}, flat, 100, 100), ValidationError);
}
