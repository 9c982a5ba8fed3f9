#include "geo_overlay/geometry/projection.hpp"
#include "geo_overlay/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace geo_overlay::geometry {

static void check_raster_size(int width, int height) {
    if (width < 1 || height < 1) {
        std::ostringstream oss;
        oss << "raster size must be positive, got " << width << "x" << height;
        throw ValidationError(oss.str());
    }
}

static void check_bounds(const BoundingBox& b) {
    if (!(b.min_lat < b.max_lat) || !(b.min_lng < b.max_lng)) {
        throw ValidationError("bounding box must satisfy min < max on both axes");
    }
}

void validate_polygon(const Polygon& polygon) {
    if (polygon.size() < 3) {
        throw ValidationError("polygon needs at least 3 vertices, got " +
                              std::to_string(polygon.size()));
    }
    for (size_t i = 0; i < polygon.size(); ++i) {
        const GeoPoint& p = polygon[i];
        if (!std::isfinite(p.lat) || !std::isfinite(p.lng) ||
            p.lat < -90.0 || p.lat > 90.0 || p.lng < -180.0 || p.lng > 180.0) {
            std::ostringstream oss;
            oss << "vertex " << i << " out of range (lat=" << p.lat << ", lng=" << p.lng << ")";
            throw ValidationError(oss.str());
        }
    }
}

double polygon_signed_area(const Polygon& polygon) {
    const size_t n = polygon.size();
    if (n < 3) return 0.0;

    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const GeoPoint& a = polygon[i];
        const GeoPoint& b = polygon[(i + 1) % n];
        acc += a.lng * b.lat - b.lng * a.lat;
    }
    return 0.5 * acc;
}

BoundingBox bounding_box(const Polygon& polygon, double padding_percent) {
    if (polygon.empty()) {
        throw ValidationError("cannot compute bounding box of an empty polygon");
    }

    BoundingBox b{polygon[0].lat, polygon[0].lat, polygon[0].lng, polygon[0].lng};
    for (const auto& p : polygon) {
        b.min_lat = std::min(b.min_lat, p.lat);
        b.max_lat = std::max(b.max_lat, p.lat);
        b.min_lng = std::min(b.min_lng, p.lng);
        b.max_lng = std::max(b.max_lng, p.lng);
    }

    const double lat_pad = (b.max_lat - b.min_lat) * (padding_percent / 100.0);
    const double lng_pad = (b.max_lng - b.min_lng) * (padding_percent / 100.0);
    b.min_lat -= lat_pad;
    b.max_lat += lat_pad;
    b.min_lng -= lng_pad;
    b.max_lng += lng_pad;

    if (!(b.min_lat < b.max_lat) || !(b.min_lng < b.max_lng)) {
        throw ValidationError("polygon has zero extent on at least one axis");
    }
    return b;
}

GeoTransform geo_to_pixel_transform(const BoundingBox& bounds, int width, int height) {
    check_bounds(bounds);
    check_raster_size(width, height);

    const double sx = width / bounds.lng_span();
    const double sy = height / bounds.lat_span();

    GeoTransform t;
    t << sx, 0.0, -bounds.min_lng * sx,
         0.0, -sy, bounds.max_lat * sy;
    return t;
}

GeoTransform pixel_to_geo_transform(const BoundingBox& bounds, int width, int height) {
    GeoTransform fwd = geo_to_pixel_transform(bounds, width, height);

    Eigen::Matrix3d m = Eigen::Matrix3d::Identity();
    m.topRows<2>() = fwd;
    Eigen::Matrix3d inv = m.inverse();

    // Output row order is (lng, lat)
    return inv.topRows<2>();
}

PixelPoint project_to_pixel(const GeoPoint& point, const BoundingBox& bounds, int width, int height) {
    check_bounds(bounds);
    check_raster_size(width, height);

    // Direct form rather than the affine product so that box edges land on
    // exact pixel boundaries.
    const double nx = (point.lng - bounds.min_lng) / bounds.lng_span();
    const double ny = (bounds.max_lat - point.lat) / bounds.lat_span();
    return {nx * width, ny * height};
}

GeoPoint pixel_to_geo(const PixelPoint& pixel, const BoundingBox& bounds, int width, int height) {
    GeoTransform inv = pixel_to_geo_transform(bounds, width, height);
    Eigen::Vector3d px(pixel.x, pixel.y, 1.0);
    Eigen::Vector2d g = inv * px;
    return {g(1), g(0)};
}

std::vector<PixelPoint> project_polygon(const Polygon& polygon, const BoundingBox& bounds,
                                        int width, int height) {
    std::vector<PixelPoint> out;
    out.reserve(polygon.size());
    for (const auto& p : polygon) {
        out.push_back(project_to_pixel(p, bounds, width, height));
    }
    return out;
}

} // namespace geo_overlay::geometry
