#pragma once

#include <Eigen/Dense>
#include <opencv2/core.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace geo_overlay {

// Raster types. Pixel order is OpenCV's native BGRA.
using RasterImage = cv::Mat4b;
using AlphaMask = cv::Mat1b;

// Geo (lng, lat, 1) -> pixel (x, y)
using GeoTransform = Eigen::Matrix<double, 2, 3>;

constexpr double kDefaultPaddingPercent = 5.0;
constexpr int kDefaultDimension = 1200;
constexpr double kDefaultOpacity = 0.7;
constexpr const char* kDefaultStrokeColor = "#5db815";
constexpr int kMaxZoom = 21;
constexpr int kTileSize = 256;

// WGS84 degrees
struct GeoPoint {
    double lat = 0.0;
    double lng = 0.0;
};

// Implicitly closed ring, >= 3 vertices
using Polygon = std::vector<GeoPoint>;

struct BoundingBox {
    double min_lat = 0.0;
    double max_lat = 0.0;
    double min_lng = 0.0;
    double max_lng = 0.0;

    double lat_span() const { return max_lat - min_lat; }
    double lng_span() const { return max_lng - min_lng; }

    GeoPoint center() const {
        return {(min_lat + max_lat) / 2.0, (min_lng + max_lng) / 2.0};
    }

    bool contains(const GeoPoint& p) const {
        return p.lat > min_lat && p.lat < max_lat && p.lng > min_lng && p.lng < max_lng;
    }
};

struct PixelPoint {
    double x = 0.0;
    double y = 0.0;
};

// Web Mercator slippy-map tile index
struct TileCoordinate {
    int x = 0;
    int y = 0;
    int z = 0;

    bool operator==(const TileCoordinate& o) const { return x == o.x && y == o.y && z == o.z; }
    bool operator!=(const TileCoordinate& o) const { return !(*this == o); }
};

struct Rgba {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;
};

// Per-item render input. Either tile_url_template drives the live path, or
// the thumbnail pair (bytes, files or URLs) drives the composite path; both
// may be set.
struct RenderRequest {
    std::string name;
    Polygon polygon;
    std::string tile_url_template;
    std::string base_thumbnail_url;
    std::string overlay_thumbnail_url;
    std::vector<uint8_t> base_thumbnail;
    std::vector<uint8_t> overlay_thumbnail;
    // Local thumbnail files, read only when the composite path runs
    std::string base_thumbnail_path;
    std::string overlay_thumbnail_path;
    double opacity = kDefaultOpacity;
    std::string stroke_color = kDefaultStrokeColor;
    int stroke_width = 0;  // 0 = max(3, width / 300)
    int width = kDefaultDimension;
    int height = kDefaultDimension;
    double padding_percent = kDefaultPaddingPercent;
};

enum class RenderStatus {
    RENDERED,
    FAILED
};

inline std::string render_status_to_string(RenderStatus status) {
    switch (status) {
        case RenderStatus::RENDERED: return "rendered";
        case RenderStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

// One attempt of one renderer within a request
struct RenderAttempt {
    std::string renderer;
    bool success = false;
    std::string error;
    double elapsed_ms = 0.0;
};

// Result of one RenderRequest. FAILED means "no image available".
struct RenderOutcome {
    RenderStatus status = RenderStatus::FAILED;
    std::vector<uint8_t> png;
    RasterImage image;
    std::string renderer;
    std::string reason;
    std::vector<RenderAttempt> attempts;

    bool rendered() const { return status == RenderStatus::RENDERED; }
};

} // namespace geo_overlay
