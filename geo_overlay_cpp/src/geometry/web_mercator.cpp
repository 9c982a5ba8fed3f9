#include "geo_overlay/geometry/web_mercator.hpp"
#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace geo_overlay::geometry {

static constexpr double kPi = 3.14159265358979323846;

static void check_zoom(int zoom) {
    if (zoom < 0 || zoom > kMaxZoom) {
        throw ValidationError("zoom must be in [0," + std::to_string(kMaxZoom) +
                              "], got " + std::to_string(zoom));
    }
}

static double world_scale(int zoom) {
    return static_cast<double>(kTileSize) * std::ldexp(1.0, zoom);
}

PixelPoint lat_lng_to_world(double lat, double lng) {
    double clamped = std::max(-kMaxMercatorLat, std::min(kMaxMercatorLat, lat));
    double sin_lat = std::sin(clamped * kPi / 180.0);

    PixelPoint w;
    w.x = (lng + 180.0) / 360.0;
    w.y = 0.5 - std::log((1.0 + sin_lat) / (1.0 - sin_lat)) / (4.0 * kPi);
    return w;
}

GeoPoint world_to_lat_lng(double wx, double wy) {
    double n = kPi - 2.0 * kPi * wy;
    GeoPoint p;
    p.lng = wx * 360.0 - 180.0;
    p.lat = (180.0 / kPi) * std::atan(std::sinh(n));
    return p;
}

TileCoordinate tile_for_lat_lng(double lat, double lng, int zoom) {
    check_zoom(zoom);
    PixelPoint w = lat_lng_to_world(lat, lng);

    const int n = 1 << zoom;
    TileCoordinate t;
    t.z = zoom;
    t.x = std::clamp(static_cast<int>(std::floor(w.x * n)), 0, n - 1);
    t.y = std::clamp(static_cast<int>(std::floor(w.y * n)), 0, n - 1);
    return t;
}

GeoPoint tile_to_lat_lng(const TileCoordinate& tile) {
    check_zoom(tile.z);
    const double n = std::ldexp(1.0, tile.z);
    return world_to_lat_lng(tile.x / n, tile.y / n);
}

double projected_width_px(const BoundingBox& bounds, int zoom) {
    return bounds.lng_span() / 360.0 * world_scale(zoom);
}

double projected_height_px(const BoundingBox& bounds, int zoom) {
    PixelPoint top = lat_lng_to_world(bounds.max_lat, bounds.min_lng);
    PixelPoint bottom = lat_lng_to_world(bounds.min_lat, bounds.min_lng);
    return std::abs(bottom.y - top.y) * world_scale(zoom);
}

int select_zoom(const BoundingBox& bounds, int pixel_width, int pixel_height) {
    if (pixel_width < 1 || pixel_height < 1) {
        throw ValidationError("target pixel size must be positive");
    }
    if (!(bounds.min_lat < bounds.max_lat) || !(bounds.min_lng < bounds.max_lng)) {
        throw ValidationError("bounding box must satisfy min < max on both axes");
    }

    const double inf = std::numeric_limits<double>::infinity();

    double lng_fraction = bounds.lng_span() / 360.0;
    double zoom_x = lng_fraction > 0.0
                        ? std::log2(pixel_width / (lng_fraction * kTileSize))
                        : inf;

    // Mercator stretches latitude, so the vertical fit is taken in world space
    double lat_fraction = projected_height_px(bounds, 0) / kTileSize;
    double zoom_y = lat_fraction > 0.0
                        ? std::log2(pixel_height / (lat_fraction * kTileSize))
                        : inf;

    double best = std::min(zoom_x, zoom_y);
    int zoom = best >= kMaxZoom ? kMaxZoom : static_cast<int>(std::floor(best));
    zoom = std::clamp(zoom, 0, kMaxZoom);

    // Guard against log2 rounding up across an integer boundary
    while (zoom > 0 && (projected_width_px(bounds, zoom) > pixel_width + 1e-9 ||
                        projected_height_px(bounds, zoom) > pixel_height + 1e-9)) {
        --zoom;
    }
    return zoom;
}

GeoPoint mercator_center(const BoundingBox& bounds) {
    PixelPoint nw = lat_lng_to_world(bounds.max_lat, bounds.min_lng);
    PixelPoint se = lat_lng_to_world(bounds.min_lat, bounds.max_lng);
    return world_to_lat_lng((nw.x + se.x) / 2.0, (nw.y + se.y) / 2.0);
}

BoundingBox viewport_bounds(const GeoPoint& center, int zoom, int pixel_width, int pixel_height) {
    check_zoom(zoom);
    if (pixel_width < 1 || pixel_height < 1) {
        throw ValidationError("viewport size must be positive");
    }

    PixelPoint c = lat_lng_to_world(center.lat, center.lng);
    const double scale = world_scale(zoom);
    const double half_w = pixel_width / 2.0 / scale;
    const double half_h = pixel_height / 2.0 / scale;

    // No antimeridian wrap: the view is clamped to one world copy
    double x0 = std::clamp(c.x - half_w, 0.0, 1.0);
    double x1 = std::clamp(c.x + half_w, 0.0, 1.0);
    double y0 = std::clamp(c.y - half_h, 0.0, 1.0);
    double y1 = std::clamp(c.y + half_h, 0.0, 1.0);

    GeoPoint nw = world_to_lat_lng(x0, y0);
    GeoPoint se = world_to_lat_lng(x1, y1);
    return {se.lat, nw.lat, nw.lng, se.lng};
}

std::vector<TileCoordinate> tile_cover(const BoundingBox& bounds, int zoom) {
    TileCoordinate nw = tile_for_lat_lng(bounds.max_lat, bounds.min_lng, zoom);
    TileCoordinate se = tile_for_lat_lng(bounds.min_lat, bounds.max_lng, zoom);

    std::vector<TileCoordinate> tiles;
    tiles.reserve(static_cast<size_t>(se.x - nw.x + 1) * static_cast<size_t>(se.y - nw.y + 1));
    for (int y = nw.y; y <= se.y; ++y) {
        for (int x = nw.x; x <= se.x; ++x) {
            tiles.push_back({x, y, zoom});
        }
    }
    return tiles;
}

std::string expand_tile_url(const std::string& url_template, const TileCoordinate& tile) {
    using core::contains;
    using core::replace_all;

    const std::string x = std::to_string(tile.x);
    const std::string y = std::to_string(tile.y);
    const std::string z = std::to_string(tile.z);

    bool has_braces = contains(url_template, "{x}") || contains(url_template, "{y}") ||
                      contains(url_template, "{z}");
    bool has_dollar = contains(url_template, "$x") || contains(url_template, "$y") ||
                      contains(url_template, "$z");

    if (has_braces || has_dollar) {
        std::string url = url_template;
        url = replace_all(url, "{x}", x);
        url = replace_all(url, "{y}", y);
        url = replace_all(url, "{z}", z);
        url = replace_all(url, "$x", x);
        url = replace_all(url, "$y", y);
        url = replace_all(url, "$z", z);
        return url;
    }

    std::string sep = contains(url_template, "?") ? "&" : "?";
    if (core::ends_with(url_template, "?") || core::ends_with(url_template, "&")) sep.clear();
    return url_template + sep + "x=" + x + "&y=" + y + "&z=" + z;
}

} // namespace geo_overlay::geometry
