#pragma once

#include "geo_overlay/core/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace geo_overlay::render {

// Rejects an API key that is empty or shorter than 30 characters after
// trimming, or that contains characters outside [A-Za-z0-9_-].
void validate_basemap_api_key(const std::string& key);

// Everything the in-page overlay layer needs, fixed before the page is
// loaded. The page has no state beyond what is serialized from here.
struct LiveOverlayRenderer {
    Polygon polygon;
    BoundingBox bounds;                       // padded box the view is framed on
    GeoPoint center;
    int zoom = 0;
    int width = kDefaultDimension;
    int height = kDefaultDimension;
    std::map<std::string, std::string> tile_urls;  // "z/x/y" -> remote tile URL
    double opacity = kDefaultOpacity;
    std::string stroke_color = kDefaultStrokeColor;
    int stroke_width = 3;
    int settle_delay_ms = 2000;
    int hard_timeout_ms = 10000;

    // Frames the request's padded bounding box and expands the tile template
    // for every tile under the viewport at the selected zoom.
    static LiveOverlayRenderer for_request(const RenderRequest& request,
                                           int settle_delay_ms, int hard_timeout_ms);

    nlohmann::json page_config() const;

    // Self-contained HTML document: basemap script, overlay map type,
    // outline, and the window.renderComplete / window.renderError flags.
    std::string html(const std::string& basemap_api_key) const;
};

// "z/x/y" key used by the page to look up a tile URL
std::string tile_key(const TileCoordinate& tile);

} // namespace geo_overlay::render
