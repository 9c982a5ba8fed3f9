#include "geo_overlay/render/live_overlay_page.hpp"
#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/core/utils.hpp"
#include "geo_overlay/geometry/projection.hpp"
#include "geo_overlay/geometry/web_mercator.hpp"
#include "geo_overlay/image/compositor.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace geo_overlay::render {

namespace {

constexpr size_t kMinApiKeyLength = 30;

// Runs inside the page. CONFIG is injected in front of it.
const char* const kPageScript = R"JS(
window.renderComplete = false;
window.renderError = null;
function markComplete(reason) {
  if (!window.renderComplete) {
    window.renderComplete = true;
    window.renderReason = reason;
  }
}
// Counted from page load, so a slow or failing basemap script still completes
setTimeout(function () { markComplete('timeout'); }, CONFIG.hardTimeoutMs);
window.gm_authFailure = function () {
  window.renderError = 'basemap authentication failed';
};
function initMap() {
  const cfg = CONFIG;
  const map = new google.maps.Map(document.getElementById('map'), {
    center: cfg.center,
    zoom: cfg.zoom,
    mapTypeId: 'satellite',
    disableDefaultUI: true,
    gestureHandling: 'none',
    keyboardShortcuts: false,
    clickableIcons: false,
    isFractionalZoomEnabled: false,
    tilt: 0
  });
  const tileSize = 256;
  const overlay = {
    tileSize: new google.maps.Size(tileSize, tileSize),
    minZoom: 0,
    maxZoom: 21,
    name: 'index-overlay',
    getTile: function (coord, zoom, doc) {
      const canvas = doc.createElement('canvas');
      canvas.width = tileSize;
      canvas.height = tileSize;
      const url = cfg.tiles[zoom + '/' + coord.x + '/' + coord.y];
      if (!url) return canvas;
      const img = new Image();
      img.onload = function () {
        const proj = map.getProjection();
        if (!proj) return;
        const ctx = canvas.getContext('2d');
        const scale = Math.pow(2, zoom);
        ctx.save();
        ctx.beginPath();
        cfg.polygon.forEach(function (p, i) {
          const w = proj.fromLatLngToPoint(new google.maps.LatLng(p.lat, p.lng));
          const x = w.x * scale - coord.x * tileSize;
          const y = w.y * scale - coord.y * tileSize;
          if (i === 0) ctx.moveTo(x, y); else ctx.lineTo(x, y);
        });
        ctx.closePath();
        ctx.clip('nonzero');
        ctx.globalAlpha = cfg.opacity;
        ctx.drawImage(img, 0, 0, tileSize, tileSize);
        ctx.restore();
      };
      img.src = url;
      return canvas;
    },
    releaseTile: function () {}
  };
  map.overlayMapTypes.insertAt(0, overlay);
  new google.maps.Polygon({
    paths: cfg.polygon,
    strokeColor: cfg.strokeColor,
    strokeOpacity: 1.0,
    strokeWeight: cfg.strokeWidth,
    fillOpacity: 0,
    clickable: false,
    map: map
  });
  google.maps.event.addListenerOnce(map, 'tilesloaded', function () {
    setTimeout(function () { markComplete('tilesloaded'); }, cfg.settleDelayMs);
  });
}
)JS";

// Keeps "</script>" inside string values from closing the script element
std::string script_safe(const std::string& json_text) {
    return core::replace_all(json_text, "</", "<\\/");
}

} // namespace

void validate_basemap_api_key(const std::string& key) {
    std::string k = core::trim(key);
    if (k.empty()) {
        throw ConfigurationError("basemap API key is not set");
    }
    if (k.size() < kMinApiKeyLength) {
        throw ConfigurationError("basemap API key is too short (" + std::to_string(k.size()) +
                                 " characters)");
    }
    bool ok = std::all_of(k.begin(), k.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
    if (!ok) {
        throw ConfigurationError("basemap API key contains invalid characters");
    }
}

std::string tile_key(const TileCoordinate& tile) {
    return std::to_string(tile.z) + "/" + std::to_string(tile.x) + "/" + std::to_string(tile.y);
}

LiveOverlayRenderer LiveOverlayRenderer::for_request(const RenderRequest& request,
                                                     int settle_delay_ms, int hard_timeout_ms) {
    if (request.tile_url_template.empty()) {
        throw ConfigurationError("request has no tile URL template");
    }
    geometry::validate_polygon(request.polygon);

    LiveOverlayRenderer page;
    page.polygon = request.polygon;
    page.width = request.width;
    page.height = request.height;
    page.opacity = std::isnan(request.opacity) ? 0.0 : std::clamp(request.opacity, 0.0, 1.0);
    page.stroke_color = request.stroke_color;
    page.stroke_width = request.stroke_width > 0 ? request.stroke_width
                                                 : image::default_stroke_width(request.width);
    page.settle_delay_ms = settle_delay_ms;
    page.hard_timeout_ms = hard_timeout_ms;

    page.bounds = geometry::bounding_box(request.polygon, request.padding_percent);
    page.zoom = geometry::select_zoom(page.bounds, request.width, request.height);
    page.center = geometry::mercator_center(page.bounds);

    BoundingBox view = geometry::viewport_bounds(page.center, page.zoom, request.width, request.height);
    for (const auto& tile : geometry::tile_cover(view, page.zoom)) {
        page.tile_urls[tile_key(tile)] = geometry::expand_tile_url(request.tile_url_template, tile);
    }
    return page;
}

nlohmann::json LiveOverlayRenderer::page_config() const {
    nlohmann::json ring = nlohmann::json::array();
    for (const auto& p : polygon) {
        ring.push_back({{"lat", p.lat}, {"lng", p.lng}});
    }

    nlohmann::json cfg;
    cfg["center"] = {{"lat", center.lat}, {"lng", center.lng}};
    cfg["zoom"] = zoom;
    cfg["width"] = width;
    cfg["height"] = height;
    cfg["polygon"] = ring;
    cfg["tiles"] = tile_urls;
    cfg["opacity"] = opacity;
    cfg["strokeColor"] = stroke_color;
    cfg["strokeWidth"] = stroke_width;
    cfg["settleDelayMs"] = settle_delay_ms;
    cfg["hardTimeoutMs"] = hard_timeout_ms;
    return cfg;
}

std::string LiveOverlayRenderer::html(const std::string& basemap_api_key) const {
    validate_basemap_api_key(basemap_api_key);
    const std::string key = core::trim(basemap_api_key);

    std::string doc;
    doc += "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n";
    doc += "<style>html,body{margin:0;padding:0;overflow:hidden;background:#000}";
    doc += "#map{width:" + std::to_string(width) + "px;height:" + std::to_string(height) + "px}</style>\n";
    doc += "</head>\n<body>\n<div id=\"map\"></div>\n<script>\nconst CONFIG = ";
    doc += script_safe(page_config().dump());
    doc += ";\n";
    doc += kPageScript;
    doc += "</script>\n";
    doc += "<script async src=\"https://maps.googleapis.com/maps/api/js?key=" + key +
           "&callback=initMap\" onerror=\"window.renderError='basemap script failed to load'\"></script>\n";
    doc += "</body>\n</html>\n";
    return doc;
}

} // namespace geo_overlay::render
