#pragma once

#include "geo_overlay/config/configuration.hpp"
#include "geo_overlay/core/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <vector>

namespace geo_overlay::io {

namespace fs = std::filesystem;

// Accepts [{"lat": .., "lng": ..}, ...] or [[lat, lng], ...]. Throws
// ValidationError for anything else.
Polygon parse_polygon(const nlohmann::json& j);

nlohmann::json polygon_to_json(const Polygon& polygon);

// Reads a batch job:
//   { "items": [ { "name", "polygon", "tile_url_template",
//                  "base_thumbnail_url" | "base_thumbnail" (file),
//                  "overlay_thumbnail_url" | "overlay_thumbnail" (file),
//                  "opacity", "stroke_color", "stroke_width",
//                  "width", "height", "padding_percent" }, ... ] }
// Unset rendering fields come from cfg.render. Thumbnail file paths are
// resolved against base_dir; the files are read by the composite renderer.
// Items without a name are named "item_<index>".
std::vector<RenderRequest> parse_job(const nlohmann::json& job, const config::Config& cfg,
                                     const fs::path& base_dir);

std::vector<RenderRequest> load_job(const fs::path& path, const config::Config& cfg);

} // namespace geo_overlay::io
