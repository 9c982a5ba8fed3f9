#include "geo_overlay/io/job_file.hpp"
#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/core/utils.hpp"

namespace geo_overlay::io {

namespace {

// Only the path is resolved here; a missing file fails that item's composite
// render, not the whole job.
std::string thumbnail_path(const nlohmann::json& item, const char* key, const fs::path& base_dir) {
    if (!item.contains(key)) return {};
    fs::path p = item[key].get<std::string>();
    if (p.empty()) return {};
    if (p.is_relative()) p = base_dir / p;
    return p.string();
}

} // namespace

Polygon parse_polygon(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw ValidationError("polygon must be an array of points");
    }

    Polygon polygon;
    polygon.reserve(j.size());
    for (const auto& v : j) {
        GeoPoint p;
        if (v.is_object() && v.contains("lat") && v.contains("lng")) {
            if (!v["lat"].is_number() || !v["lng"].is_number()) {
                throw ValidationError("polygon point coordinates must be numbers");
            }
            p.lat = v["lat"].get<double>();
            p.lng = v["lng"].get<double>();
        } else if (v.is_array() && v.size() == 2 && v[0].is_number() && v[1].is_number()) {
            p.lat = v[0].get<double>();
            p.lng = v[1].get<double>();
        } else {
            throw ValidationError("polygon point must be {lat, lng} or [lat, lng]: " + v.dump());
        }
        polygon.push_back(p);
    }
    return polygon;
}

nlohmann::json polygon_to_json(const Polygon& polygon) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& p : polygon) {
        out.push_back({{"lat", p.lat}, {"lng", p.lng}});
    }
    return out;
}

std::vector<RenderRequest> parse_job(const nlohmann::json& job, const config::Config& cfg,
                                     const fs::path& base_dir) {
    if (!job.is_object() || !job.contains("items") || !job["items"].is_array()) {
        throw ValidationError("job must be an object with an \"items\" array");
    }

    std::vector<RenderRequest> requests;
    size_t index = 0;
    for (const auto& item : job["items"]) {
        if (!item.is_object() || !item.contains("polygon")) {
            throw ValidationError("job item " + std::to_string(index) + " has no polygon");
        }

        try {
            RenderRequest req = cfg.make_request(parse_polygon(item["polygon"]));
            req.name = item.value("name", "item_" + std::to_string(index));
            req.tile_url_template = item.value("tile_url_template", std::string());
            req.base_thumbnail_url = item.value("base_thumbnail_url", std::string());
            req.overlay_thumbnail_url = item.value("overlay_thumbnail_url", std::string());
            req.base_thumbnail_path = thumbnail_path(item, "base_thumbnail", base_dir);
            req.overlay_thumbnail_path = thumbnail_path(item, "overlay_thumbnail", base_dir);
            req.opacity = item.value("opacity", req.opacity);
            req.stroke_color = item.value("stroke_color", req.stroke_color);
            req.stroke_width = item.value("stroke_width", req.stroke_width);
            req.width = item.value("width", req.width);
            req.height = item.value("height", req.height);
            req.padding_percent = item.value("padding_percent", req.padding_percent);
            requests.push_back(std::move(req));
        } catch (const nlohmann::json::exception& e) {
            throw ValidationError("job item " + std::to_string(index) + ": " + e.what());
        }
        ++index;
    }
    return requests;
}

std::vector<RenderRequest> load_job(const fs::path& path, const config::Config& cfg) {
    nlohmann::json job = nlohmann::json::parse(core::read_text(path), nullptr, false);
    if (job.is_discarded()) {
        throw ValidationError("job file is not valid JSON: " + path.string());
    }
    return parse_job(job, cfg, path.parent_path());
}

} // namespace geo_overlay::io
