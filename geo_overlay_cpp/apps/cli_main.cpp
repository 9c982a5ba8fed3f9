#include "geo_overlay/browser/browser_pool.hpp"
#include "geo_overlay/config/configuration.hpp"
#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/core/types.hpp"
#include "geo_overlay/core/utils.hpp"
#include "geo_overlay/geometry/projection.hpp"
#include "geo_overlay/geometry/web_mercator.hpp"
#include "geo_overlay/image/codec.hpp"
#include "geo_overlay/io/http_client.hpp"
#include "geo_overlay/io/job_file.hpp"
#include "geo_overlay/render/composite_renderer.hpp"
#include "geo_overlay/render/live_tile_renderer.hpp"
#include "geo_overlay/render/orchestrator.hpp"
#include "geo_overlay/runner/events.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using namespace geo_overlay;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static json bounds_to_json(const BoundingBox& b) {
    return {{"min_lat", b.min_lat}, {"max_lat", b.max_lat},
            {"min_lng", b.min_lng}, {"max_lng", b.max_lng}};
}

static Polygon load_polygon(const fs::path& path) {
    json j = json::parse(core::read_text(path), nullptr, false);
    if (j.is_discarded()) {
        throw ValidationError("polygon file is not valid JSON: " + path.string());
    }
    if (j.is_object() && j.contains("polygon")) j = j["polygon"];
    return io::parse_polygon(j);
}

// Item names come from the job file; keep them inside the output directory
static std::string output_file_name(const std::string& name) {
    std::string out = name;
    for (char& c : out) {
        if (c == '/' || c == '\\' || c == '\0') c = '_';
    }
    if (out.empty() || out == "." || out == "..") out = "item";
    return out + ".png";
}

static config::Config load_config_or_default(const std::string& path) {
    if (path.empty()) return config::Config{};
    return config::Config::load(path);
}

// ============================================================================
// bbox <polygon.json> [--padding P] [--width W] [--height H]
// ============================================================================
int cmd_bbox(const std::string& polygon_path, double padding, int width, int height) {
    Polygon polygon = load_polygon(polygon_path);
    geometry::validate_polygon(polygon);

    BoundingBox bounds = geometry::bounding_box(polygon, padding);
    int zoom = geometry::select_zoom(bounds, width, height);
    GeoPoint center = geometry::mercator_center(bounds);
    BoundingBox view = geometry::viewport_bounds(center, zoom, width, height);

    json result;
    result["bounds"] = bounds_to_json(bounds);
    result["padding_percent"] = padding;
    result["area_deg2"] = std::abs(geometry::polygon_signed_area(polygon));
    result["center"] = {{"lat", center.lat}, {"lng", center.lng}};
    result["zoom"] = zoom;
    result["projected_px"] = {geometry::projected_width_px(bounds, zoom),
                              geometry::projected_height_px(bounds, zoom)};
    result["viewport"] = bounds_to_json(view);
    result["tiles"] = geometry::tile_cover(view, zoom).size();
    print_json(result);
    return 0;
}

// ============================================================================
// composite --base B --overlay O --polygon P --out OUT [--opacity X] [--color C]
// ============================================================================
int cmd_composite(const std::string& base_path, const std::string& overlay_path,
                  const std::string& polygon_path, const std::string& out_path,
                  const config::Config& cfg, const std::string& opacity_str,
                  const std::string& color_str, bool data_uri) {
    Polygon polygon = load_polygon(polygon_path);

    render::CompositeOptions options;
    options.opacity = opacity_str.empty() ? cfg.render.opacity : std::stod(opacity_str);
    options.stroke_color = core::parse_hex_color(color_str.empty() ? cfg.render.stroke_color : color_str);
    options.stroke_width = cfg.render.stroke_width;
    options.padding_percent = cfg.render.padding_percent;
    options.raster.antialias = cfg.render.antialias;
    options.raster.supersample = cfg.render.supersample;

    RasterImage base = image::decode_image(core::read_bytes(base_path));
    RasterImage overlay = image::decode_image(core::read_bytes(overlay_path));
    RasterImage out = render::composite_index_overlay(base, overlay, polygon, options);

    std::vector<uint8_t> png = image::encode_png(out);
    core::write_bytes(out_path, png);

    json result;
    result["out"] = out_path;
    result["width"] = out.cols;
    result["height"] = out.rows;
    result["bytes"] = png.size();
    result["sha256"] = core::sha256_bytes(png);
    if (data_uri) result["data_uri"] = core::to_data_uri(png);
    print_json(result);
    return 0;
}

// ============================================================================
// render --job JOB.json --out DIR [--config CFG.yaml] [--log FILE] [--data-uri]
// ============================================================================
int cmd_render(const std::string& job_path, const std::string& out_dir,
               const config::Config& cfg, const std::string& log_path, bool data_uri) {
    std::ofstream log_file;
    if (!log_path.empty()) {
        fs::create_directories(fs::path(log_path).parent_path().empty()
                                   ? fs::path(".") : fs::path(log_path).parent_path());
        log_file.open(log_path, std::ios::app);
        if (!log_file) {
            throw IOError("cannot open log file: " + log_path);
        }
    }
    runner::EventEmitter events(std::cout, log_file.is_open() ? &log_file : nullptr);

    const std::string run_id = core::get_run_id();
    std::vector<RenderRequest> requests = io::load_job(job_path, cfg);
    fs::create_directories(out_dir);

    io::CurlHttpClient http(cfg.network);
    render::CompositeRenderer composite(&http, image::RasterizeOptions{cfg.render.antialias,
                                                                        cfg.render.supersample});

    browser::BrowserOptions browser_options;
    browser_options.executable = cfg.live.browser_executable;
    browser_options.extra_args = cfg.live.browser_args;
    browser_options.launch_timeout_ms = cfg.live.launch_timeout_ms;
    browser_options.command_timeout_ms = cfg.live.completion_timeout_ms;
    browser::BrowserPool pool(browser_options);

    std::unique_ptr<render::LiveTileRenderer> live;
    std::vector<render::Renderer*> chain;
    if (cfg.live.enabled) {
        live = std::make_unique<render::LiveTileRenderer>(pool, cfg.live, cfg.resolve_basemap_api_key());
        chain.push_back(live.get());
    }
    if (cfg.composite.enabled) {
        chain.push_back(&composite);
    }
    if (chain.empty()) {
        events.warning(run_id, "both live and composite rendering are disabled");
    }

    json run_info;
    run_info["job"] = job_path;
    run_info["out_dir"] = out_dir;
    run_info["items"] = requests.size();
    json names = json::array();
    for (auto* r : chain) names.push_back(r->name());
    run_info["renderers"] = names;
    events.run_start(run_id, run_info);

    render::RenderOrchestrator orchestrator(chain);
    json manifest_items = json::array();
    size_t rendered = 0;

    for (size_t i = 0; i < requests.size(); ++i) {
        const RenderRequest& req = requests[i];
        events.item_start(run_id, i, requests.size(), req.name);

        RenderOutcome outcome = orchestrator.render(req);

        json entry;
        entry["name"] = req.name;
        entry["status"] = render_status_to_string(outcome.status);
        json attempts = json::array();
        for (const auto& a : outcome.attempts) {
            json aj = {{"renderer", a.renderer}, {"success", a.success}, {"elapsed_ms", a.elapsed_ms}};
            if (!a.error.empty()) aj["error"] = a.error;
            attempts.push_back(aj);
        }
        entry["attempts"] = attempts;

        if (outcome.rendered()) {
            fs::path file = fs::path(out_dir) / output_file_name(req.name);
            core::write_bytes(file, outcome.png);
            entry["renderer"] = outcome.renderer;
            entry["file"] = file.filename().string();
            entry["width"] = outcome.image.cols;
            entry["height"] = outcome.image.rows;
            entry["sha256"] = core::sha256_bytes(outcome.png);
            if (data_uri) entry["data_uri"] = core::to_data_uri(outcome.png);
            ++rendered;
        } else {
            entry["reason"] = outcome.reason;
            events.warning(run_id, req.name + ": no image available");
        }

        json extra = entry;
        extra.erase("name");
        extra.erase("status");
        extra.erase("data_uri");
        events.item_end(run_id, i, req.name, entry["status"].get<std::string>(), extra);
        manifest_items.push_back(entry);
    }

    pool.shutdown();

    json manifest;
    manifest["run_id"] = run_id;
    manifest["created_at"] = core::get_iso_timestamp();
    manifest["job"] = job_path;
    manifest["rendered"] = rendered;
    manifest["failed"] = requests.size() - rendered;
    manifest["items"] = manifest_items;
    core::write_text(fs::path(out_dir) / "manifest.json", manifest.dump(2));

    const bool all_ok = rendered == requests.size();
    events.run_end(run_id, all_ok, {{"rendered", rendered}, {"failed", requests.size() - rendered}});
    return all_ok ? 0 : 2;
}

// ============================================================================
// validate-config --path P [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, bool strict_exit) {
    json result;
    result["path"] = path;
    result["valid"] = false;
    result["errors"] = json::array();
    result["warnings"] = json::array();

    try {
        config::Config cfg = config::Config::load(path);
        cfg.validate();
        result["valid"] = true;
        if (cfg.live.enabled && cfg.resolve_basemap_api_key().empty()) {
            result["warnings"].push_back("live rendering enabled but no basemap API key is set (" +
                                         cfg.live.basemap_api_key_env + ")");
        }
    } catch (const GeoOverlayError& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// print-config [--path P]
// ============================================================================
int cmd_print_config(const std::string& path) {
    config::Config cfg = load_config_or_default(path);
    YAML::Emitter out;
    out << cfg.to_yaml();
    std::cout << out.c_str() << std::endl;
    return 0;
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: geo_overlay_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  bbox <polygon.json> [--padding P] [--width W] [--height H]\n"
              << "                                  Print bounds, zoom and tile count\n"
              << "  composite --base B --overlay O --polygon P --out OUT\n"
              << "            [--opacity X] [--color C] [--config CFG] [--data-uri]\n"
              << "                                  Composite two local thumbnails\n"
              << "  render --job JOB --out DIR [--config CFG] [--log FILE] [--data-uri]\n"
              << "                                  Render every job item (live, then composite)\n"
              << "  validate-config --path P [--strict-exit-codes]\n"
              << "                                  Validate a config YAML file\n"
              << "  print-config [--path P]         Print effective config as YAML\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name, const char* short_name = nullptr) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0 || (short_name && std::strcmp(argv[i], short_name) == 0)) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                ++i;
            }
        }
        return "";
    };

    try {
        if (command == "bbox") {
            std::string path = get_positional(0);
            if (path.empty()) {
                std::cerr << "bbox requires a polygon file argument\n";
                return 1;
            }
            std::string padding = get_arg("--padding");
            std::string width = get_arg("--width", "-w");
            std::string height = get_arg("--height", "-h");
            return cmd_bbox(path,
                            padding.empty() ? kDefaultPaddingPercent : std::stod(padding),
                            width.empty() ? kDefaultDimension : std::stoi(width),
                            height.empty() ? kDefaultDimension : std::stoi(height));
        }

        if (command == "composite") {
            std::string base = get_arg("--base");
            std::string overlay = get_arg("--overlay");
            std::string polygon = get_arg("--polygon");
            std::string out = get_arg("--out", "-o");
            if (base.empty() || overlay.empty() || polygon.empty() || out.empty()) {
                std::cerr << "composite requires --base, --overlay, --polygon and --out\n";
                return 1;
            }
            config::Config cfg = load_config_or_default(get_arg("--config", "-c"));
            cfg.validate();
            return cmd_composite(base, overlay, polygon, out, cfg, get_arg("--opacity"),
                                 get_arg("--color"), has_flag("--data-uri"));
        }

        if (command == "render") {
            std::string job = get_arg("--job");
            std::string out = get_arg("--out", "-o");
            if (job.empty() || out.empty()) {
                std::cerr << "render requires --job and --out\n";
                return 1;
            }
            config::Config cfg = load_config_or_default(get_arg("--config", "-c"));
            cfg.validate();
            return cmd_render(job, out, cfg, get_arg("--log"), has_flag("--data-uri"));
        }

        if (command == "validate-config") {
            std::string path = get_arg("--path");
            if (path.empty()) {
                std::cerr << "validate-config requires --path\n";
                return 1;
            }
            return cmd_validate_config(path, has_flag("--strict-exit-codes"));
        }

        if (command == "print-config") {
            return cmd_print_config(get_arg("--path"));
        }
    } catch (const GeoOverlayError& e) {
        json err;
        err["type"] = "error";
        err["command"] = command;
        err["message"] = e.what();
        err["ts"] = core::get_iso_timestamp();
        std::cout << err.dump() << std::endl;
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::logic_error& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")" << std::endl;
        return 1;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
}
