#include "geo_overlay/config/configuration.hpp"
#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/core/utils.hpp"

#include <cstdlib>
#include <fstream>

namespace geo_overlay::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigurationError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["render"]) {
            auto r = node["render"];
            if (r["width"]) cfg.render.width = r["width"].as<int>();
            if (r["height"]) cfg.render.height = r["height"].as<int>();
            if (r["opacity"]) cfg.render.opacity = r["opacity"].as<double>();
            if (r["stroke_color"]) cfg.render.stroke_color = r["stroke_color"].as<std::string>();
            if (r["stroke_width"]) cfg.render.stroke_width = r["stroke_width"].as<int>();
            if (r["padding_percent"]) cfg.render.padding_percent = r["padding_percent"].as<double>();
            if (r["antialias"]) cfg.render.antialias = r["antialias"].as<bool>();
            if (r["supersample"]) cfg.render.supersample = r["supersample"].as<int>();
        }

        if (node["live"]) {
            auto l = node["live"];
            if (l["enabled"]) cfg.live.enabled = l["enabled"].as<bool>();
            if (l["browser_executable"]) cfg.live.browser_executable = l["browser_executable"].as<std::string>();
            if (l["browser_args"] && l["browser_args"].IsSequence()) {
                cfg.live.browser_args.clear();
                for (const auto& a : l["browser_args"]) {
                    cfg.live.browser_args.push_back(a.as<std::string>());
                }
            }
            if (l["basemap_api_key"]) cfg.live.basemap_api_key = l["basemap_api_key"].as<std::string>();
            if (l["basemap_api_key_env"]) cfg.live.basemap_api_key_env = l["basemap_api_key_env"].as<std::string>();
            if (l["settle_delay_ms"]) cfg.live.settle_delay_ms = l["settle_delay_ms"].as<int>();
            if (l["hard_timeout_ms"]) cfg.live.hard_timeout_ms = l["hard_timeout_ms"].as<int>();
            if (l["completion_timeout_ms"]) cfg.live.completion_timeout_ms = l["completion_timeout_ms"].as<int>();
            if (l["poll_interval_ms"]) cfg.live.poll_interval_ms = l["poll_interval_ms"].as<int>();
            if (l["launch_timeout_ms"]) cfg.live.launch_timeout_ms = l["launch_timeout_ms"].as<int>();
        }

        if (node["network"]) {
            auto n = node["network"];
            if (n["timeout_seconds"]) cfg.network.timeout_seconds = n["timeout_seconds"].as<int>();
            if (n["connect_timeout_seconds"]) {
                cfg.network.connect_timeout_seconds = n["connect_timeout_seconds"].as<int>();
            }
            if (n["retries"]) cfg.network.retries = n["retries"].as<int>();
            if (n["user_agent"]) cfg.network.user_agent = n["user_agent"].as<std::string>();
        }

        if (node["composite"]) {
            auto c = node["composite"];
            if (c["enabled"]) cfg.composite.enabled = c["enabled"].as<bool>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigurationError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["render"]["width"] = render.width;
    node["render"]["height"] = render.height;
    node["render"]["opacity"] = render.opacity;
    node["render"]["stroke_color"] = render.stroke_color;
    node["render"]["stroke_width"] = render.stroke_width;
    node["render"]["padding_percent"] = render.padding_percent;
    node["render"]["antialias"] = render.antialias;
    node["render"]["supersample"] = render.supersample;

    node["live"]["enabled"] = live.enabled;
    node["live"]["browser_executable"] = live.browser_executable;
    for (const auto& a : live.browser_args) {
        node["live"]["browser_args"].push_back(a);
    }
    // The key itself is never written back; only where to find it
    node["live"]["basemap_api_key_env"] = live.basemap_api_key_env;
    node["live"]["settle_delay_ms"] = live.settle_delay_ms;
    node["live"]["hard_timeout_ms"] = live.hard_timeout_ms;
    node["live"]["completion_timeout_ms"] = live.completion_timeout_ms;
    node["live"]["poll_interval_ms"] = live.poll_interval_ms;
    node["live"]["launch_timeout_ms"] = live.launch_timeout_ms;

    node["network"]["timeout_seconds"] = network.timeout_seconds;
    node["network"]["connect_timeout_seconds"] = network.connect_timeout_seconds;
    node["network"]["retries"] = network.retries;
    node["network"]["user_agent"] = network.user_agent;

    node["composite"]["enabled"] = composite.enabled;

    return node;
}

void Config::validate() const {
    if (render.width < 1 || render.height < 1 || render.width > 8192 || render.height > 8192) {
        throw ConfigurationError("render.width and render.height must be in [1,8192]");
    }
    if (render.opacity < 0.0 || render.opacity > 1.0) {
        throw ConfigurationError("render.opacity must be in [0,1]");
    }
    if (render.stroke_width < 0) {
        throw ConfigurationError("render.stroke_width must be >= 0");
    }
    if (render.padding_percent < 0.0 || render.padding_percent > 100.0) {
        throw ConfigurationError("render.padding_percent must be in [0,100]");
    }
    if (render.supersample < 1 || render.supersample > 16) {
        throw ConfigurationError("render.supersample must be in [1,16]");
    }
    try {
        core::parse_hex_color(render.stroke_color);
    } catch (const ValidationError&) {
        throw ConfigurationError("render.stroke_color must be a hex color, got '" +
                                 render.stroke_color + "'");
    }

    if (live.settle_delay_ms < 0) {
        throw ConfigurationError("live.settle_delay_ms must be >= 0");
    }
    if (live.hard_timeout_ms < live.settle_delay_ms) {
        throw ConfigurationError("live.hard_timeout_ms must be >= live.settle_delay_ms");
    }
    if (live.completion_timeout_ms < live.hard_timeout_ms) {
        throw ConfigurationError("live.completion_timeout_ms must be >= live.hard_timeout_ms");
    }
    if (live.poll_interval_ms < 10) {
        throw ConfigurationError("live.poll_interval_ms must be >= 10");
    }
    if (live.launch_timeout_ms < 1000) {
        throw ConfigurationError("live.launch_timeout_ms must be >= 1000");
    }

    if (network.timeout_seconds < 1) {
        throw ConfigurationError("network.timeout_seconds must be >= 1");
    }
    if (network.connect_timeout_seconds < 1 || network.connect_timeout_seconds > network.timeout_seconds) {
        throw ConfigurationError("network.connect_timeout_seconds must be in [1,timeout_seconds]");
    }
    if (network.retries < 0 || network.retries > 10) {
        throw ConfigurationError("network.retries must be in [0,10]");
    }

    if (!live.enabled && !composite.enabled) {
        throw ConfigurationError("at least one of live.enabled and composite.enabled must be true");
    }
}

RenderRequest Config::make_request(const Polygon& polygon) const {
    RenderRequest req;
    req.polygon = polygon;
    req.width = render.width;
    req.height = render.height;
    req.opacity = render.opacity;
    req.stroke_color = render.stroke_color;
    req.stroke_width = render.stroke_width;
    req.padding_percent = render.padding_percent;
    return req;
}

std::string Config::resolve_basemap_api_key() const {
    if (!live.basemap_api_key.empty()) {
        return core::trim(live.basemap_api_key);
    }
    if (!live.basemap_api_key_env.empty()) {
        const char* v = std::getenv(live.basemap_api_key_env.c_str());
        if (v) return core::trim(v);
    }
    return "";
}

} // namespace geo_overlay::config
