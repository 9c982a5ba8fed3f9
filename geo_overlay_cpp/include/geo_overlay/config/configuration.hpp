#pragma once

#include "geo_overlay/core/types.hpp"

#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace geo_overlay::config {

namespace fs = std::filesystem;

struct RenderConfig {
  int width = kDefaultDimension;
  int height = kDefaultDimension;
  double opacity = kDefaultOpacity;
  std::string stroke_color = kDefaultStrokeColor;
  int stroke_width = 0;                      // 0 = max(3, width / 300)
  double padding_percent = kDefaultPaddingPercent;
  bool antialias = true;
  int supersample = 4;
};

struct LiveConfig {
  bool enabled = true;
  std::string browser_executable;            // empty = GEO_OVERLAY_BROWSER, then well-known paths
  std::vector<std::string> browser_args;     // appended to the built-in headless flags
  std::string basemap_api_key;               // empty = read basemap_api_key_env
  std::string basemap_api_key_env = "GOOGLE_MAPS_SERVER_API_KEY";
  int settle_delay_ms = 2000;                // after the basemap reports tiles loaded
  int hard_timeout_ms = 10000;               // in-page: complete regardless of tile state
  int completion_timeout_ms = 15000;         // host-side wait for the completion flag
  int poll_interval_ms = 100;
  int launch_timeout_ms = 10000;
};

struct NetworkConfig {
  int timeout_seconds = 30;
  int connect_timeout_seconds = 10;
  int retries = 2;
  std::string user_agent = "GeoOverlay-Report-Service/1.0";
};

struct CompositeConfig {
  bool enabled = true;
};

struct Config {
  RenderConfig render;
  LiveConfig live;
  NetworkConfig network;
  CompositeConfig composite;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Fills unset rendering parameters of a request from the render section
  RenderRequest make_request(const Polygon &polygon) const;

  // Explicit key first, then the configured environment variable. Trimmed;
  // empty when neither is set.
  std::string resolve_basemap_api_key() const;
};

} // namespace geo_overlay::config
