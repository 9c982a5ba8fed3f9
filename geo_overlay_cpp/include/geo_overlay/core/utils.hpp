#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace geo_overlay::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
void write_bytes(const fs::path& path, const std::vector<uint8_t>& data);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hash / encoding utilities (OpenSSL)
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string base64_encode(const std::vector<uint8_t>& data);
std::vector<uint8_t> base64_decode(const std::string& text);

// "data:<mime>;base64,..." for inline embedding in HTML mail and PDF templates
std::string to_data_uri(const std::vector<uint8_t>& data, const std::string& mime = "image/png");

// String utilities
std::string trim(const std::string& s);
std::string to_lower(const std::string& s);
bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);
bool contains(const std::string& str, const std::string& needle);
std::string replace_all(std::string str, const std::string& from, const std::string& to);

// "#rrggbb", "#rrggbbaa" or "#rgb"
Rgba parse_hex_color(const std::string& text);

} // namespace geo_overlay::core
