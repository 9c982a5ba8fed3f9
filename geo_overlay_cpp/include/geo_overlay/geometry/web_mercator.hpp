#pragma once

#include "geo_overlay/core/types.hpp"

#include <string>
#include <vector>

namespace geo_overlay::geometry {

// Latitude limit of the square Web Mercator world
constexpr double kMaxMercatorLat = 85.05112877980659;

// Lat/lng -> normalized world coordinate, (0,0) north-west, (1,1) south-east
PixelPoint lat_lng_to_world(double lat, double lng);
GeoPoint world_to_lat_lng(double wx, double wy);

TileCoordinate tile_for_lat_lng(double lat, double lng, int zoom);

// North-west corner of the tile
GeoPoint tile_to_lat_lng(const TileCoordinate& tile);

// Pixel size of the box when drawn with 256px tiles at the given zoom
double projected_width_px(const BoundingBox& bounds, int zoom);
double projected_height_px(const BoundingBox& bounds, int zoom);

// Largest zoom in [0, kMaxZoom] at which the box fits in pixel_width x
// pixel_height, evaluated separately per axis (latitude in Mercator space).
int select_zoom(const BoundingBox& bounds, int pixel_width, int pixel_height);

// Midpoint of the box in Mercator space (differs from the lat/lng midpoint)
GeoPoint mercator_center(const BoundingBox& bounds);

// Geographic extent shown by a pixel_width x pixel_height map centred on
// `center` at `zoom`.
BoundingBox viewport_bounds(const GeoPoint& center, int zoom, int pixel_width, int pixel_height);

// Tiles intersecting the box at `zoom`, row-major from the north-west tile
std::vector<TileCoordinate> tile_cover(const BoundingBox& bounds, int zoom);

// Substitutes {x}/{y}/{z} or $x/$y/$z. A template without placeholders gets
// x, y and z appended as query parameters.
std::string expand_tile_url(const std::string& url_template, const TileCoordinate& tile);

} // namespace geo_overlay::geometry
