#pragma once

#include "geo_overlay/core/types.hpp"

#include <vector>

namespace geo_overlay::geometry {

// Throws ValidationError for fewer than 3 vertices or out-of-range /
// non-finite coordinates. Does not check the enclosed area.
void validate_polygon(const Polygon& polygon);

// Shoelace area in square degrees (lng as x, lat as y). Positive for
// counter-clockwise rings.
double polygon_signed_area(const Polygon& polygon);

// Min/max over all vertices, each axis then grown by range * padding / 100 on
// both ends. Every path that frames imagery for the same polygon must use the
// same padding or base and overlay will not line up.
BoundingBox bounding_box(const Polygon& polygon, double padding_percent = kDefaultPaddingPercent);

// Linear (equirectangular) frame of a bounding box rendered at width x height,
// origin top-left. This is how static thumbnails for a region are framed.
GeoTransform geo_to_pixel_transform(const BoundingBox& bounds, int width, int height);
GeoTransform pixel_to_geo_transform(const BoundingBox& bounds, int width, int height);

PixelPoint project_to_pixel(const GeoPoint& point, const BoundingBox& bounds, int width, int height);
GeoPoint pixel_to_geo(const PixelPoint& pixel, const BoundingBox& bounds, int width, int height);

std::vector<PixelPoint> project_polygon(const Polygon& polygon, const BoundingBox& bounds,
                                        int width, int height);

} // namespace geo_overlay::geometry
