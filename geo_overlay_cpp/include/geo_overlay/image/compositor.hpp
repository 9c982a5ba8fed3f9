#pragma once

#include "geo_overlay/core/types.hpp"

namespace geo_overlay::image {

// alpha' = round(alpha * opacity), opacity clamped to [0, 1]
RasterImage apply_opacity(const RasterImage& raster, double opacity);

// alpha' = round(alpha * mask / 255). Colour channels are untouched.
RasterImage apply_mask(const RasterImage& raster, const AlphaMask& mask);

// Porter-Duff "over" on non-premultiplied BGRA. Sizes must match.
RasterImage blend_over(const RasterImage& base, const RasterImage& overlay);

// max(3, round(width / 300))
int default_stroke_width(int image_width);

// Stroke coverage of the closed polygon outline (anti-aliased, round joins)
AlphaMask stroke_mask(const Polygon& polygon, const BoundingBox& bounds,
                      int width, int height, int stroke_width);

// Draws the outline over the raster. stroke_width <= 0 selects the default.
RasterImage draw_polygon_outline(const RasterImage& raster, const Polygon& polygon,
                                 const BoundingBox& bounds, const Rgba& color,
                                 int stroke_width = 0);

} // namespace geo_overlay::image
