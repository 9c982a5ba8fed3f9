#pragma once

#include "geo_overlay/core/types.hpp"

#include <vector>

namespace geo_overlay::image {

struct RasterizeOptions {
    bool antialias = true;
    int supersample = 4;  // samples per axis when antialias is on
};

// Scan-fill of a closed pixel-space ring using the nonzero winding rule.
// A pixel (or sub-sample) is inside when its centre is inside; the left and
// top edges of the ring are inclusive, right and bottom exclusive. With
// antialias the mask value is the covered fraction of the pixel times 255.
AlphaMask rasterize_ring(const std::vector<PixelPoint>& ring, int width, int height,
                         const RasterizeOptions& options = RasterizeOptions{});

// Projects the polygon with the linear bounds frame and fills it.
AlphaMask rasterize_polygon_mask(const Polygon& polygon, const BoundingBox& bounds,
                                 int width, int height,
                                 const RasterizeOptions& options = RasterizeOptions{});

// Number of mask pixels >= threshold
int count_inside(const AlphaMask& mask, uint8_t threshold = 128);

} // namespace geo_overlay::image
