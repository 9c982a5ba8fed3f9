#pragma once

#include "geo_overlay/core/types.hpp"

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace geo_overlay::image {

// Decodes PNG/JPEG/... bytes into 8-bit BGRA. Grey and BGR inputs get an
// opaque alpha channel. Throws CompositeError when the bytes are not an image.
RasterImage decode_image(const std::vector<uint8_t>& bytes);

std::vector<uint8_t> encode_png(const RasterImage& image);

// Resample to exactly width x height, aspect ratio not preserved
RasterImage resize_fill(const RasterImage& image, int width, int height);

// (width, height) from a PNG header, falling back to a full decode for other
// formats. nullopt when the bytes are not an image.
std::optional<std::pair<int, int>> image_dimensions(const std::vector<uint8_t>& bytes);

} // namespace geo_overlay::image
