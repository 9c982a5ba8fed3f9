#pragma once

#include "geo_overlay/image/rasterizer.hpp"
#include "geo_overlay/io/http_client.hpp"
#include "geo_overlay/render/renderer.hpp"

namespace geo_overlay::render {

struct CompositeOptions {
    double opacity = kDefaultOpacity;
    Rgba stroke_color{0x5d, 0xb8, 0x15, 255};
    int stroke_width = 0;  // <= 0 selects max(3, width / 300)
    double padding_percent = kDefaultPaddingPercent;
    image::RasterizeOptions raster;
};

// Base -> masked overlay -> outline on two decoded images. The overlay is
// resampled to the base size when they differ.
//
// Both images must have been produced for bounding_box(polygon,
// options.padding_percent). That cannot be verified from the pixels; a
// thumbnail requested with another padding composites without error but
// misaligned.
RasterImage composite_index_overlay(const RasterImage& base, const RasterImage& overlay,
                                    const Polygon& polygon, const CompositeOptions& options);

// Fallback renderer over the static base and overlay thumbnails of a request.
// Thumbnails given as bytes are used directly, then local files are read,
// otherwise they are downloaded through `http` (which may be null when only
// bytes or files are ever supplied).
class CompositeRenderer : public Renderer {
public:
    explicit CompositeRenderer(io::HttpClient* http,
                               image::RasterizeOptions raster = image::RasterizeOptions{});

    std::string name() const override { return "composite"; }

    RasterImage render(const RenderRequest& request) override;

private:
    std::vector<uint8_t> load_thumbnail(const std::vector<uint8_t>& bytes, const std::string& path,
                                        const std::string& url, const char* which) const;

    io::HttpClient* http_;
    image::RasterizeOptions raster_;
};

} // namespace geo_overlay::render
