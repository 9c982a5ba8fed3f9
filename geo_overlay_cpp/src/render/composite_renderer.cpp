#include "geo_overlay/render/composite_renderer.hpp"
#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/core/utils.hpp"
#include "geo_overlay/geometry/projection.hpp"
#include "geo_overlay/image/codec.hpp"
#include "geo_overlay/image/compositor.hpp"

#include <cmath>
#include <iostream>

namespace geo_overlay::render {

static void check_polygon(const Polygon& polygon) {
    try {
        geometry::validate_polygon(polygon);
    } catch (const ValidationError& e) {
        throw CompositeError(e.what());
    }
    if (std::abs(geometry::polygon_signed_area(polygon)) <= 0.0) {
        throw CompositeError("polygon encloses no area");
    }
}

RasterImage composite_index_overlay(const RasterImage& base, const RasterImage& overlay,
                                    const Polygon& polygon, const CompositeOptions& options) {
    check_polygon(polygon);
    if (base.empty() || overlay.empty()) {
        throw CompositeError("base and overlay images must not be empty");
    }

    const int w = base.cols;
    const int h = base.rows;

    RasterImage fitted = overlay;
    if (overlay.cols != w || overlay.rows != h) {
        std::cerr << "[Composite] Overlay " << overlay.cols << "x" << overlay.rows
                  << " resized to " << w << "x" << h << std::endl;
        fitted = image::resize_fill(overlay, w, h);
    }

    BoundingBox bounds;
    try {
        bounds = geometry::bounding_box(polygon, options.padding_percent);
    } catch (const ValidationError& e) {
        throw CompositeError(e.what());
    }

    AlphaMask mask = image::rasterize_polygon_mask(polygon, bounds, w, h, options.raster);

    RasterImage masked = image::apply_mask(image::apply_opacity(fitted, options.opacity), mask);
    RasterImage result = image::blend_over(base, masked);

    int stroke = options.stroke_width > 0 ? options.stroke_width : image::default_stroke_width(w);
    return image::draw_polygon_outline(result, polygon, bounds, options.stroke_color, stroke);
}

CompositeRenderer::CompositeRenderer(io::HttpClient* http, image::RasterizeOptions raster)
    : http_(http), raster_(raster) {}

std::vector<uint8_t> CompositeRenderer::load_thumbnail(const std::vector<uint8_t>& bytes,
                                                       const std::string& path,
                                                       const std::string& url,
                                                       const char* which) const {
    if (!bytes.empty()) return bytes;
    if (!path.empty()) {
        std::cerr << "[Composite] Reading " << which << " thumbnail " << path << std::endl;
        return core::read_bytes(path);
    }
    if (url.empty()) {
        throw CompositeError(std::string("no ") + which + " thumbnail supplied");
    }
    if (!http_) {
        throw CompositeError(std::string("no HTTP client to download the ") + which + " thumbnail");
    }

    std::cerr << "[Composite] Downloading " << which << " thumbnail..." << std::endl;
    return http_->fetch(url);
}

RasterImage CompositeRenderer::render(const RenderRequest& request) {
    check_polygon(request.polygon);
    if (request.width < 1 || request.height < 1) {
        throw CompositeError("requested size must be positive");
    }

    auto base_bytes = load_thumbnail(request.base_thumbnail, request.base_thumbnail_path,
                                     request.base_thumbnail_url, "base");
    auto overlay_bytes = load_thumbnail(request.overlay_thumbnail, request.overlay_thumbnail_path,
                                        request.overlay_thumbnail_url, "overlay");

    RasterImage base = image::decode_image(base_bytes);
    RasterImage overlay = image::decode_image(overlay_bytes);
    std::cerr << "[Composite] Base " << base.cols << "x" << base.rows << ", overlay "
              << overlay.cols << "x" << overlay.rows << std::endl;

    if (base.cols != request.width || base.rows != request.height) {
        base = image::resize_fill(base, request.width, request.height);
    }

    CompositeOptions options;
    options.opacity = request.opacity;
    options.stroke_width = request.stroke_width;
    options.padding_percent = request.padding_percent;
    options.raster = raster_;
    try {
        options.stroke_color = core::parse_hex_color(request.stroke_color);
    } catch (const ValidationError& e) {
        throw CompositeError(e.what());
    }

    RasterImage out = composite_index_overlay(base, overlay, request.polygon, options);
    std::cerr << "[Composite] Composite created (" << out.cols << "x" << out.rows << ")" << std::endl;
    return out;
}

} // namespace geo_overlay::render
