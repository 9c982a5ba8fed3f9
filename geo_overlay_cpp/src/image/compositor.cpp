#include "geo_overlay/image/compositor.hpp"
#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/geometry/projection.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <vector>

namespace geo_overlay::image {

static uint8_t round_u8(double v) {
    if (v <= 0.0) return 0;
    if (v >= 255.0) return 255;
    return static_cast<uint8_t>(std::lround(v));
}

static void require_same_size(const cv::Mat& a, const cv::Mat& b, const char* what) {
    if (a.rows != b.rows || a.cols != b.cols) {
        std::ostringstream oss;
        oss << what << ": size mismatch " << a.cols << "x" << a.rows
            << " vs " << b.cols << "x" << b.rows;
        throw CompositeError(oss.str());
    }
}

RasterImage apply_opacity(const RasterImage& raster, double opacity) {
    if (!std::isfinite(opacity)) opacity = 0.0;
    opacity = std::clamp(opacity, 0.0, 1.0);

    RasterImage out = raster.clone();
    for (int y = 0; y < out.rows; ++y) {
        cv::Vec4b* row = out[y];
        for (int x = 0; x < out.cols; ++x) {
            row[x][3] = round_u8(row[x][3] * opacity);
        }
    }
    return out;
}

RasterImage apply_mask(const RasterImage& raster, const AlphaMask& mask) {
    require_same_size(raster, mask, "apply_mask");

    RasterImage out = raster.clone();
    for (int y = 0; y < out.rows; ++y) {
        cv::Vec4b* row = out[y];
        const uint8_t* m = mask[y];
        for (int x = 0; x < out.cols; ++x) {
            if (m[x] == 255) continue;
            row[x][3] = round_u8(row[x][3] * (m[x] / 255.0));
        }
    }
    return out;
}

RasterImage blend_over(const RasterImage& base, const RasterImage& overlay) {
    require_same_size(base, overlay, "blend_over");

    RasterImage out(base.rows, base.cols);
    for (int y = 0; y < base.rows; ++y) {
        const cv::Vec4b* b = base[y];
        const cv::Vec4b* o = overlay[y];
        cv::Vec4b* r = out[y];
        for (int x = 0; x < base.cols; ++x) {
            const double ao = o[x][3] / 255.0;
            const double ab = b[x][3] / 255.0;
            const double out_a = ao + ab * (1.0 - ao);
            if (out_a <= 0.0) {
                r[x] = cv::Vec4b(0, 0, 0, 0);
                continue;
            }
            for (int c = 0; c < 3; ++c) {
                double v = (o[x][c] * ao + b[x][c] * ab * (1.0 - ao)) / out_a;
                r[x][c] = round_u8(v);
            }
            r[x][3] = round_u8(out_a * 255.0);
        }
    }
    return out;
}

int default_stroke_width(int image_width) {
    return std::max(3, static_cast<int>(std::lround(image_width / 300.0)));
}

AlphaMask stroke_mask(const Polygon& polygon, const BoundingBox& bounds,
                      int width, int height, int stroke_width) {
    AlphaMask mask(height, width, static_cast<uint8_t>(0));
    if (polygon.size() < 2) return mask;

    // 4 fractional bits keep the outline on the same sub-pixel grid as the fill
    constexpr int kShift = 4;
    constexpr double kScale = 1 << kShift;

    std::vector<cv::Point> pts;
    pts.reserve(polygon.size());
    for (const auto& px : geometry::project_polygon(polygon, bounds, width, height)) {
        pts.emplace_back(static_cast<int>(std::lround(px.x * kScale)),
                         static_cast<int>(std::lround(px.y * kScale)));
    }

    // Thick anti-aliased OpenCV lines end in round caps, which gives round joins
    cv::polylines(mask, std::vector<std::vector<cv::Point>>{pts}, true, cv::Scalar(255),
                  std::max(1, stroke_width), cv::LINE_AA, kShift);
    return mask;
}

RasterImage draw_polygon_outline(const RasterImage& raster, const Polygon& polygon,
                                 const BoundingBox& bounds, const Rgba& color,
                                 int stroke_width) {
    if (stroke_width <= 0) stroke_width = default_stroke_width(raster.cols);

    AlphaMask coverage = stroke_mask(polygon, bounds, raster.cols, raster.rows, stroke_width);

    RasterImage layer(raster.rows, raster.cols, cv::Vec4b(color.b, color.g, color.r, color.a));
    layer = apply_mask(layer, coverage);
    return blend_over(raster, layer);
}

} // namespace geo_overlay::image
