#include "geo_overlay/image/rasterizer.hpp"
#include "geo_overlay/core/errors.hpp"
#include "geo_overlay/geometry/projection.hpp"

#include <opencv2/core.hpp>

#include <algorithm>
#include <cmath>

namespace geo_overlay::image {

namespace {

struct Crossing {
    double x;
    int dir;
};

// Adds one sub-sample row of coverage. `cov` holds per-pixel hit counts.
void accumulate_row(const std::vector<PixelPoint>& ring, double yc, int width, int samples,
                    std::vector<Crossing>& crossings, std::vector<int>& cov) {
    crossings.clear();
    const size_t n = ring.size();
    for (size_t i = 0; i < n; ++i) {
        const PixelPoint& a = ring[i];
        const PixelPoint& b = ring[(i + 1) % n];

        int dir = 0;
        if (a.y <= yc && b.y > yc) {
            dir = 1;
        } else if (b.y <= yc && a.y > yc) {
            dir = -1;
        } else {
            continue;
        }
        double x = a.x + (yc - a.y) * (b.x - a.x) / (b.y - a.y);
        crossings.push_back({x, dir});
    }
    if (crossings.size() < 2) return;

    std::sort(crossings.begin(), crossings.end(),
              [](const Crossing& l, const Crossing& r) { return l.x < r.x; });

    const int sub_width = width * samples;
    int winding = 0;
    double span_start = 0.0;
    for (const auto& c : crossings) {
        int before = winding;
        winding += c.dir;
        if (before == 0 && winding != 0) {
            span_start = c.x;
        } else if (before != 0 && winding == 0) {
            // Sub-sample k has its centre at (k + 0.5) / samples
            int k0 = static_cast<int>(std::ceil(span_start * samples - 0.5));
            int k1 = static_cast<int>(std::ceil(c.x * samples - 0.5));
            k0 = std::max(k0, 0);
            k1 = std::min(k1, sub_width);
            for (int k = k0; k < k1; ++k) {
                ++cov[k / samples];
            }
        }
    }
}

} // namespace

AlphaMask rasterize_ring(const std::vector<PixelPoint>& ring, int width, int height,
                         const RasterizeOptions& options) {
    if (width < 1 || height < 1) {
        throw ValidationError("mask size must be positive");
    }

    AlphaMask mask(height, width, static_cast<uint8_t>(0));
    if (ring.size() < 3) return mask;

    const int samples = options.antialias ? std::max(1, options.supersample) : 1;
    const int full = samples * samples;

    double min_y = ring[0].y;
    double max_y = ring[0].y;
    for (const auto& p : ring) {
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }
    int row_begin = std::max(0, static_cast<int>(std::floor(min_y)));
    int row_end = std::min(height, static_cast<int>(std::ceil(max_y)) + 1);

    std::vector<Crossing> crossings;
    crossings.reserve(ring.size());
    std::vector<int> cov(static_cast<size_t>(width));

    for (int py = row_begin; py < row_end; ++py) {
        std::fill(cov.begin(), cov.end(), 0);
        for (int sy = 0; sy < samples; ++sy) {
            double yc = py + (sy + 0.5) / samples;
            accumulate_row(ring, yc, width, samples, crossings, cov);
        }

        uint8_t* row = mask.ptr<uint8_t>(py);
        for (int px = 0; px < width; ++px) {
            if (cov[px] == 0) continue;
            row[px] = static_cast<uint8_t>((cov[px] * 255 + full / 2) / full);
        }
    }

    return mask;
}

AlphaMask rasterize_polygon_mask(const Polygon& polygon, const BoundingBox& bounds,
                                 int width, int height, const RasterizeOptions& options) {
    auto ring = geometry::project_polygon(polygon, bounds, width, height);
    return rasterize_ring(ring, width, height, options);
}

int count_inside(const AlphaMask& mask, uint8_t threshold) {
    int count = 0;
    for (int y = 0; y < mask.rows; ++y) {
        const uint8_t* row = mask.ptr<uint8_t>(y);
        for (int x = 0; x < mask.cols; ++x) {
            if (row[x] >= threshold) ++count;
        }
    }
    return count;
}

} // namespace geo_overlay::image
