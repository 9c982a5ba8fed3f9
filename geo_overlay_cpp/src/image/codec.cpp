#include "geo_overlay/image/codec.hpp"
#include "geo_overlay/core/errors.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace geo_overlay::image {

RasterImage decode_image(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw CompositeError("image buffer is empty");
    }

    cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                const_cast<uint8_t*>(bytes.data()));
    cv::Mat decoded = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    if (decoded.empty()) {
        throw CompositeError("cannot decode image (" + std::to_string(bytes.size()) + " bytes)");
    }

    if (decoded.depth() == CV_16U) {
        decoded.convertTo(decoded, CV_8U, 1.0 / 257.0);
    } else if (decoded.depth() != CV_8U) {
        decoded.convertTo(decoded, CV_8U);
    }

    cv::Mat bgra;
    switch (decoded.channels()) {
        case 1: cv::cvtColor(decoded, bgra, cv::COLOR_GRAY2BGRA); break;
        case 3: cv::cvtColor(decoded, bgra, cv::COLOR_BGR2BGRA); break;
        case 4: bgra = decoded; break;
        default:
            throw CompositeError("unsupported channel count: " + std::to_string(decoded.channels()));
    }
    return RasterImage(bgra);
}

std::vector<uint8_t> encode_png(const RasterImage& image) {
    if (image.empty()) {
        throw CompositeError("cannot encode an empty image");
    }
    std::vector<uint8_t> out;
    if (!cv::imencode(".png", image, out)) {
        throw CompositeError("PNG encoding failed");
    }
    return out;
}

RasterImage resize_fill(const RasterImage& image, int width, int height) {
    if (image.cols == width && image.rows == height) {
        return image.clone();
    }
    cv::Mat out;
    cv::resize(image, out, cv::Size(width, height), 0.0, 0.0, cv::INTER_LINEAR);
    return RasterImage(out);
}

static uint32_t read_be32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) | (static_cast<uint32_t>(p[1]) << 16) |
           (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

std::optional<std::pair<int, int>> image_dimensions(const std::vector<uint8_t>& bytes) {
    static const uint8_t kPngSignature[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

    // Signature, IHDR length + type, then width and height
    if (bytes.size() >= 24 && std::equal(kPngSignature, kPngSignature + 8, bytes.begin()) &&
        bytes[12] == 'I' && bytes[13] == 'H' && bytes[14] == 'D' && bytes[15] == 'R') {
        int w = static_cast<int>(read_be32(&bytes[16]));
        int h = static_cast<int>(read_be32(&bytes[20]));
        return std::make_pair(w, h);
    }

    if (bytes.empty()) return std::nullopt;
    cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<uint8_t*>(bytes.data()));
    cv::Mat decoded = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    if (decoded.empty()) return std::nullopt;
    return std::make_pair(decoded.cols, decoded.rows);
}

} // namespace geo_overlay::image
