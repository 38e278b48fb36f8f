#include "playnite/image_transcoder.hpp"
#include "playnite/logger.hpp"
#include "playnite/raii.hpp"
#include <stb_image.h>
#include <stb_image_write.h>
#include <algorithm>
#include <cstdint>

namespace playnite {

namespace {

constexpr int kMaxDimension = 16384;
const double kDownscaleFactors[] = {0.75, 0.5, 0.25};

void appendToVector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<unsigned char>*>(context);
    const auto* bytes = static_cast<const unsigned char*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

int clampQuality(int q) { return std::min(100, std::max(1, q)); }

bool fits(const std::vector<unsigned char>& bytes, int maxSizeBytes) {
    return bytes.size() <= static_cast<size_t>(std::max(0, maxSizeBytes));
}

} // namespace

bool decodeImage(const std::vector<unsigned char>& raw, DecodedImage& out, std::string& err) {
    if (raw.empty()) {
        err = "unsupported image: empty payload";
        return false;
    }
    int w = 0, h = 0, channels = 0;
    unsigned char* pixels = stbi_load_from_memory(raw.data(), static_cast<int>(raw.size()),
                                                  &w, &h, &channels, STBI_rgb_alpha);
    if (!pixels) {
        const char* reason = stbi_failure_reason();
        err = std::string("unsupported image: decode failed") + (reason ? std::string(" (") + reason + ")" : "");
        return false;
    }
    auto freePixels = makeScopeGuard([&] { stbi_image_free(pixels); });
    if (w <= 0 || h <= 0 || w > kMaxDimension || h > kMaxDimension) {
        err = "unsupported image: dimensions " + std::to_string(w) + "x" + std::to_string(h);
        return false;
    }

    out.width = w;
    out.height = h;
    out.rgb.resize(static_cast<size_t>(w) * static_cast<size_t>(h) * 3);
    const size_t count = static_cast<size_t>(w) * static_cast<size_t>(h);
    for (size_t i = 0; i < count; ++i) {
        const unsigned char* p = pixels + i * 4;
        const unsigned a = p[3];
        for (int c = 0; c < 3; ++c) {
            // over white: c*a + 255*(1-a)
            out.rgb[i * 3 + c] = static_cast<unsigned char>((p[c] * a + 255u * (255u - a) + 127u) / 255u);
        }
    }
    return true;
}

bool encodeJpeg(const DecodedImage& image, int quality, std::vector<unsigned char>& out, std::string& err) {
    out.clear();
    if (image.width <= 0 || image.height <= 0 ||
        image.rgb.size() < static_cast<size_t>(image.width) * static_cast<size_t>(image.height) * 3) {
        err = "encode failed: empty image";
        return false;
    }
    if (!stbi_write_jpg_to_func(appendToVector, &out, image.width, image.height, 3,
                                image.rgb.data(), clampQuality(quality))) {
        err = "encode failed at quality " + std::to_string(quality);
        return false;
    }
    return true;
}

DecodedImage resizeBilinear(const DecodedImage& src, int width, int height) {
    DecodedImage dst;
    dst.width = std::max(1, width);
    dst.height = std::max(1, height);
    dst.rgb.resize(static_cast<size_t>(dst.width) * static_cast<size_t>(dst.height) * 3);
    if (src.width <= 0 || src.height <= 0) return dst;

    const double sx = static_cast<double>(src.width) / dst.width;
    const double sy = static_cast<double>(src.height) / dst.height;
    for (int y = 0; y < dst.height; ++y) {
        double fy = (y + 0.5) * sy - 0.5;
        fy = std::max(0.0, std::min(fy, static_cast<double>(src.height - 1)));
        const int y0 = static_cast<int>(fy);
        const int y1 = std::min(y0 + 1, src.height - 1);
        const double wy = fy - y0;
        for (int x = 0; x < dst.width; ++x) {
            double fx = (x + 0.5) * sx - 0.5;
            fx = std::max(0.0, std::min(fx, static_cast<double>(src.width - 1)));
            const int x0 = static_cast<int>(fx);
            const int x1 = std::min(x0 + 1, src.width - 1);
            const double wx = fx - x0;
            for (int c = 0; c < 3; ++c) {
                auto at = [&](int px, int py) {
                    return static_cast<double>(src.rgb[(static_cast<size_t>(py) * src.width + px) * 3 + c]);
                };
                const double top = at(x0, y0) * (1.0 - wx) + at(x1, y0) * wx;
                const double bottom = at(x0, y1) * (1.0 - wx) + at(x1, y1) * wx;
                const double v = top * (1.0 - wy) + bottom * wy;
                dst.rgb[(static_cast<size_t>(y) * dst.width + x) * 3 + c] =
                    static_cast<unsigned char>(std::min(255.0, std::max(0.0, v + 0.5)));
            }
        }
    }
    return dst;
}

TranscodeResult compressImage(const std::vector<unsigned char>& raw,
                              const TranscodeOptions& opts,
                              const EncodeFn& encode) {
    TranscodeResult res;
    DecodedImage image;
    std::string err;
    if (!decodeImage(raw, image, err)) {
        res.error = ErrorCode::UnsupportedImage;
        res.detail = err;
        return res;
    }
    res.width = image.width;
    res.height = image.height;

    const int initial = clampQuality(opts.initialQuality);
    const int floorQuality = std::min(clampQuality(opts.minQuality), initial);
    const int step = std::max(1, opts.qualityStep);

    int quality = initial;
    while (true) {
        std::vector<unsigned char> encoded;
        res.attempts++;
        if (!encode(image, quality, encoded, err)) {
            res.error = ErrorCode::Unknown;
            res.detail = err;
            res.bytes.clear();
            return res;
        }
        res.bytes = std::move(encoded);
        res.quality = quality;
        if (fits(res.bytes, opts.maxSizeBytes)) {
            logDebug("Encoded " + std::to_string(res.bytes.size()) + " bytes at quality " +
                     std::to_string(quality), "IMG");
            res.ok = true;
            return res;
        }
        logDebug("Size " + std::to_string(res.bytes.size()) + " bytes too large at quality " +
                 std::to_string(quality), "IMG");
        if (quality == floorQuality) break;
        quality = std::max(quality - step, floorQuality);
    }

    if (opts.allowDownscale) {
        for (double factor : kDownscaleFactors) {
            const int w = std::max(1, static_cast<int>(image.width * factor));
            const int h = std::max(1, static_cast<int>(image.height * factor));
            DecodedImage scaled = resizeBilinear(image, w, h);
            std::vector<unsigned char> encoded;
            res.attempts++;
            if (!encode(scaled, floorQuality, encoded, err)) {
                res.error = ErrorCode::Unknown;
                res.detail = err;
                res.bytes.clear();
                return res;
            }
            res.bytes = std::move(encoded);
            res.width = w;
            res.height = h;
            logDebug("Resized to " + std::to_string(w) + "x" + std::to_string(h) + ": " +
                     std::to_string(res.bytes.size()) + " bytes", "IMG");
            if (fits(res.bytes, opts.maxSizeBytes)) {
                res.ok = true;
                return res;
            }
        }
    }

    res.ok = true;
    res.sizeExceeded = true;
    res.error = ErrorCode::SizeExceeded;
    res.detail = std::to_string(res.bytes.size()) + " bytes at floor quality " + std::to_string(floorQuality) +
                 " exceeds " + std::to_string(opts.maxSizeBytes);
    return res;
}

} // namespace playnite
