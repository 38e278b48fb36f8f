#pragma once

#include "playnite/errors.hpp"
#include <functional>
#include <string>
#include <vector>

namespace playnite {

constexpr int kDefaultMaxImageSize = 14500;
constexpr int kDefaultMinQuality = 60;
constexpr int kDefaultInitialQuality = 95;
constexpr int kDefaultQualityStep = 5;

struct DecodedImage {
    int width{0};
    int height{0};
    std::vector<unsigned char> rgb; // tightly packed, 3 bytes per pixel
};

struct TranscodeOptions {
    int maxSizeBytes{kDefaultMaxImageSize};
    int minQuality{kDefaultMinQuality};
    int initialQuality{kDefaultInitialQuality};
    int qualityStep{kDefaultQualityStep};
    bool allowDownscale{false};
};

struct TranscodeResult {
    bool ok{false};
    ErrorCode error{ErrorCode::None};
    std::string detail;
    std::vector<unsigned char> bytes;
    int quality{0};
    int attempts{0};          // number of encode calls
    bool sizeExceeded{false}; // best-effort result still over maxSizeBytes
    int width{0};
    int height{0};
};

using EncodeFn = std::function<bool(const DecodedImage& image, int quality,
                                    std::vector<unsigned char>& out, std::string& err)>;

// Decode PNG/JPEG/BMP/GIF/TGA bytes to RGB. Alpha is composited onto white.
bool decodeImage(const std::vector<unsigned char>& raw, DecodedImage& out, std::string& err);
// Baseline JPEG encode at quality 1..100.
bool encodeJpeg(const DecodedImage& image, int quality, std::vector<unsigned char>& out, std::string& err);
DecodedImage resizeBilinear(const DecodedImage& src, int width, int height);

// Re-encode `raw` as JPEG within maxSizeBytes by stepping quality down from initialQuality to
// minQuality. Pure and deterministic for a given input, options and encoder.
// Fails only with UnsupportedImage (undecodable input) or when the encoder itself fails.
TranscodeResult compressImage(const std::vector<unsigned char>& raw,
                              const TranscodeOptions& opts,
                              const EncodeFn& encode = encodeJpeg);

} // namespace playnite
