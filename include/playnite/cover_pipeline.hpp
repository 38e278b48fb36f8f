#pragma once

#include "playnite/image_transcoder.hpp"
#include "playnite/platform.hpp"
#include "playnite/registry.hpp"
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace playnite {

enum class CoverOutcome { Published, Unchanged, Failed };

struct CoverStats {
    uint64_t transcodes{0};
    uint64_t published{0};
    uint64_t skipped{0};
    uint64_t failed{0};
    uint64_t oversized{0};
};

// Takes raw cover payloads from the router, transcodes them to fit the platform's size budget
// and forwards the result. Identical payloads for the same game are published once.
class CoverPipeline {
public:
    CoverPipeline(EntityRegistry& registry, EntityPlatform& platform, TranscodeOptions options,
                  EncodeFn encode = encodeJpeg);

    CoverOutcome handleCover(const std::string& id, const std::vector<unsigned char>& raw);

    const TranscodeOptions& options() const { return options_; }
    CoverStats stats() const;

private:
    EntityRegistry& registry_;
    EntityPlatform& platform_;
    TranscodeOptions options_;
    EncodeFn encode_;

    std::atomic<uint64_t> transcodes_{0};
    std::atomic<uint64_t> published_{0};
    std::atomic<uint64_t> skipped_{0};
    std::atomic<uint64_t> failed_{0};
    std::atomic<uint64_t> oversized_{0};
};

} // namespace playnite
