#include "playnite/cover_pipeline.hpp"
#include "playnite/logger.hpp"
#include "playnite/util.hpp"

namespace playnite {

CoverPipeline::CoverPipeline(EntityRegistry& registry, EntityPlatform& platform, TranscodeOptions options,
                             EncodeFn encode)
    : registry_(registry), platform_(platform), options_(options), encode_(std::move(encode)) {
    if (!encode_) encode_ = encodeJpeg;
}

CoverOutcome CoverPipeline::handleCover(const std::string& id, const std::vector<unsigned char>& raw) {
    // A cover is a first sighting like any other message; the entity exists even if decoding fails.
    GameRecord rec;
    rec.id = id;
    if (registry_.upsertMetadata(rec).created) {
        if (auto entity = registry_.get(id)) platform_.announceEntity(*entity);
    }

    const std::string digest = util::contentDigest(raw);
    if (registry_.coverMatches(id, digest)) {
        skipped_++;
        logDebug("Cover for " + id + " unchanged (" + digest + ")", "COVER");
        return CoverOutcome::Unchanged;
    }

    logInfo("Received cover for " + id + ": " + util::formatBytes(raw.size()), "COVER");
    transcodes_++;
    TranscodeResult res = compressImage(raw, options_, encode_);
    if (!res.ok) {
        failed_++;
        const char* what = res.error == ErrorCode::UnsupportedImage ? "unsupported image" : errorCodeLabel(res.error);
        logWarn("Cover for " + id + " rejected (" + what + "): " + res.detail + "; keeping previous cover", "COVER");
        return CoverOutcome::Failed;
    }
    if (res.sizeExceeded) {
        oversized_++;
        logWarn("Cover for " + id + " still oversized: " + res.detail, "COVER");
    }

    registry_.upsertCover(id, digest, res.quality);
    platform_.setCover(id, res.bytes);
    published_++;
    logInfo("Published cover for " + id + ": " + std::to_string(res.bytes.size()) + " bytes at quality " +
            std::to_string(res.quality) + " after " + std::to_string(res.attempts) + " encode(s)", "COVER");
    return CoverOutcome::Published;
}

CoverStats CoverPipeline::stats() const {
    CoverStats s;
    s.transcodes = transcodes_.load();
    s.published = published_.load();
    s.skipped = skipped_.load();
    s.failed = failed_.load();
    s.oversized = oversized_.load();
    return s;
}

} // namespace playnite
