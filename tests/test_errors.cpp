#include "catch.hpp"
#include "playnite/errors.hpp"

TEST_CASE("classifyError maps missing config file") {
    playnite::ErrorInfo info =
        playnite::classifyError("Missing config: place .env or config.json in /etc/bridge", playnite::ErrorCategory::Config);
    REQUIRE(info.category == playnite::ErrorCategory::Config);
    REQUIRE(info.code == playnite::ErrorCode::ConfigMissing);
    REQUIRE_FALSE(info.retryable);
    REQUIRE_FALSE(info.userMessage.empty());
}

TEST_CASE("classifyError maps missing required config") {
    playnite::ErrorInfo info = playnite::classifyError("Config missing topic_base.", playnite::ErrorCategory::Config);
    REQUIRE(info.category == playnite::ErrorCategory::Config);
    REQUIRE(info.code == playnite::ErrorCode::MissingRequiredField);
    REQUIRE_FALSE(info.retryable);
}

TEST_CASE("classifyError maps range failures to ConfigInvalid") {
    playnite::ErrorInfo info = playnite::classifyError("min_quality out of range [1, 100]: 0");
    REQUIRE(info.code == playnite::ErrorCode::ConfigInvalid);
    info = playnite::classifyError("Failed to parse env value for mqtt_port: 'abc'");
    REQUIRE(info.code == playnite::ErrorCode::ConfigInvalid);
}

TEST_CASE("classifyError maps broker failures") {
    playnite::ErrorInfo auth = playnite::classifyError("Not authorized", playnite::ErrorCategory::Connection);
    REQUIRE(auth.code == playnite::ErrorCode::AuthFailure);
    REQUIRE_FALSE(auth.retryable);

    playnite::ErrorInfo lost = playnite::classifyError("connection lost: socket closed");
    REQUIRE(lost.code == playnite::ErrorCode::ConnectionLost);
    REQUIRE(lost.retryable);

    playnite::ErrorInfo refused = playnite::classifyError("TCP connect refused", playnite::ErrorCategory::Connection);
    REQUIRE(refused.category == playnite::ErrorCategory::Connection);
    REQUIRE(refused.code == playnite::ErrorCode::ConnectFailure);
    REQUIRE(refused.retryable);

    playnite::ErrorInfo pub = playnite::classifyError("Cannot publish to x/request/library: not connected");
    REQUIRE(pub.code == playnite::ErrorCode::PublishFailure);
}

TEST_CASE("classifyError maps image and payload failures") {
    REQUIRE(playnite::classifyError("unsupported image: decode failed").code == playnite::ErrorCode::UnsupportedImage);
    REQUIRE(playnite::classifyError("library snapshot is not valid JSON").code == playnite::ErrorCode::PayloadError);
}

TEST_CASE("classifyError falls back to the hint category") {
    playnite::ErrorInfo info = playnite::classifyError("something odd", playnite::ErrorCategory::Image);
    REQUIRE(info.category == playnite::ErrorCategory::Image);
    REQUIRE(info.code == playnite::ErrorCode::Unknown);
    REQUIRE(info.userMessage == "Cover image error.");

    playnite::ErrorInfo bare = playnite::classifyError("???");
    REQUIRE(bare.category == playnite::ErrorCategory::Internal);
}
