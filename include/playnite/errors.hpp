#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace playnite {

enum class ErrorCategory {
    None,
    Config,
    Connection,
    Parse,
    Payload,
    Image,
    Command,
    Internal
};

enum class ErrorCode {
    None,
    Unknown,
    ConfigMissing,
    ConfigInvalid,
    MissingRequiredField,
    ConnectFailure,
    ConnectionLost,
    SubscribeFailure,
    PublishFailure,
    AuthFailure,
    ParseError,
    PayloadError,
    UnsupportedImage,
    SizeExceeded,
    CommandTimeout,
    UnknownEntity
};

struct ErrorInfo {
    ErrorCategory category{ErrorCategory::None};
    ErrorCode code{ErrorCode::None};
    bool retryable{false};
    std::string userMessage;
    std::string detail;
};

inline const char* errorCategoryLabel(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Config: return "Config";
        case ErrorCategory::Connection: return "Connection";
        case ErrorCategory::Parse: return "Parse";
        case ErrorCategory::Payload: return "Payload";
        case ErrorCategory::Image: return "Image";
        case ErrorCategory::Command: return "Command";
        case ErrorCategory::Internal: return "Internal";
        default: return "Unknown";
    }
}

inline const char* errorCodeLabel(ErrorCode c) {
    switch (c) {
        case ErrorCode::None: return "None";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::ConfigMissing: return "ConfigMissing";
        case ErrorCode::ConfigInvalid: return "ConfigInvalid";
        case ErrorCode::MissingRequiredField: return "MissingRequiredField";
        case ErrorCode::ConnectFailure: return "ConnectFailure";
        case ErrorCode::ConnectionLost: return "ConnectionLost";
        case ErrorCode::SubscribeFailure: return "SubscribeFailure";
        case ErrorCode::PublishFailure: return "PublishFailure";
        case ErrorCode::AuthFailure: return "AuthFailure";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::PayloadError: return "PayloadError";
        case ErrorCode::UnsupportedImage: return "UnsupportedImage";
        case ErrorCode::SizeExceeded: return "SizeExceeded";
        case ErrorCode::CommandTimeout: return "CommandTimeout";
        case ErrorCode::UnknownEntity: return "UnknownEntity";
        default: return "Unknown";
    }
}

inline std::string toLowerCopy(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

// Map a free-form error string (config loader, MQTT client failure text) to a
// category/code with a user-facing message and a retry hint.
inline ErrorInfo classifyError(const std::string& detail, ErrorCategory hint = ErrorCategory::None) {
    ErrorInfo out;
    out.detail = detail;
    out.category = hint;
    out.code = ErrorCode::Unknown;

    const std::string l = toLowerCopy(detail);

    auto set = [&](ErrorCategory cat, ErrorCode code, const char* user, bool retryable) {
        out.category = cat;
        out.code = code;
        out.userMessage = user;
        out.retryable = retryable;
    };

    if (l.find("missing config") != std::string::npos) {
        set(ErrorCategory::Config, ErrorCode::ConfigMissing, "Configuration file is missing.", false);
    } else if (l.find("invalid config json") != std::string::npos || l.find("failed to parse env") != std::string::npos) {
        set(ErrorCategory::Config, ErrorCode::ConfigInvalid, "Configuration format is invalid.", false);
    } else if (l.find("missing mqtt_broker") != std::string::npos || l.find("missing topic_base") != std::string::npos) {
        set(ErrorCategory::Config, ErrorCode::MissingRequiredField, "Required setting is missing.", false);
    } else if (l.find("out of range") != std::string::npos || l.find("must not contain") != std::string::npos) {
        set(ErrorCategory::Config, ErrorCode::ConfigInvalid, "A setting has an invalid value.", false);
    } else if (l.find("not authorized") != std::string::npos || l.find("bad user name or password") != std::string::npos ||
               l.find("bad username or password") != std::string::npos) {
        set(ErrorCategory::Connection, ErrorCode::AuthFailure, "Broker rejected the credentials.", false);
    } else if (l.find("connection lost") != std::string::npos || l.find("connection reset") != std::string::npos) {
        set(ErrorCategory::Connection, ErrorCode::ConnectionLost, "Connection to the broker was lost.", true);
    } else if (l.find("subscribe") != std::string::npos) {
        set(ErrorCategory::Connection, ErrorCode::SubscribeFailure, "Subscribing to the topic tree failed.", true);
    } else if (l.find("publish") != std::string::npos || l.find("send") != std::string::npos) {
        set(ErrorCategory::Command, ErrorCode::PublishFailure, "Sending a request to the broker failed.", true);
    } else if (l.find("connect") != std::string::npos || l.find("refused") != std::string::npos ||
               l.find("tcp") != std::string::npos || l.find("timed out") != std::string::npos ||
               l.find("timeout") != std::string::npos || l.find("resolve") != std::string::npos) {
        set(ErrorCategory::Connection, ErrorCode::ConnectFailure, "Failed to connect to the broker.", true);
    } else if (l.find("unsupported image") != std::string::npos || l.find("decode failed") != std::string::npos) {
        set(ErrorCategory::Image, ErrorCode::UnsupportedImage, "Cover image could not be decoded.", false);
    } else if (l.find("json") != std::string::npos || l.find("malformed") != std::string::npos ||
               l.find("parse") != std::string::npos) {
        set(ErrorCategory::Payload, ErrorCode::PayloadError, "Received malformed data.", false);
    }

    if (out.category == ErrorCategory::None) out.category = ErrorCategory::Internal;
    if (out.userMessage.empty()) {
        switch (out.category) {
            case ErrorCategory::Config: out.userMessage = "Configuration error."; break;
            case ErrorCategory::Connection: out.userMessage = "Broker connection error."; out.retryable = true; break;
            case ErrorCategory::Parse: out.userMessage = "Unrecognized topic."; break;
            case ErrorCategory::Payload: out.userMessage = "Invalid message payload."; break;
            case ErrorCategory::Image: out.userMessage = "Cover image error."; break;
            case ErrorCategory::Command: out.userMessage = "Command could not be sent."; out.retryable = true; break;
            case ErrorCategory::Internal: out.userMessage = "Internal error."; break;
            default: out.userMessage = "Unknown error."; break;
        }
    }

    return out;
}

} // namespace playnite
