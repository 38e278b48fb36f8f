#include "playnite/config.hpp"
#include "playnite/filesystem.hpp"
#include "playnite/logger.hpp"
#include "playnite/util.hpp"
#include "mini/json.hpp"
#include <cstdlib>
#include <sstream>

namespace playnite {

static bool parseBool(const std::string& val) {
    std::string v = util::toLower(val);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

static bool parseInt(const std::string& val, int& out) {
    if (val.empty()) return false;
    char* end = nullptr;
    long n = std::strtol(val.c_str(), &end, 10);
    if (end == val.c_str() || *end != '\0') return false;
    out = static_cast<int>(n);
    return true;
}

static bool applyEnvKey(const std::string& key, const std::string& val, Config& cfg, std::string& outError) {
    auto setInt = [&](int& field) {
        if (!parseInt(val, field)) {
            outError = "Failed to parse env value for " + key + ": '" + val + "'";
            return false;
        }
        return true;
    };
    if (key == "mqtt_broker") cfg.mqttBroker = val;
    else if (key == "mqtt_port") return setInt(cfg.mqttPort);
    else if (key == "mqtt_username" || key == "username") cfg.mqttUsername = val;
    else if (key == "mqtt_password" || key == "password") cfg.mqttPassword = val;
    else if (key == "mqtt_client_id") cfg.mqttClientId = val;
    else if (key == "mqtt_keepalive_seconds") return setInt(cfg.mqttKeepAliveSeconds);
    else if (key == "reconnect_delay_seconds") return setInt(cfg.reconnectDelaySeconds);
    else if (key == "topic_base") cfg.topicBase = val;
    else if (key == "max_image_size") return setInt(cfg.maxImageSize);
    else if (key == "min_quality") return setInt(cfg.minQuality);
    else if (key == "initial_quality") return setInt(cfg.initialQuality);
    else if (key == "quality_step") return setInt(cfg.qualityStep);
    else if (key == "allow_downscale") cfg.allowDownscale = parseBool(val);
    else if (key == "command_timeout_seconds") return setInt(cfg.commandTimeoutSeconds);
    else if (key == "publish_retries") return setInt(cfg.publishRetries);
    else if (key == "publish_retry_delay_ms") return setInt(cfg.publishRetryDelayMs);
    else if (key == "cover_dir") cfg.coverDir = val;
    else if (key == "log_level") cfg.logLevel = util::toLower(val);
    else if (key == "log_file") cfg.logFile = val;
    else logDebug("Ignoring unknown config key: " + key, "CFG");
    return true;
}

static bool parseEnvContents(const std::string& contents, Config& outCfg, std::string& outError) {
    std::istringstream in(contents);
    std::string line;
    while (std::getline(in, line)) {
        line = util::trim(line);
        if (line.empty()) continue;
        if (line[0] == '#' || line[0] == ';') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;
        std::string key = util::toLower(util::trim(line.substr(0, pos)));
        std::string val = util::trim(line.substr(pos + 1));
        if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') || (val.front() == '\'' && val.back() == '\''))) {
            val = val.substr(1, val.size() - 2);
        }
        if (!applyEnvKey(key, val, outCfg, outError)) return false;
    }
    return true;
}

// Absent or non-numeric keys keep the current value; a number that is not an int is an error.
static bool readJsonInt(const mini::Object& obj, const char* key, int& out, std::string& outError) {
    auto it = obj.find(key);
    if (it == obj.end() || it->second.type != mini::Value::Type::Number) return true;
    if (!mini::get_int(obj, key, out)) {
        outError = std::string("Invalid config JSON value for ") + key + ": expected an integer in int range";
        return false;
    }
    return true;
}

static bool parseJsonContents(const std::string& content, Config& outCfg, std::string& outError) {
    mini::Object obj;
    if (!mini::parse(content, obj)) {
        outError = "Invalid config JSON.";
        return false;
    }
    mini::get_string(obj, "mqtt_broker", outCfg.mqttBroker);
    if (!readJsonInt(obj, "mqtt_port", outCfg.mqttPort, outError)) return false;
    mini::get_string(obj, "mqtt_username", outCfg.mqttUsername);
    mini::get_string(obj, "mqtt_password", outCfg.mqttPassword);
    mini::get_string(obj, "mqtt_client_id", outCfg.mqttClientId);
    if (!readJsonInt(obj, "mqtt_keepalive_seconds", outCfg.mqttKeepAliveSeconds, outError)) return false;
    if (!readJsonInt(obj, "reconnect_delay_seconds", outCfg.reconnectDelaySeconds, outError)) return false;
    mini::get_string(obj, "topic_base", outCfg.topicBase);
    if (!readJsonInt(obj, "max_image_size", outCfg.maxImageSize, outError)) return false;
    if (!readJsonInt(obj, "min_quality", outCfg.minQuality, outError)) return false;
    if (!readJsonInt(obj, "initial_quality", outCfg.initialQuality, outError)) return false;
    if (!readJsonInt(obj, "quality_step", outCfg.qualityStep, outError)) return false;
    mini::get_bool(obj, "allow_downscale", outCfg.allowDownscale);
    if (!readJsonInt(obj, "command_timeout_seconds", outCfg.commandTimeoutSeconds, outError)) return false;
    if (!readJsonInt(obj, "publish_retries", outCfg.publishRetries, outError)) return false;
    if (!readJsonInt(obj, "publish_retry_delay_ms", outCfg.publishRetryDelayMs, outError)) return false;
    mini::get_string(obj, "cover_dir", outCfg.coverDir);
    mini::get_string(obj, "log_file", outCfg.logFile);
    {
        std::string lvl;
        if (mini::get_string(obj, "log_level", lvl) && !lvl.empty()) outCfg.logLevel = util::toLower(lvl);
    }
    return true;
}

static bool checkRange(const char* key, int value, int lo, int hi, std::string& outError) {
    if (value < lo || value > hi) {
        outError = std::string(key) + " out of range [" + std::to_string(lo) + ", " + std::to_string(hi) +
                   "]: " + std::to_string(value);
        return false;
    }
    return true;
}

bool validateConfig(const Config& cfg, std::string& outError) {
    if (cfg.mqttBroker.empty()) {
        outError = "Config missing mqtt_broker.";
        return false;
    }
    if (cfg.topicBase.empty()) {
        outError = "Config missing topic_base.";
        return false;
    }
    if (cfg.topicBase.find_first_of("+#") != std::string::npos) {
        outError = "topic_base must not contain MQTT wildcards: " + cfg.topicBase;
        return false;
    }
    if (cfg.topicBase.back() == '/') {
        outError = "topic_base must not contain a trailing '/': " + cfg.topicBase;
        return false;
    }
    if (!checkRange("mqtt_port", cfg.mqttPort, 1, 65535, outError)) return false;
    if (!checkRange("mqtt_keepalive_seconds", cfg.mqttKeepAliveSeconds, 1, 3600, outError)) return false;
    if (!checkRange("reconnect_delay_seconds", cfg.reconnectDelaySeconds, 1, 3600, outError)) return false;
    if (!checkRange("max_image_size", cfg.maxImageSize, 1000, 1000000, outError)) return false;
    if (!checkRange("min_quality", cfg.minQuality, 1, 100, outError)) return false;
    if (!checkRange("initial_quality", cfg.initialQuality, 1, 100, outError)) return false;
    if (!checkRange("quality_step", cfg.qualityStep, 1, 50, outError)) return false;
    if (cfg.minQuality > cfg.initialQuality) {
        outError = "min_quality out of range: must not exceed initial_quality (" +
                   std::to_string(cfg.minQuality) + " > " + std::to_string(cfg.initialQuality) + ")";
        return false;
    }
    if (!checkRange("command_timeout_seconds", cfg.commandTimeoutSeconds, 1, 3600, outError)) return false;
    if (!checkRange("publish_retries", cfg.publishRetries, 1, 10, outError)) return false;
    if (!checkRange("publish_retry_delay_ms", cfg.publishRetryDelayMs, 0, 10000, outError)) return false;
    return true;
}

bool loadConfig(const std::string& configDir, Config& outCfg, std::string& outError) {
    const std::string dir = configDir.empty() ? std::string(".") : configDir;
    const std::string envPath = dir + "/.env";
    const std::string jsonPath = dir + "/config.json";

    std::string body;
    bool envFound = readFile(envPath, body);
    if (envFound) {
        if (!parseEnvContents(body, outCfg, outError)) return false;
        logDebug("Loaded " + envPath, "CFG");
    }
    bool jsonFound = readFile(jsonPath, body);
    if (jsonFound) {
        if (!parseJsonContents(body, outCfg, outError)) return false;
        logDebug("Loaded " + jsonPath, "CFG");
    }
    if (!envFound && !jsonFound) {
        outError = "Missing config: place .env or config.json in " + dir;
        return false;
    }
    return validateConfig(outCfg, outError);
}

#ifdef UNIT_TEST
bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError) {
    if (!parseEnvContents(contents, outCfg, outError)) return false;
    return validateConfig(outCfg, outError);
}

bool parseJsonString(const std::string& contents, Config& outCfg, std::string& outError) {
    if (!parseJsonContents(contents, outCfg, outError)) return false;
    return validateConfig(outCfg, outError);
}
#endif

} // namespace playnite
