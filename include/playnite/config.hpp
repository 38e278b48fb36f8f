#pragma once

#include <string>

namespace playnite {

struct Config {
    // Broker host name or IP (required)
    std::string mqttBroker;
    int mqttPort{1883};
    // Optional broker credentials
    std::string mqttUsername;
    std::string mqttPassword;
    std::string mqttClientId{"playnite-mqtt-bridge"};
    int mqttKeepAliveSeconds{60};
    // Delay between reconnect attempts after a failed connect or a lost session
    int reconnectDelaySeconds{5};
    // Topic prefix of one Playnite Web instance, e.g. playnite/playniteweb_<pc-name> (required)
    std::string topicBase;

    // Cover transcoding budget
    int maxImageSize{14500};
    int minQuality{60};
    int initialQuality{95};
    int qualityStep{5};
    bool allowDownscale{false};

    // Pending start/stop confirmation window
    int commandTimeoutSeconds{30};
    int publishRetries{3};
    int publishRetryDelayMs{500};

    // Where the file-backed platform writes <id>.jpg covers
    std::string coverDir{"covers"};
    // Logging verbosity (debug, info, warn, error)
    std::string logLevel{"info"};
    // Optional log file (stdout only when empty)
    std::string logFile;
};

// Load <dir>/.env then <dir>/config.json (JSON keys override) and validate.
bool loadConfig(const std::string& configDir, Config& outCfg, std::string& outError);

// Range/required-field checks shared by all loaders.
bool validateConfig(const Config& cfg, std::string& outError);

#ifdef UNIT_TEST
// Test helpers: parse in-memory content, then validate.
bool parseEnvString(const std::string& contents, Config& outCfg, std::string& outError);
bool parseJsonString(const std::string& contents, Config& outCfg, std::string& outError);
#endif

} // namespace playnite
