#include <atomic>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "playnite/bridge.hpp"
#include "playnite/config.hpp"
#include "playnite/errors.hpp"
#include "playnite/file_platform.hpp"
#include "playnite/logger.hpp"
#include "playnite/paho_transport.hpp"
#include "playnite/util.hpp"
#include "playnite/version.hpp"

using playnite::Bridge;
using playnite::CommandKind;
using playnite::Config;

static std::atomic<bool> gStopRequested{false};

static void onSignal(int) {
    gStopRequested.store(true);
}

static void printUsage() {
    std::printf("usage: %s [config-dir]\n", playnite::appName());
    std::printf("  reads <config-dir>/.env and <config-dir>/config.json (default: current directory)\n");
    std::printf("commands on stdin: start|stop|install|uninstall <id>, refresh, list, quit\n");
}

// One operator command per line. Returns false when the line should end input handling.
static bool handleInputLine(Bridge& bridge, const std::string& line) {
    std::istringstream in(line);
    std::string verb, id;
    in >> verb;
    std::getline(in, id);
    verb = playnite::util::toLower(verb);
    id = playnite::util::trim(id);
    if (verb.empty()) return true;

    if (verb == "quit" || verb == "exit") {
        bridge.postShutdown();
        return false;
    }
    if (verb == "refresh") {
        bridge.postLibraryRefresh();
        return true;
    }
    if (verb == "list") {
        bridge.postList();
        return true;
    }

    CommandKind kind;
    if (verb == "start") kind = CommandKind::Start;
    else if (verb == "stop") kind = CommandKind::Stop;
    else if (verb == "install") kind = CommandKind::Install;
    else if (verb == "uninstall") kind = CommandKind::Uninstall;
    else {
        playnite::logWarn("Unknown command: " + verb + " (try start|stop|install|uninstall <id>, refresh, list, quit)",
                          "APP");
        return true;
    }
    if (id.empty()) {
        playnite::logWarn(verb + " needs a game id", "APP");
        return true;
    }
    bridge.postUserCommand(id, kind);
    return true;
}

int main(int argc, char** argv) {
    setvbuf(stdout, nullptr, _IONBF, 0);
    setvbuf(stderr, nullptr, _IONBF, 0);

    std::string configDir = ".";
    if (argc > 1) {
        const std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        }
        if (arg == "--version") {
            std::printf("%s %s\n", playnite::appName(), playnite::appVersion());
            return 0;
        }
        configDir = arg;
    }

    Config cfg;
    std::string cfgError;
    if (!playnite::loadConfig(configDir, cfg, cfgError)) {
        playnite::ErrorInfo info = playnite::classifyError(cfgError, playnite::ErrorCategory::Config);
        playnite::logError(std::string(playnite::errorCodeLabel(info.code)) + ": " + cfgError, "CFG");
        playnite::logError(info.userMessage, "CFG");
        return 1;
    }

    playnite::setLogLevelFromString(cfg.logLevel);
    if (!cfg.logFile.empty() && !playnite::initLogFile(cfg.logFile)) {
        playnite::logWarn("Could not open log file " + cfg.logFile + "; logging to stdout only", "APP");
    }
    playnite::logInfo(std::string("Startup: ") + playnite::appName() + " " + playnite::appVersion(), "APP");
    playnite::logInfo("Broker " + cfg.mqttBroker + ":" + std::to_string(cfg.mqttPort) + ", topic base " +
                          cfg.topicBase + ", cover budget " + playnite::util::formatBytes(cfg.maxImageSize),
                      "CFG");

    playnite::MqttSettings mqtt;
    mqtt.host = cfg.mqttBroker;
    mqtt.port = cfg.mqttPort;
    mqtt.clientId = cfg.mqttClientId;
    mqtt.username = cfg.mqttUsername;
    mqtt.password = cfg.mqttPassword;
    mqtt.keepAliveSeconds = cfg.mqttKeepAliveSeconds;

    playnite::FilePlatform platform(cfg.coverDir, playnite::util::humanizeTopicBase(cfg.topicBase));
    auto bridge = std::make_shared<Bridge>(cfg, std::make_unique<playnite::PahoTransport>(mqtt), platform);

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    bridge->start();

    // std::getline cannot be interrupted, so the reader is detached and only ever posts events.
    std::thread input([bridge]() {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!handleInputLine(*bridge, line)) break;
        }
    });
    input.detach();

    bridge->run(gStopRequested);
    playnite::logInfo("Exit.", "APP");
    playnite::closeLogFile();
    return 0;
}
