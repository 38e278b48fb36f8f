#pragma once

#include <functional>
#include <string>
#include <vector>

namespace playnite {

struct MqttSettings {
    std::string host;
    int port{1883};
    std::string clientId;
    std::string username;
    std::string password;
    int keepAliveSeconds{60};
};

// Broker session as seen by the supervisor. connect() only starts the attempt; the outcome
// arrives through onConnected/onConnectFailed, possibly on a client-owned thread.
class MqttTransport {
public:
    struct Callbacks {
        std::function<void()> onConnected;
        std::function<void(const std::string& cause)> onConnectFailed;
        std::function<void(const std::string& cause)> onConnectionLost;
        std::function<void(const std::string& filter, const std::string& cause)> onSubscribeFailed;
        std::function<void(const std::string& topic, std::vector<unsigned char> payload)> onMessage;
    };

    virtual ~MqttTransport() = default;

    virtual void setCallbacks(Callbacks callbacks) = 0;
    virtual bool connect(std::string& outError) = 0;
    virtual void disconnect() = 0;
    virtual bool subscribe(const std::string& filter, int qos, std::string& outError) = 0;
    virtual bool publish(const std::string& topic, const std::string& payload, int qos, bool retain,
                         std::string& outError) = 0;
};

} // namespace playnite
