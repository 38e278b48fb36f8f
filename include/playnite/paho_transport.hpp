#pragma once

#include "playnite/mqtt_transport.hpp"
#include <MQTTAsync.h>
#include <mutex>
#include <string>

namespace playnite {

// MqttTransport backed by the Eclipse Paho asynchronous C client. Automatic reconnect is off;
// the supervisor decides when to retry.
class PahoTransport : public MqttTransport {
public:
    explicit PahoTransport(MqttSettings settings);
    ~PahoTransport() override;

    PahoTransport(const PahoTransport&) = delete;
    PahoTransport& operator=(const PahoTransport&) = delete;

    void setCallbacks(Callbacks callbacks) override;
    bool connect(std::string& outError) override;
    void disconnect() override;
    bool subscribe(const std::string& filter, int qos, std::string& outError) override;
    bool publish(const std::string& topic, const std::string& payload, int qos, bool retain,
                 std::string& outError) override;

private:
    static void onConnectSuccess(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void onConnectionLost(void* context, char* cause);
    static int onMessageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    static void onSubscribeFailure(void* context, MQTTAsync_failureData* response);
    static void onSubscribeSuccess(void* context, MQTTAsync_successData* response);

    void destroyClient();
    std::string serverUri() const;

    MqttSettings settings_;
    Callbacks callbacks_;
    std::mutex mutex_;
    MQTTAsync client_{nullptr};
    // Only one wildcard filter is ever outstanding; written before MQTTAsync_subscribe.
    std::string filter_;
};

} // namespace playnite
