#include "playnite/paho_transport.hpp"
#include "playnite/logger.hpp"

namespace playnite {

namespace {

std::string failureMessage(MQTTAsync_failureData* response, const char* fallback) {
    if (response && response->message) return response->message;
    if (response) return std::string(fallback) + " (rc " + std::to_string(response->code) + ")";
    return fallback;
}

} // namespace

PahoTransport::PahoTransport(MqttSettings settings) : settings_(std::move(settings)) {}

PahoTransport::~PahoTransport() {
    disconnect();
}

void PahoTransport::setCallbacks(Callbacks callbacks) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_ = std::move(callbacks);
}

std::string PahoTransport::serverUri() const {
    return "tcp://" + settings_.host + ":" + std::to_string(settings_.port);
}

void PahoTransport::destroyClient() {
    if (!client_) return;
    if (MQTTAsync_isConnected(client_)) {
        MQTTAsync_disconnectOptions opts = MQTTAsync_disconnectOptions_initializer;
        opts.timeout = 1000;
        MQTTAsync_disconnect(client_, &opts);
    }
    MQTTAsync_destroy(&client_);
    client_ = nullptr;
}

bool PahoTransport::connect(std::string& outError) {
    std::lock_guard<std::mutex> lock(mutex_);
    destroyClient();

    const std::string uri = serverUri();
    int rc = MQTTAsync_create(&client_, uri.c_str(), settings_.clientId.c_str(), MQTTCLIENT_PERSISTENCE_NONE,
                              nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        client_ = nullptr;
        outError = "Failed to create MQTT client for " + uri + " (rc " + std::to_string(rc) + ")";
        return false;
    }

    rc = MQTTAsync_setCallbacks(client_, this, onConnectionLost, onMessageArrived, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        outError = "Failed to set MQTT callbacks (rc " + std::to_string(rc) + ")";
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
        return false;
    }

    MQTTAsync_connectOptions opts = MQTTAsync_connectOptions_initializer;
    opts.keepAliveInterval = settings_.keepAliveSeconds;
    opts.cleansession = 1;
    opts.automaticReconnect = 0;
    opts.onSuccess = onConnectSuccess;
    opts.onFailure = onConnectFailure;
    opts.context = this;
    if (!settings_.username.empty()) {
        opts.username = settings_.username.c_str();
        opts.password = settings_.password.c_str();
    }

    logInfo("Connecting to " + uri + " as " + settings_.clientId, "MQTT");
    rc = MQTTAsync_connect(client_, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        outError = "Connect to " + uri + " refused by client (rc " + std::to_string(rc) + ")";
        MQTTAsync_destroy(&client_);
        client_ = nullptr;
        return false;
    }
    return true;
}

void PahoTransport::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    destroyClient();
}

bool PahoTransport::subscribe(const std::string& filter, int qos, std::string& outError) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_) {
        outError = "Cannot subscribe to " + filter + ": not connected";
        return false;
    }
    filter_ = filter;
    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    opts.onSuccess = onSubscribeSuccess;
    opts.onFailure = onSubscribeFailure;
    opts.context = this;
    int rc = MQTTAsync_subscribe(client_, filter_.c_str(), qos, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        outError = "Subscribe to " + filter + " failed (rc " + std::to_string(rc) + ")";
        return false;
    }
    return true;
}

bool PahoTransport::publish(const std::string& topic, const std::string& payload, int qos, bool retain,
                            std::string& outError) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_ || !MQTTAsync_isConnected(client_)) {
        outError = "Cannot publish to " + topic + ": not connected";
        return false;
    }
    MQTTAsync_message msg = MQTTAsync_message_initializer;
    msg.payload = const_cast<char*>(payload.data());
    msg.payloadlen = static_cast<int>(payload.size());
    msg.qos = qos;
    msg.retained = retain ? 1 : 0;
    int rc = MQTTAsync_sendMessage(client_, topic.c_str(), &msg, nullptr);
    if (rc != MQTTASYNC_SUCCESS) {
        outError = "Publish to " + topic + " failed (rc " + std::to_string(rc) + ")";
        return false;
    }
    return true;
}

void PahoTransport::onConnectSuccess(void* context, MQTTAsync_successData* /*response*/) {
    auto* self = static_cast<PahoTransport*>(context);
    if (self->callbacks_.onConnected) self->callbacks_.onConnected();
}

void PahoTransport::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* self = static_cast<PahoTransport*>(context);
    if (self->callbacks_.onConnectFailed) self->callbacks_.onConnectFailed(failureMessage(response, "connect failed"));
}

void PahoTransport::onConnectionLost(void* context, char* cause) {
    auto* self = static_cast<PahoTransport*>(context);
    const std::string why = cause ? std::string("connection lost: ") + cause : "connection lost";
    if (self->callbacks_.onConnectionLost) self->callbacks_.onConnectionLost(why);
}

int PahoTransport::onMessageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message) {
    auto* self = static_cast<PahoTransport*>(context);
    std::string topic = topicLen > 0 ? std::string(topicName, static_cast<size_t>(topicLen)) : std::string(topicName);
    const auto* data = static_cast<const unsigned char*>(message->payload);
    std::vector<unsigned char> payload(data, data + message->payloadlen);
    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    if (self->callbacks_.onMessage) self->callbacks_.onMessage(topic, std::move(payload));
    return 1;
}

void PahoTransport::onSubscribeSuccess(void* context, MQTTAsync_successData* /*response*/) {
    auto* self = static_cast<PahoTransport*>(context);
    logDebug("Subscribed to " + self->filter_, "MQTT");
}

void PahoTransport::onSubscribeFailure(void* context, MQTTAsync_failureData* response) {
    auto* self = static_cast<PahoTransport*>(context);
    if (self->callbacks_.onSubscribeFailed)
        self->callbacks_.onSubscribeFailed(self->filter_, failureMessage(response, "subscribe failed"));
}

} // namespace playnite
