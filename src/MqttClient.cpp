#include "MqttClient.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

namespace wsb {

MqttClient::MqttClient() = default;

MqttClient::~MqttClient() { close(); }

bool MqttClient::open(const MqttSettings& settings, std::string& err, int timeoutMs) {
    if (m_client) { err = "already open"; return false; }
    m_serverUri = "tcp://" + settings.host + ":" + std::to_string(settings.port);
    m_username = settings.username;
    m_password = settings.password;

    MQTTAsync_createOptions createOpts = MQTTAsync_createOptions_initializer;
    // Keeps publishes made while Paho is reconnecting instead of rejecting them.
    createOpts.sendWhileDisconnected = 1;
    createOpts.maxBufferedMessages = 100;
    int rc = MQTTAsync_createWithOptions(&m_client, m_serverUri.c_str(), settings.clientId.c_str(),
                                         MQTTCLIENT_PERSISTENCE_NONE, nullptr, &createOpts);
    if (rc != MQTTASYNC_SUCCESS) {
        err = std::string("MQTTAsync_create failed: ") + MQTTAsync_strerror(rc);
        m_client = nullptr;
        return false;
    }
    rc = MQTTAsync_setCallbacks(m_client, this, &MqttClient::onConnectionLost, &MqttClient::onMessageArrived, nullptr);
    if (rc == MQTTASYNC_SUCCESS) rc = MQTTAsync_setConnected(m_client, this, &MqttClient::onConnected);
    if (rc != MQTTASYNC_SUCCESS) {
        err = std::string("MQTTAsync_setCallbacks failed: ") + MQTTAsync_strerror(rc);
        MQTTAsync_destroy(&m_client);
        m_client = nullptr;
        return false;
    }

    MQTTAsync_connectOptions opts = MQTTAsync_connectOptions_initializer;
    opts.keepAliveInterval = settings.keepAliveSec;
    opts.cleansession = 1;
    opts.username = m_username.empty() ? nullptr : m_username.c_str();
    opts.password = m_password.empty() ? nullptr : m_password.c_str();
    opts.automaticReconnect = 1;
    opts.minRetryInterval = 1;
    opts.maxRetryInterval = 60;
    opts.onSuccess = &MqttClient::onConnectSuccess;
    opts.onFailure = &MqttClient::onConnectFailure;
    opts.context = this;

    {
        std::lock_guard<std::mutex> lk(m_mtx);
        m_connectDone = false;
        m_connectError.clear();
    }
    rc = MQTTAsync_connect(m_client, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        err = std::string("MQTTAsync_connect failed: ") + MQTTAsync_strerror(rc);
        MQTTAsync_destroy(&m_client);
        m_client = nullptr;
        return false;
    }

    std::unique_lock<std::mutex> lk(m_mtx);
    bool done = m_cv.wait_for(lk, std::chrono::milliseconds(timeoutMs), [this] { return m_connectDone; });
    if (!done || !m_connected) {
        err = done ? m_connectError : "timed out connecting to " + m_serverUri;
        lk.unlock();
        MQTTAsync_destroy(&m_client);
        m_client = nullptr;
        return false;
    }
    spdlog::info("MQTT connected to {}", m_serverUri);
    return true;
}

bool MqttClient::publish(const std::string& topic, const std::string& payload, QoS qos, bool retain) {
    if (!m_client) return false;
    MQTTAsync_message msg = MQTTAsync_message_initializer;
    msg.payload = const_cast<char*>(payload.data());
    msg.payloadlen = static_cast<int>(payload.size());
    msg.qos = static_cast<int>(qos);
    msg.retained = retain ? 1 : 0;

    MQTTAsync_responseOptions opts = MQTTAsync_responseOptions_initializer;
    opts.onFailure = &MqttClient::onSendFailure;
    opts.context = this;

    int rc = MQTTAsync_sendMessage(m_client, topic.c_str(), &msg, &opts);
    if (rc != MQTTASYNC_SUCCESS) {
        if (m_refusals.record()) {
            spdlog::warn("MQTT publish to {} rejected: {} (further rejections are counted until reconnect)",
                         topic, MQTTAsync_strerror(rc));
        } else {
            spdlog::debug("MQTT publish to {} rejected: {}", topic, MQTTAsync_strerror(rc));
        }
        return false;
    }
    return true;
}

void MqttClient::close() {
    if (!m_client) return;
    if (MQTTAsync_isConnected(m_client)) {
        MQTTAsync_disconnectOptions opts = MQTTAsync_disconnectOptions_initializer;
        opts.timeout = 1000;
        int rc = MQTTAsync_disconnect(m_client, &opts);
        if (rc != MQTTASYNC_SUCCESS) {
            spdlog::warn("MQTT disconnect failed: {}", MQTTAsync_strerror(rc));
        }
    }
    MQTTAsync_destroy(&m_client);
    m_client = nullptr;
    std::lock_guard<std::mutex> lk(m_mtx);
    m_connected = false;
}

void MqttClient::onConnectSuccess(void* context, MQTTAsync_successData* /*response*/) {
    auto* self = static_cast<MqttClient*>(context);
    std::lock_guard<std::mutex> lk(self->m_mtx);
    self->m_connected = true;
    self->m_connectDone = true;
    self->m_cv.notify_all();
}

void MqttClient::onConnectFailure(void* context, MQTTAsync_failureData* response) {
    auto* self = static_cast<MqttClient*>(context);
    std::lock_guard<std::mutex> lk(self->m_mtx);
    self->m_connected = false;
    self->m_connectDone = true;
    self->m_connectError = (response && response->message)
        ? std::string(response->message)
        : "connect failed (code " + std::to_string(response ? response->code : 0) + ")";
    self->m_cv.notify_all();
}

void MqttClient::onConnected(void* context, char* cause) {
    auto* self = static_cast<MqttClient*>(context);
    bool reconnect = false;
    {
        std::lock_guard<std::mutex> lk(self->m_mtx);
        reconnect = self->m_everConnected;
        self->m_everConnected = true;
        self->m_connected = true;
    }
    if (reconnect) spdlog::info("MQTT reconnected ({})", cause ? cause : "");
    unsigned refused = self->m_refusals.reset();
    if (refused > 0) spdlog::warn("MQTT rejected {} publishes while disconnected", refused);
}

void MqttClient::onConnectionLost(void* context, char* cause) {
    auto* self = static_cast<MqttClient*>(context);
    {
        std::lock_guard<std::mutex> lk(self->m_mtx);
        self->m_connected = false;
    }
    spdlog::warn("MQTT connection lost: {}", cause ? cause : "unknown cause");
}

int MqttClient::onMessageArrived(void* /*context*/, char* topicName, int /*topicLen*/, MQTTAsync_message* message) {
    // Nothing is subscribed; drop anything the broker sends.
    MQTTAsync_freeMessage(&message);
    MQTTAsync_free(topicName);
    return 1;
}

void MqttClient::onSendFailure(void* /*context*/, MQTTAsync_failureData* response) {
    spdlog::warn("MQTT delivery failed: {}", (response && response->message) ? response->message : "unknown error");
}

} // namespace wsb
