#pragma once
#include "BusClient.hpp"
#include "Config.hpp"
#include <MQTTAsync.h>
#include <condition_variable>
#include <mutex>
#include <string>

namespace wsb {

// Refused publishes between two connections; only the first of a run warns.
class RefusalCounter {
public:
    // True for the first refusal since the last reset.
    bool record() {
        std::lock_guard<std::mutex> lk(m_mtx);
        return ++m_count == 1;
    }

    // Clears the run and returns how many refusals it held.
    unsigned reset() {
        std::lock_guard<std::mutex> lk(m_mtx);
        unsigned n = m_count;
        m_count = 0;
        return n;
    }

private:
    std::mutex m_mtx;
    unsigned m_count{0};
};

// Eclipse Paho asynchronous client. Network I/O and automatic reconnects
// run on Paho's own thread.
class MqttClient : public IBusClient {
public:
    MqttClient();
    ~MqttClient() override;

    MqttClient(const MqttClient&) = delete;
    MqttClient& operator=(const MqttClient&) = delete;

    // Blocks until the first CONNACK or failure (or timeoutMs elapses).
    bool open(const MqttSettings& settings, std::string& err, int timeoutMs = 10000);
    bool publish(const std::string& topic, const std::string& payload, QoS qos, bool retain) override;
    void close();

private:
    static void onConnectSuccess(void* context, MQTTAsync_successData* response);
    static void onConnectFailure(void* context, MQTTAsync_failureData* response);
    static void onConnected(void* context, char* cause);
    static void onConnectionLost(void* context, char* cause);
    static int onMessageArrived(void* context, char* topicName, int topicLen, MQTTAsync_message* message);
    static void onSendFailure(void* context, MQTTAsync_failureData* response);

    MQTTAsync m_client{nullptr};
    std::string m_serverUri;
    std::string m_username;
    std::string m_password;

    std::mutex m_mtx;
    std::condition_variable m_cv;
    bool m_connectDone{false};
    bool m_connected{false};
    bool m_everConnected{false};
    std::string m_connectError;
    RefusalCounter m_refusals;
};

} // namespace wsb
