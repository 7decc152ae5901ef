#pragma once
#include "BusClient.hpp"
#include "Config.hpp"
#include <string>

namespace wsb {

std::string stateTopic(const std::string& baseTopic, const std::string& uniqueId);
std::string discoveryTopic(const std::string& prefix, const std::string& deviceId, const std::string& uniqueId);

// Home Assistant MQTT sensor discovery payload for one mapping.
Json buildDiscoveryRecord(const FieldMapping& mapping, const DeviceIdentity& device, const std::string& baseTopic);

class Publisher {
public:
    static constexpr const char* kDefaultIcon = "mdi:printer-3d";

    Publisher(IBusClient& bus, const AppConfig& cfg);

    // Retained, QoS 1.
    bool publishDiscovery(const FieldMapping& mapping);
    void publishAllDiscovery();

    // Retained, QoS 0. Null value clears the entity with an empty payload.
    bool publishState(const std::string& uniqueId, const Json& value);

private:
    IBusClient& m_bus;
    const AppConfig& m_cfg;
};

} // namespace wsb
