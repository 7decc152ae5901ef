#include "Publisher.hpp"
#include <spdlog/spdlog.h>

namespace wsb {

std::string stateTopic(const std::string& baseTopic, const std::string& uniqueId) {
    return baseTopic + "/state/" + uniqueId;
}

std::string discoveryTopic(const std::string& prefix, const std::string& deviceId, const std::string& uniqueId) {
    return prefix + "/sensor/" + deviceId + "/" + uniqueId + "/config";
}

Json buildDiscoveryRecord(const FieldMapping& mapping, const DeviceIdentity& device, const std::string& baseTopic) {
    Json disc;
    disc["name"] = mapping.name;
    disc["state_topic"] = stateTopic(baseTopic, mapping.uniqueId);
    disc["unique_id"] = mapping.uniqueId;
    disc["device"] = {
        {"identifiers", Json::array({device.id})},
        {"manufacturer", device.manufacturer},
        {"name", device.name},
        {"model", device.model},
    };
    disc["icon"] = mapping.icon ? *mapping.icon : std::string(Publisher::kDefaultIcon);
    if (mapping.unit) disc["unit_of_measurement"] = *mapping.unit;
    if (mapping.deviceClass) disc["device_class"] = *mapping.deviceClass;
    if (mapping.stateClass) disc["state_class"] = *mapping.stateClass;
    return disc;
}

Publisher::Publisher(IBusClient& bus, const AppConfig& cfg) : m_bus(bus), m_cfg(cfg) {}

bool Publisher::publishDiscovery(const FieldMapping& mapping) {
    auto topic = discoveryTopic(m_cfg.mqtt.discoveryPrefix, m_cfg.device.id, mapping.uniqueId);
    auto payload = JsonFormatter::compact(buildDiscoveryRecord(mapping, m_cfg.device, m_cfg.baseTopic));
    if (!m_bus.publish(topic, payload, QoS::AtLeastOnce, true)) {
        spdlog::warn("Discovery not queued: {}", topic);
        return false;
    }
    spdlog::info("Published discovery: {}", topic);
    return true;
}

void Publisher::publishAllDiscovery() {
    for (const auto& m : m_cfg.mappings) publishDiscovery(m);
}

bool Publisher::publishState(const std::string& uniqueId, const Json& value) {
    return m_bus.publish(stateTopic(m_cfg.baseTopic, uniqueId), JsonFormatter::statePayload(value),
                         QoS::AtMostOnce, true);
}

} // namespace wsb
