#pragma once
#include "JsonPath.hpp"
#include "ValueTransformer.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace wsb {

struct FieldMapping {
    std::string uniqueId;        // also the last segment of the state topic
    std::string name;            // entity display name
    std::string jsonPath;        // source expression, e.g. "$.printProgress"
    JsonPath path;               // compiled form of jsonPath
    TransformMode transform{TransformMode::None};
    std::optional<std::string> unit;
    std::optional<std::string> icon;
    std::optional<std::string> deviceClass;
    std::optional<std::string> stateClass;
};

struct DeviceIdentity {
    std::string id;
    std::string name;
    std::string manufacturer{"Creality"};
    std::string model{"K1/K1 Max (WS Bridge)"};
};

struct MqttSettings {
    std::string host;
    uint16_t port{1883};
    std::string username;
    std::string password;
    std::string discoveryPrefix{"homeassistant"};
    std::string clientId;        // empty: generated at startup
    int keepAliveSec{60};
};

struct DebugOptions {
    bool logRawFrames{false};
    int rawFramesLimit{0};
    std::string logLevel{"info"};
};

struct AppConfig {
    std::string wsUrl;
    std::map<std::string, std::string> wsHeaders;
    std::string baseTopic;
    DeviceIdentity device;
    MqttSettings mqtt;
    std::vector<FieldMapping> mappings;
    DebugOptions debug;
};

class ConfigLoader {
public:
    static std::optional<AppConfig> loadFromFile(const std::string& path, std::string& err);
    static std::optional<AppConfig> loadFromJson(const Json& j, std::string& err);
};

// Builds a mapping from already-known parts; used by the loader and handy for tests.
std::optional<FieldMapping> makeFieldMapping(const std::string& uniqueId, const std::string& name,
                                             const std::string& jsonPath, TransformMode transform,
                                             std::string& err);

} // namespace wsb
