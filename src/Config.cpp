#include "Config.hpp"
#include <fstream>
#include <set>

namespace wsb {

static std::optional<std::string> optionalString(const Json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    auto s = j.at(key).get<std::string>();
    if (s.empty()) return std::nullopt;
    return s;
}

static std::string stringify(const Json& v) {
    return v.is_string() ? v.get<std::string>() : JsonFormatter::compact(v);
}

std::optional<FieldMapping> makeFieldMapping(const std::string& uniqueId, const std::string& name,
                                             const std::string& jsonPath, TransformMode transform,
                                             std::string& err) {
    std::string pathErr;
    auto compiled = JsonPath::compile(jsonPath, pathErr);
    if (!compiled) {
        err = "mapping '" + uniqueId + "': invalid jsonpath '" + jsonPath + "': " + pathErr;
        return std::nullopt;
    }
    FieldMapping m;
    m.uniqueId = uniqueId;
    m.name = name;
    m.jsonPath = jsonPath;
    m.path = std::move(*compiled);
    m.transform = transform;
    return m;
}

static bool parseMapping(const Json& jm, FieldMapping& m, std::string& err) {
    try {
        auto uid = jm.at("unique_id").get<std::string>();
        if (uid.empty()) { err = "mapping with empty unique_id"; return false; }
        auto name = jm.at("name").get<std::string>();
        auto expr = jm.at("jsonpath").get<std::string>();
        auto modeName = jm.value("transform", std::string("none"));
        auto mode = transformModeFromString(modeName);
        if (!mode) { err = "mapping '" + uid + "': unknown transform '" + modeName + "'"; return false; }
        auto built = makeFieldMapping(uid, name, expr, *mode, err);
        if (!built) return false;
        m = std::move(*built);
        m.unit = optionalString(jm, "unit");
        m.icon = optionalString(jm, "icon");
        m.deviceClass = optionalString(jm, "device_class");
        m.stateClass = optionalString(jm, "state_class");
        return true;
    } catch (const std::exception& e) { err = std::string("mapping: ") + e.what(); return false; }
}

std::optional<AppConfig> ConfigLoader::loadFromJson(const Json& j, std::string& err) {
    AppConfig cfg;
    try {
        cfg.wsUrl = j.at("ws_url").get<std::string>();
        if (j.contains("ws_headers") && !j.at("ws_headers").is_null()) {
            for (auto& item : j.at("ws_headers").items()) {
                cfg.wsHeaders[item.key()] = stringify(item.value());
            }
        }
        cfg.baseTopic = j.at("base_topic").get<std::string>();
        cfg.device.id = j.at("device_id").get<std::string>();
        cfg.device.name = j.at("device_name").get<std::string>();
        cfg.device.manufacturer = j.value("device_manufacturer", cfg.device.manufacturer);
        cfg.device.model = j.value("device_model", cfg.device.model);

        const auto& jm = j.at("mqtt");
        cfg.mqtt.host = jm.at("host").get<std::string>();
        const auto& port = jm.at("port");
        int portNum = port.is_string() ? std::stoi(port.get<std::string>()) : port.get<int>();
        if (portNum <= 0 || portNum > 65535) { err = "mqtt.port out of range"; return std::nullopt; }
        cfg.mqtt.port = static_cast<uint16_t>(portNum);
        cfg.mqtt.username = jm.at("username").get<std::string>();
        cfg.mqtt.password = jm.at("password").get<std::string>();
        cfg.mqtt.discoveryPrefix = jm.at("discovery_prefix").get<std::string>();
        cfg.mqtt.clientId = jm.value("client_id", std::string());

        if (j.contains("debug") && j.at("debug").is_object()) {
            const auto& jd = j.at("debug");
            cfg.debug.logRawFrames = jd.value("log_raw_frames", false);
            cfg.debug.rawFramesLimit = jd.value("raw_frames_limit", 0);
            cfg.debug.logLevel = jd.value("log_level", cfg.debug.logLevel);
        }
    } catch (const std::exception& e) { err = e.what(); return std::nullopt; }

    std::set<std::string> seen;
    if (j.contains("mappings")) {
        for (auto& jm : j.at("mappings")) {
            FieldMapping m;
            if (!parseMapping(jm, m, err)) return std::nullopt;
            if (!seen.insert(m.uniqueId).second) {
                err = "duplicate unique_id '" + m.uniqueId + "'";
                return std::nullopt;
            }
            cfg.mappings.push_back(std::move(m));
        }
    }
    return cfg;
}

std::optional<AppConfig> ConfigLoader::loadFromFile(const std::string& path, std::string& err) {
    std::ifstream ifs(path);
    if (!ifs) { err = "Cannot open config file " + path; return std::nullopt; }
    Json j;
    try {
        ifs >> j;
    } catch (const Json::parse_error& e) { err = e.what(); return std::nullopt; }
    return loadFromJson(j, err);
}

} // namespace wsb
