#pragma once
#include <string>
#include <nlohmann/json.hpp>

namespace wsb {

// Object members keep document order; path traversal and discovery output rely on it.
using Json = nlohmann::ordered_json;

class JsonFormatter {
public:
    static std::string compact(const Json& j) {
        return j.dump(-1, ' ', false, Json::error_handler_t::replace);
    }

    // Cut a log line down to maxLen bytes.
    static std::string truncate(const std::string& s, size_t maxLen = 500) {
        return s.size() <= maxLen ? s : s.substr(0, maxLen);
    }

    // Text published on a state topic: empty for null, raw text for strings,
    // compact JSON for everything else.
    static std::string statePayload(const Json& value) {
        if (value.is_null()) return std::string();
        if (value.is_string()) return value.get<std::string>();
        return compact(value);
    }
};

} // namespace wsb
