#include "ValueTransformer.hpp"
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace wsb {

std::optional<TransformMode> transformModeFromString(const std::string& name) {
    if (name.empty() || name == "none") return TransformMode::None;
    if (name == "percent_0_1_to_0_100") return TransformMode::Percent01To0100;
    if (name == "seconds_to_hms") return TransformMode::SecondsToHms;
    return std::nullopt;
}

const char* toString(TransformMode mode) {
    switch (mode) {
    case TransformMode::None: return "none";
    case TransformMode::Percent01To0100: return "percent_0_1_to_0_100";
    case TransformMode::SecondsToHms: return "seconds_to_hms";
    }
    return "none";
}

std::optional<double> parseNumber(const Json& value) {
    if (value.is_boolean()) return value.get<bool>() ? 1.0 : 0.0;
    if (value.is_number()) return value.get<double>();
    if (!value.is_string()) return std::nullopt;

    const std::string& s = value.get_ref<const std::string&>();
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return std::nullopt;
    size_t e = s.find_last_not_of(" \t\r\n");
    std::string t = s.substr(b, e - b + 1);
    errno = 0;
    char* endp = nullptr;
    double v = std::strtod(t.c_str(), &endp);
    if (endp != t.c_str() + t.size() || errno == ERANGE) return std::nullopt;
    return v;
}

static double roundTo2(double v) {
    // From 1e15 up a double carries no fractional digits; scaling would only lose precision or overflow.
    if (std::fabs(v) >= 1e15) return v;
    return std::round(v * 100.0) / 100.0;
}

std::string formatHms(long long totalSeconds) {
    // Floor division keeps minutes and seconds in [0, 60) for negative input too.
    long long h = totalSeconds / 3600;
    long long rem = totalSeconds % 3600;
    if (rem < 0) { rem += 3600; --h; }
    long long m = rem / 60;
    long long sec = rem % 60;
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld", h, m, sec);
    return buf;
}

Json transform(const Json& value, TransformMode mode) {
    if (value.is_null()) return value;
    switch (mode) {
    case TransformMode::None:
        return value;
    case TransformMode::Percent01To0100: {
        auto v = parseNumber(value);
        if (!v || !std::isfinite(*v)) return value;
        return Json((*v >= 0.0 && *v <= 1.0) ? roundTo2(*v * 100.0) : roundTo2(*v));
    }
    case TransformMode::SecondsToHms: {
        auto v = parseNumber(value);
        if (!v || !std::isfinite(*v)) return value;
        double whole = std::trunc(*v);
        if (std::fabs(whole) > 9.0e18) return value;
        return Json(formatHms(static_cast<long long>(whole)));
    }
    }
    return value;
}

} // namespace wsb
