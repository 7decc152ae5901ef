#pragma once
#include "JsonFormatter.hpp"
#include <optional>
#include <string>

namespace wsb {

enum class TransformMode {
    None,
    Percent01To0100, // "percent_0_1_to_0_100"
    SecondsToHms,    // "seconds_to_hms"
};

std::optional<TransformMode> transformModeFromString(const std::string& name);
const char* toString(TransformMode mode);

// Null stays null. A value the numeric modes cannot parse is returned untouched.
Json transform(const Json& value, TransformMode mode);

// Numeric reading used by the transforms: numbers, booleans, and strings
// holding one complete decimal number.
std::optional<double> parseNumber(const Json& value);

std::string formatHms(long long totalSeconds);

} // namespace wsb
