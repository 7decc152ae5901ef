#pragma once
#include <string>

namespace wsb {

constexpr const char* kProcessTag = "ws-bridge";

// Installs the stdout logger every component writes through. Unknown level
// names fall back to "info".
void initLogging(const std::string& level = "info");

} // namespace wsb
