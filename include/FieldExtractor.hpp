#pragma once
#include "Config.hpp"
#include <string>
#include <vector>

namespace wsb {

struct ExtractedValue {
    std::string uniqueId;
    Json value; // null when the path matched nothing
};

class FieldExtractor {
public:
    explicit FieldExtractor(const std::vector<FieldMapping>& mappings);

    // One entry per mapping, in mapping order.
    std::vector<ExtractedValue> extract(const Json& frame) const;

private:
    const std::vector<FieldMapping>& m_mappings;
};

} // namespace wsb
