#include "FieldExtractor.hpp"

namespace wsb {

FieldExtractor::FieldExtractor(const std::vector<FieldMapping>& mappings) : m_mappings(mappings) {}

std::vector<ExtractedValue> FieldExtractor::extract(const Json& frame) const {
    std::vector<ExtractedValue> out;
    out.reserve(m_mappings.size());
    for (const auto& m : m_mappings) {
        const Json* match = m.path.first(frame);
        Json raw = match ? *match : Json();
        out.push_back(ExtractedValue{m.uniqueId, transform(raw, m.transform)});
    }
    return out;
}

} // namespace wsb
