#include "FrameProcessor.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace wsb {

FrameProcessor::FrameProcessor(const FieldExtractor& extractor, Publisher& publisher, const DebugOptions& debug)
    : m_extractor(extractor),
      m_publisher(publisher),
      m_rawLeft(debug.logRawFrames ? std::max(debug.rawFramesLimit, 0) : 0) {}

void FrameProcessor::onConnected() {
    m_publisher.publishAllDiscovery();
}

bool FrameProcessor::process(const std::string& payload) {
    Json data;
    bool tooDeep = false;
    // Copying or dumping a matched value recurses per level, so depth is bounded at parse time.
    auto limitDepth = [&tooDeep](int depth, Json::parse_event_t event, Json&) {
        if ((event == Json::parse_event_t::object_start || event == Json::parse_event_t::array_start) &&
            depth >= kMaxFrameDepth) {
            tooDeep = true;
            return false;
        }
        return true;
    };
    try {
        data = Json::parse(payload, limitDepth);
    } catch (const Json::parse_error&) {
        if (m_rawLeft > 0) {
            spdlog::info("RAW(nonjson) = {}", JsonFormatter::truncate(payload));
            --m_rawLeft;
        }
        return false;
    }
    if (tooDeep) {
        spdlog::debug("Frame dropped: nested deeper than {} levels", kMaxFrameDepth);
        return false;
    }
    if (m_rawLeft > 0) {
        spdlog::info("RAW(json) = {}", JsonFormatter::truncate(JsonFormatter::compact(data)));
        --m_rawLeft;
    }
    for (const auto& ev : m_extractor.extract(data)) {
        m_publisher.publishState(ev.uniqueId, ev.value);
    }
    return true;
}

} // namespace wsb
