#pragma once
#include "Config.hpp"
#include "FieldExtractor.hpp"
#include "Publisher.hpp"
#include <string>

namespace wsb {

// Per-frame path: parse, optional raw logging, extract, publish.
class FrameProcessor {
public:
    FrameProcessor(const FieldExtractor& extractor, Publisher& publisher, const DebugOptions& debug);

    // Called once per established upstream connection.
    void onConnected();

    // Frames nested deeper than this are dropped unparsed.
    static constexpr int kMaxFrameDepth = 512;

    // Returns false when the frame got dropped: not JSON, or nested too deep.
    bool process(const std::string& payload);

    int rawLogsLeft() const { return m_rawLeft; }

private:
    const FieldExtractor& m_extractor;
    Publisher& m_publisher;
    int m_rawLeft{0}; // one-shot budget, never replenished
};

} // namespace wsb
