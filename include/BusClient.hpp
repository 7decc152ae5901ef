#pragma once
#include <string>

namespace wsb {

enum class QoS : int {
    AtMostOnce = 0,
    AtLeastOnce = 1,
    ExactlyOnce = 2,
};

// Outbound message bus. publish() only queues; it returns false when the
// client refused the message, never waits for the broker.
class IBusClient {
public:
    virtual ~IBusClient() = default;
    virtual bool publish(const std::string& topic, const std::string& payload, QoS qos, bool retain) = 0;
};

} // namespace wsb
