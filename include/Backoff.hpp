#pragma once
#include <algorithm>
#include <chrono>

namespace wsb {

// Reconnect delay: starts at the floor, doubles after every consecutive
// failure up to the ceiling, back to the floor on success.
class Backoff {
public:
    using Duration = std::chrono::milliseconds;

    Backoff(Duration floor = std::chrono::seconds(2), Duration ceiling = std::chrono::seconds(60))
        : m_floor(floor), m_ceiling(ceiling), m_current(floor) {}

    Duration current() const { return m_current; }

    // Delay to wait now; the following call returns the doubled delay.
    Duration next() {
        Duration wait = m_current;
        m_current = std::min(m_current * 2, m_ceiling);
        return wait;
    }

    void reset() { m_current = m_floor; }

private:
    Duration m_floor;
    Duration m_ceiling;
    Duration m_current;
};

} // namespace wsb
