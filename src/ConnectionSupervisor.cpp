#include "ConnectionSupervisor.hpp"
#include <spdlog/spdlog.h>

namespace wsb {

const char* toString(ConnectionSupervisor::State state) {
    switch (state) {
    case ConnectionSupervisor::State::Disconnected: return "Disconnected";
    case ConnectionSupervisor::State::Connecting: return "Connecting";
    case ConnectionSupervisor::State::Connected: return "Connected";
    }
    return "Unknown";
}

ConnectionSupervisor::ConnectionSupervisor(boost::asio::io_context& io, SessionFactory factory,
                                           FrameProcessor& processor, Backoff backoff)
    : m_io(io), m_factory(std::move(factory)), m_processor(processor), m_backoff(backoff), m_timer(io) {}

void ConnectionSupervisor::start() {
    m_stopped = false;
    connect();
}

void ConnectionSupervisor::stop() {
    if (m_stopped) return;
    m_stopped = true;
    spdlog::info("Stopping WebSocket supervisor ({})", toString(m_state));
    m_timer.cancel();
    if (m_session) m_session->close();
}

void ConnectionSupervisor::connect() {
    m_state = State::Connecting;
    m_session = m_factory();
    spdlog::info("Connecting to WebSocket: {}", m_session->endpoint());
    m_session->asyncOpen([this](const boost::system::error_code& ec) { onOpen(ec); });
}

void ConnectionSupervisor::onOpen(const boost::system::error_code& ec) {
    if (m_stopped) { release(); return; }
    if (ec) { fail(ec, "connect"); return; }
    m_state = State::Connected;
    ++m_connections;
    m_backoff.reset();
    spdlog::info("WebSocket connected.");
    m_processor.onConnected();
    readNext();
}

void ConnectionSupervisor::readNext() {
    m_session->asyncRead([this](const boost::system::error_code& ec, std::string frame) {
        onRead(ec, std::move(frame));
    });
}

void ConnectionSupervisor::onRead(const boost::system::error_code& ec, std::string frame) {
    if (m_stopped) { release(); return; }
    if (ec) { fail(ec, "read"); return; }
    try {
        m_processor.process(frame);
    } catch (const std::exception& e) {
        spdlog::warn("Frame dropped: {}", e.what());
    }
    readNext();
}

void ConnectionSupervisor::fail(const boost::system::error_code& ec, const char* stage) {
    release();
    ++m_failures;
    auto wait = m_backoff.next();
    spdlog::warn("WS error ({}): {} - retrying in {:g}s", stage, ec.message(), wait.count() / 1000.0);
    m_timer.expires_after(wait);
    m_timer.async_wait([this](const boost::system::error_code& timerEc) {
        if (timerEc || m_stopped) return;
        connect();
    });
}

void ConnectionSupervisor::release() {
    if (m_session) {
        m_session->close();
        m_session.reset();
    }
    m_state = State::Disconnected;
}

} // namespace wsb
