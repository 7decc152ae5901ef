#pragma once
#include "Backoff.hpp"
#include "FrameProcessor.hpp"
#include "StreamSession.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <memory>
#include <string>

namespace wsb {

// Keeps one upstream session alive for the life of the process:
// Disconnected -> Connecting -> Connected -> (failure) Disconnected, with
// the backoff wait before every new attempt after a failure. All state is
// touched only from the io_context thread.
class ConnectionSupervisor {
public:
    enum class State { Disconnected, Connecting, Connected };

    ConnectionSupervisor(boost::asio::io_context& io, SessionFactory factory, FrameProcessor& processor,
                         Backoff backoff = Backoff());

    void start();

    // Cancels the backoff wait or the live session. Once the outstanding
    // completion has run the supervisor holds no more work.
    void stop();

    State state() const { return m_state; }
    Backoff::Duration currentBackoff() const { return m_backoff.current(); }
    unsigned connections() const { return m_connections; }
    unsigned failures() const { return m_failures; }

private:
    void connect();
    void onOpen(const boost::system::error_code& ec);
    void readNext();
    void onRead(const boost::system::error_code& ec, std::string frame);
    void fail(const boost::system::error_code& ec, const char* stage);
    void release();

    boost::asio::io_context& m_io;
    SessionFactory m_factory;
    FrameProcessor& m_processor;
    Backoff m_backoff;
    boost::asio::steady_timer m_timer;
    std::unique_ptr<IStreamSession> m_session;
    State m_state{State::Disconnected};
    bool m_stopped{false};
    unsigned m_connections{0};
    unsigned m_failures{0};
};

const char* toString(ConnectionSupervisor::State state);

} // namespace wsb
