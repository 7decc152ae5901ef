#pragma once
#include "StreamSession.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace wsb {

struct WsEndpoint {
    bool tls{false};     // wss://
    std::string host;    // as resolved (IPv6 without brackets)
    std::string port;
    std::string target;  // path and query, at least "/"
    std::string hostHeader;
};

// Accepts ws:// and wss://host[:port][/path][?query]. Anything else yields nullopt.
std::optional<WsEndpoint> parseWsUrl(const std::string& url);

// Boost.Beast WebSocket client session for one connection attempt. wss://
// endpoints get a TLS layer with peer and host name verification.
class WebSocketSession : public IStreamSession {
public:
    WebSocketSession(boost::asio::io_context& io, std::string url, std::map<std::string, std::string> headers);

    void asyncOpen(OpenHandler handler) override;
    void asyncRead(ReadHandler handler) override;
    void close() override;
    std::string endpoint() const override { return m_url; }

private:
    using PlainStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;
    using TlsStream = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::beast::tcp_stream>>;

    void onResolve(const boost::system::error_code& ec, boost::asio::ip::tcp::resolver::results_type results);
    void onConnect(const boost::system::error_code& ec);
    void onTlsHandshake(const boost::system::error_code& ec);
    void startHandshake();
    void onHandshake(const boost::system::error_code& ec);
    void complete(const boost::system::error_code& ec);
    boost::beast::tcp_stream& lowestLayer();

    template <class Stream>
    void configure(Stream& ws);

    boost::asio::io_context& m_io;
    std::string m_url;
    std::map<std::string, std::string> m_headers;
    WsEndpoint m_endpoint;
    boost::asio::ip::tcp::resolver m_resolver;
    boost::asio::ssl::context m_sslCtx;
    std::unique_ptr<PlainStream> m_ws;   // set for ws://
    std::unique_ptr<TlsStream> m_wss;    // set for wss://
    boost::beast::flat_buffer m_buffer;
    OpenHandler m_openHandler;
};

} // namespace wsb
