#include "WebSocketSession.hpp"
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/http.hpp>
#include <cctype>
#include <chrono>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

namespace wsb {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

static bool hasScheme(const std::string& url, const std::string& scheme) {
    if (url.size() < scheme.size()) return false;
    for (size_t i = 0; i < scheme.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(url[i])) != scheme[i]) return false;
    }
    return true;
}

std::optional<WsEndpoint> parseWsUrl(const std::string& url) {
    WsEndpoint ep;
    std::string rest;
    if (hasScheme(url, "wss://")) {
        ep.tls = true;
        ep.port = "443";
        rest = url.substr(6);
    } else if (hasScheme(url, "ws://")) {
        ep.port = "80";
        rest = url.substr(5);
    } else {
        return std::nullopt;
    }
    size_t pathPos = rest.find_first_of("/?");
    std::string authority = rest.substr(0, pathPos);
    std::string target = pathPos == std::string::npos ? "/" : rest.substr(pathPos);
    if (!target.empty() && target[0] == '?') target = "/" + target;
    if (authority.empty() || authority.find('@') != std::string::npos) return std::nullopt;

    if (authority[0] == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos || close == 1) return std::nullopt;
        ep.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':' || tail.size() == 1) return std::nullopt;
            ep.port = tail.substr(1);
        }
    } else {
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos) {
            ep.host = authority.substr(0, colon);
            ep.port = authority.substr(colon + 1);
            if (ep.port.empty()) return std::nullopt;
        } else {
            ep.host = authority;
        }
        if (ep.host.empty()) return std::nullopt;
    }
    for (char c : ep.port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    if (ep.port.size() > 5 || std::stoul(ep.port) == 0 || std::stoul(ep.port) > 65535) return std::nullopt;
    ep.target = target;
    ep.hostHeader = authority;
    return ep;
}

WebSocketSession::WebSocketSession(net::io_context& io, std::string url, std::map<std::string, std::string> headers)
    : m_io(io),
      m_url(std::move(url)),
      m_headers(std::move(headers)),
      m_resolver(io),
      m_sslCtx(net::ssl::context::tls_client) {}

void WebSocketSession::asyncOpen(OpenHandler handler) {
    m_openHandler = std::move(handler);
    auto ep = parseWsUrl(m_url);
    if (!ep) {
        net::post(m_io, [this] { complete(net::error::make_error_code(net::error::invalid_argument)); });
        return;
    }
    m_endpoint = *ep;
    if (m_endpoint.tls) {
        boost::system::error_code ec;
        m_sslCtx.set_default_verify_paths(ec);
        if (ec) spdlog::warn("No default CA certificates for {}: {}", m_url, ec.message());
        m_wss = std::make_unique<TlsStream>(m_io, m_sslCtx);
    } else {
        m_ws = std::make_unique<PlainStream>(m_io);
    }
    m_resolver.async_resolve(m_endpoint.host, m_endpoint.port,
        [this](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            onResolve(ec, std::move(results));
        });
}

beast::tcp_stream& WebSocketSession::lowestLayer() {
    return m_wss ? beast::get_lowest_layer(*m_wss) : beast::get_lowest_layer(*m_ws);
}

void WebSocketSession::onResolve(const boost::system::error_code& ec, tcp::resolver::results_type results) {
    if (ec) { complete(ec); return; }
    lowestLayer().expires_after(std::chrono::seconds(30));
    lowestLayer().async_connect(results,
        [this](const boost::system::error_code& ec, tcp::resolver::results_type::endpoint_type) {
            onConnect(ec);
        });
}

void WebSocketSession::onConnect(const boost::system::error_code& ec) {
    if (ec) { complete(ec); return; }
    if (!m_wss) { startHandshake(); return; }

    auto& tls = m_wss->next_layer();
    // SNI
    if (!SSL_set_tlsext_host_name(tls.native_handle(), m_endpoint.host.c_str())) {
        complete(boost::system::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()));
        return;
    }
    tls.set_verify_mode(net::ssl::verify_peer);
    tls.set_verify_callback(net::ssl::host_name_verification(m_endpoint.host));
    lowestLayer().expires_after(std::chrono::seconds(30));
    tls.async_handshake(net::ssl::stream_base::client,
        [this](const boost::system::error_code& ec) { onTlsHandshake(ec); });
}

void WebSocketSession::onTlsHandshake(const boost::system::error_code& ec) {
    if (ec) { complete(ec); return; }
    startHandshake();
}

template <class Stream>
void WebSocketSession::configure(Stream& ws) {
    websocket::stream_base::timeout opt{};
    opt.handshake_timeout = std::chrono::seconds(30);
    opt.idle_timeout = std::chrono::seconds(20);
    opt.keep_alive_pings = true;
    ws.set_option(opt);
    auto headers = m_headers;
    ws.set_option(websocket::stream_base::decorator([headers](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "ws-bridge");
        for (const auto& kv : headers) req.set(kv.first, kv.second);
    }));
}

void WebSocketSession::startHandshake() {
    // The websocket stream runs its own timers from here on.
    lowestLayer().expires_never();
    auto done = [this](const boost::system::error_code& ec) { onHandshake(ec); };
    if (m_wss) {
        configure(*m_wss);
        m_wss->async_handshake(m_endpoint.hostHeader, m_endpoint.target, done);
    } else {
        configure(*m_ws);
        m_ws->async_handshake(m_endpoint.hostHeader, m_endpoint.target, done);
    }
}

void WebSocketSession::onHandshake(const boost::system::error_code& ec) {
    complete(ec);
}

// The handler may destroy this session, so it is moved out before the call.
void WebSocketSession::complete(const boost::system::error_code& ec) {
    auto handler = std::move(m_openHandler);
    m_openHandler = nullptr;
    handler(ec);
}

void WebSocketSession::asyncRead(ReadHandler handler) {
    auto onRead = [this, handler = std::move(handler)](const boost::system::error_code& ec, std::size_t) {
        if (ec) { handler(ec, std::string()); return; }
        std::string frame = beast::buffers_to_string(m_buffer.data());
        m_buffer.consume(m_buffer.size());
        handler(ec, std::move(frame));
    };
    if (m_wss) {
        m_wss->async_read(m_buffer, std::move(onRead));
    } else {
        m_ws->async_read(m_buffer, std::move(onRead));
    }
}

void WebSocketSession::close() {
    m_resolver.cancel();
    if (m_ws || m_wss) lowestLayer().close();
}

} // namespace wsb
