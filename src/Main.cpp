#include <iostream>
#include <string>
#include <chrono>
#include <csignal>
#include <memory>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>
#include "Config.hpp"
#include "ConnectionSupervisor.hpp"
#include "FieldExtractor.hpp"
#include "FrameProcessor.hpp"
#include "Logging.hpp"
#include "MqttClient.hpp"
#include "Publisher.hpp"
#include "WebSocketSession.hpp"

int main(int argc, char* argv[]) {
    std::string configPath = "/data/options.json";
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if ((a == "-c" || a == "--config") && i + 1 < argc) {
            configPath = argv[++i];
        } else if (a == "--help" || a == "-h") {
            std::cout << "Usage: WsBridgeApp [-c options.json]\n"
                         "  -c, --config   Path to configuration JSON (default /data/options.json).\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << a << "\n";
            return 1;
        }
    }

    std::string err;
    auto cfgOpt = wsb::ConfigLoader::loadFromFile(configPath, err);
    if (!cfgOpt) { std::cerr << "Config load error: " << err << std::endl; return 1; }
    const wsb::AppConfig cfg = std::move(*cfgOpt);

    wsb::initLogging(cfg.debug.logLevel);

    wsb::MqttSettings mqttSettings = cfg.mqtt;
    if (mqttSettings.clientId.empty()) {
        auto epoch = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        mqttSettings.clientId = "ws-bridge-" + std::to_string(epoch);
    }

    wsb::MqttClient mqtt;
    if (!mqtt.open(mqttSettings, err)) {
        spdlog::error("MQTT connect to {}:{} failed: {}", cfg.mqtt.host, cfg.mqtt.port, err);
        return 1;
    }

    wsb::Publisher publisher(mqtt, cfg);
    wsb::FieldExtractor extractor(cfg.mappings);
    wsb::FrameProcessor processor(extractor, publisher, cfg.debug);

    boost::asio::io_context io;
    wsb::ConnectionSupervisor supervisor(io, [&io, &cfg]() -> std::unique_ptr<wsb::IStreamSession> {
        return std::make_unique<wsb::WebSocketSession>(io, cfg.wsUrl, cfg.wsHeaders);
    }, processor);

    boost::asio::signal_set signals(io, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int sig) {
        if (ec) return;
        spdlog::info("Signal {} received, shutting down", sig);
        supervisor.stop();
    });

    spdlog::info("Bridging {} -> mqtt://{}:{} ({} mappings)", cfg.wsUrl, cfg.mqtt.host, cfg.mqtt.port,
                 cfg.mappings.size());
    for (const auto& m : cfg.mappings) {
        spdlog::debug("Mapping {} <- {} [{}]", m.uniqueId, m.path.expression(), wsb::toString(m.transform));
    }
    supervisor.start();
    io.run();

    mqtt.close();
    spdlog::info("Stopped");
    return 0;
}
