/*
 * File: src/rig_main.cpp
 * Project: Rig Marshal
 * Purpose: Main server binary: device port, HTTP control surface, WS events
 * Notes:
 *  - Device server runs its own worker pool; HTTP and WS share one io_context
 *  - SIGINT/SIGTERM stop the session and the server
 * Last updated: 2026-10-18
 */

#include <iostream>
#include <boost/asio.hpp>
#include "rig_http.hpp"
#include "rig_manager.hpp"
#include "rig_server.hpp"
#include "rig_state.hpp"
#include "rig_store.hpp"
#include "rig_ws.hpp"

static void usage(const char *argv0)
{
    std::cerr << "usage: " << argv0
              << " [--port N] [--bind ADDR] [--http HOST:PORT] [--ws HOST:PORT] [--data DIR]\n"
                 "       [--threads N] [--read-timeout-s N] [--heartbeat-interval-s N]\n"
                 "       [--heartbeat-timeout-s N] [--verbose]\n";
}

int main(int argc, char **argv)
{
    HubConfig cfg;
    bool verbose = false;
    try
    {
        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];
            auto next = [&]() -> std::string
            {
                if (i + 1 >= argc)
                    throw std::invalid_argument("missing value for " + a);
                return argv[++i];
            };
            if (a == "--port")
                cfg.port = static_cast<uint16_t>(std::stoi(next()));
            else if (a == "--bind")
                cfg.bind_address = next();
            else if (a == "--http")
                cfg.http_bind = next();
            else if (a == "--ws")
                cfg.ws_bind = next();
            else if (a == "--data")
                cfg.data_dir = next();
            else if (a == "--threads")
                cfg.io_threads = std::stoi(next());
            else if (a == "--read-timeout-s")
                cfg.read_timeout = std::chrono::seconds(std::stoi(next()));
            else if (a == "--heartbeat-interval-s")
                cfg.heartbeat_interval = std::chrono::seconds(std::stoi(next()));
            else if (a == "--heartbeat-timeout-s")
                cfg.heartbeat_timeout = std::chrono::seconds(std::stoi(next()));
            else if (a == "--verbose")
                verbose = true;
            else if (a == "--help" || a == "-h")
            {
                usage(argv[0]);
                return 0;
            }
            else
                throw std::invalid_argument("unknown flag " + a);
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "ERROR: " << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    std::string why;
    if (!cfg.validate(&why))
    {
        std::cerr << "ERROR: " << why << "\n";
        return 2;
    }

    Logger log("rig", verbose ? LogLevel::kDebug : LogLevel::kInfo);

    auto split = [](const std::string &s)
    {
        auto p = s.rfind(':');
        if (p == std::string::npos)
            throw std::invalid_argument("expected HOST:PORT, got " + s);
        return std::pair{s.substr(0, p), static_cast<unsigned short>(std::stoi(s.substr(p + 1)))};
    };

    boost::asio::io_context ioc{1};
    boost::asio::ip::tcp::endpoint http_ep, ws_ep;
    try
    {
        auto [http_host, http_port] = split(cfg.http_bind);
        auto [ws_host, ws_port] = split(cfg.ws_bind);
        http_ep = {boost::asio::ip::make_address(http_host), http_port};
        ws_ep = {boost::asio::ip::make_address(ws_host), ws_port};
    }
    catch (const std::exception &e)
    {
        std::cerr << "ERROR: bad bind address: " << e.what() << "\n";
        return 2;
    }

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(cfg.data_dir) / "sessions", ec);
    if (ec)
        std::cerr << "WARN: failed to ensure " << cfg.data_dir << "/sessions : " << ec.message() << "\n";

    ConnectionServer server{cfg, log};
    DeviceManager manager{server};
    SessionStore store{cfg.data_dir, log};

    HttpServer http{ioc, http_ep, manager, log};
    WsServer ws{ioc, ws_ep, log};

    // -------- event wiring --------

    server.add_connected_callback([&](const ConnectedDevice &d)
                                  { ws.broadcast("device.connected", nlohmann::json{{"device_id", d.device_id}, {"capabilities", d.capabilities}}); });
    server.add_disconnected_callback([&](const ConnectedDevice &d, DisconnectReason reason)
                                     { ws.broadcast("device.disconnected", nlohmann::json{{"device_id", d.device_id}, {"reason", to_string(reason)}}); });
    manager.add_status_callback([&](const std::string &, const AndroidDevice &d)
                                { ws.broadcast("device.status", device_to_json(d)); });
    manager.add_data_callback([&](const ShimmerDataSample &s)
                              { ws.broadcast("sensor.sample", sample_to_json(s)); });
    manager.add_session_callback([&](const SessionInfo &s)
                                 {
        if (s.active())
        {
            ws.broadcast("session.started", session_to_json(s));
            return;
        }
        store.record_session(s);
        ws.broadcast("session.completed", session_to_json(s)); });
    manager.add_file_callback([&](const CompletedTransfer &t)
                              {
        auto j = transfer_to_json(t);
        if (auto path = store.save_file(t))
            j["path"] = path->string();
        ws.broadcast("file.received", j); });

    if (!manager.initialize())
    {
        std::cerr << "ERROR: could not start device server on " << cfg.bind_address << ":" << cfg.port << "\n";
        return 1;
    }

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &e, int sig)
                       {
        if (e)
            return;
        log.info("signal " + std::to_string(sig) + " received, shutting down");
        manager.shutdown();
        ioc.stop(); });

    std::cout << "rig_marshal listening devices=" << cfg.bind_address << ":" << server.port()
              << " http=" << cfg.http_bind << " ws=" << cfg.ws_bind << " data=" << cfg.data_dir << "\n";

    ioc.run();
    manager.shutdown();
    return 0;
}
