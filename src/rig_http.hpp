/*
 * File: src/rig_http.hpp
 * Project: Rig Marshal
 * Purpose: HTTP routing and handlers for the operator control surface
 * Notes:
 *  - /health returns constant JSON; no shared state
 *  - Bad JSON -> 400, unknown target -> 404
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "rig_manager.hpp"
#include "rig_state.hpp"

namespace http = boost::beast::http;

// -------- HTTP server --------

class HttpServer
{
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    DeviceManager &manager_;
    Logger &log_;
    std::chrono::steady_clock::time_point start_ = std::chrono::steady_clock::now();

public:
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, DeviceManager &m, Logger &log)
        : acceptor_(ioc), socket_(ioc), manager_(m), log_(log)
    {
        boost::system::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (!ec)
            acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (!ec)
            acceptor_.bind(ep, ec);
        if (!ec)
            acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec)
        {
            log_.error("http: failed to listen on " + ep.address().to_string() + ":" +
                       std::to_string(ep.port()) + ": " + ec.message());
            return;
        }
        do_accept();
    }

    bool listening() const { return acceptor_.is_open(); }

    uint16_t port() const
    {
        boost::system::error_code ec;
        auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](auto ec)
                               {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (!ec) std::make_shared<Session>(std::move(socket_), *this)->run();
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        HttpServer &server;

        Session(boost::asio::ip::tcp::socket &&s, HttpServer &sv)
            : socket(std::move(s)), server(sv) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](auto ec, auto)
                             {
                if (!ec) self->handle(); });
        }

        // keep response alive through async_write
        void respond(http::response<http::string_body> &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
            sp->set(http::field::server, "rig-marshal-beast");

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }

        void reply(http::status st, const nlohmann::json &body)
        {
            http::response<http::string_body> res{st, req.version()};
            res.set(http::field::content_type, "application/json");
            res.body() = body.dump();
            res.prepare_payload();
            respond(std::move(res));
        }

        void reply_empty(http::status st)
        {
            http::response<http::string_body> res{st, req.version()};
            res.prepare_payload();
            respond(std::move(res));
        }

        // Empty body reads as {}.
        nlohmann::json body_json() const
        {
            if (req.body().empty())
                return nlohmann::json::object();
            auto j = nlohmann::json::parse(req.body());
            if (!j.is_object())
                throw std::invalid_argument("body must be a JSON object");
            return j;
        }

        void handle()
        {
            using nlohmann::json;
            DeviceManager &mgr = server.manager_;
            const std::string target(req.target());
            const bool get = req.method() == http::verb::get;
            const bool post = req.method() == http::verb::post;

            try
            {
                // GET /health
                if (get && target == "/health")
                {
                    auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - server.start_).count();
                    return reply(http::status::ok, json{{"status", "ok"}, {"uptime_s", up}});
                }

                // GET /v1/devices
                if (get && target == "/v1/devices")
                {
                    json out = json::array();
                    for (const auto &kv : mgr.get_connected_devices())
                        out.push_back(device_to_json(kv.second));
                    return reply(http::status::ok, out);
                }

                // GET /v1/shimmer
                if (get && target == "/v1/shimmer")
                {
                    json out = json::array();
                    for (const auto &kv : mgr.get_shimmer_devices())
                        out.push_back(stream_to_json(kv.second));
                    return reply(http::status::ok, out);
                }

                // GET /v1/session/current
                if (get && target == "/v1/session/current")
                {
                    auto s = mgr.get_current_session();
                    if (!s)
                        return reply_empty(http::status::no_content);
                    return reply(http::status::ok, session_to_json(*s));
                }

                // GET /v1/sessions
                if (get && target == "/v1/sessions")
                {
                    json out = json::array();
                    for (const auto &s : mgr.get_session_history())
                        out.push_back(session_to_json(s));
                    return reply(http::status::ok, out);
                }

                // POST /v1/session/start
                // Body: { "session_id": "...", "record_shimmer"?, "record_video"?, "record_thermal"? }
                if (post && target == "/v1/session/start")
                {
                    auto body = body_json();
                    const std::string id = body.value("session_id", std::string());
                    if (id.empty())
                        return reply(http::status::bad_request,
                                     json{{"error", "missing fields"}, {"required", {"session_id"}}});
                    const bool ok = mgr.start_session(id, body.value("record_shimmer", true),
                                                      body.value("record_video", true),
                                                      body.value("record_thermal", true));
                    if (!ok)
                        return reply(http::status::conflict,
                                     json{{"error", "session not started"}, {"session_id", id}});
                    auto s = mgr.get_current_session();
                    return reply(http::status::created, s ? session_to_json(*s) : json{{"session_id", id}});
                }

                // POST /v1/session/stop
                if (post && target == "/v1/session/stop")
                {
                    if (!mgr.stop_session())
                        return reply(http::status::conflict, json{{"error", "no active session"}});
                    auto hist = mgr.get_session_history();
                    return reply(http::status::ok, hist.empty() ? json::object() : session_to_json(hist.back()));
                }

                // POST /v1/sync/flash
                if (post && target == "/v1/sync/flash")
                {
                    auto body = body_json();
                    std::optional<std::string> sync_id;
                    if (body.contains("sync_id") && !body["sync_id"].is_null())
                        sync_id = body["sync_id"].get<std::string>();
                    auto n = mgr.send_sync_flash(body.value("duration_ms", 200), sync_id);
                    return reply(http::status::ok, json{{"sent", n}});
                }

                // POST /v1/sync/beep
                if (post && target == "/v1/sync/beep")
                {
                    auto body = body_json();
                    std::optional<std::string> sync_id;
                    if (body.contains("sync_id") && !body["sync_id"].is_null())
                        sync_id = body["sync_id"].get<std::string>();
                    auto n = mgr.send_sync_beep(body.value("frequency_hz", 1000), body.value("duration_ms", 200),
                                                body.value("volume", 0.8), sync_id);
                    return reply(http::status::ok, json{{"sent", n}});
                }

                // POST /v1/devices/<id>/disconnect
                static const std::string kDevPrefix = "/v1/devices/";
                static const std::string kDisconnect = "/disconnect";
                if (post && target.rfind(kDevPrefix, 0) == 0 && target.size() > kDevPrefix.size() + kDisconnect.size() &&
                    target.compare(target.size() - kDisconnect.size(), kDisconnect.size(), kDisconnect) == 0)
                {
                    const std::string id = target.substr(kDevPrefix.size(),
                                                         target.size() - kDevPrefix.size() - kDisconnect.size());
                    if (!mgr.disconnect_device(id))
                        return reply(http::status::not_found, json{{"error", "unknown device"}, {"device_id", id}});
                    return reply(http::status::ok, json{{"status", "ok"}, {"device_id", id}});
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                return reply(http::status::bad_request, json{{"error", "bad json"}, {"what", e.what()}});
            }
            catch (const std::invalid_argument &e)
            {
                return reply(http::status::bad_request, json{{"error", "bad json"}, {"what", e.what()}});
            }
            catch (const std::exception &e)
            {
                server.log_.error("http " + target + ": " + e.what());
                return reply(http::status::internal_server_error, json{{"error", "internal"}, {"what", e.what()}});
            }

            // 404 fallback
            reply(http::status::not_found, json{{"error", "not found"}});
        }
    };
};
