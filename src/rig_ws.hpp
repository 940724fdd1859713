/*
 * File: src/rig_ws.hpp
 * Project: Rig Marshal
 * Purpose: WebSocket event stream for dashboards and loggers
 * Notes:
 *  - Every event is one text frame {"topic": ..., "payload": {...}}
 *  - Writes are queued per client strand; slow clients are dropped
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "rig_state.hpp"

namespace websocket = boost::beast::websocket;

// Each event is one text frame {"topic": ..., "payload": {...}}. Clients are
// read-only; whatever they send is discarded.
class WsServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    Logger &log_;

    struct Session;
    std::mutex clients_mtx_;
    std::map<Session *, std::weak_ptr<Session>> clients_;

public:
    static constexpr std::size_t kMaxQueuedEvents = 1024;

    WsServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, Logger &log)
        : ioc_(ioc), acceptor_(ioc), log_(log)
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
            log_.error("ws: failed to listen on " + ep.address().to_string() + ":" +
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

    std::size_t client_count()
    {
        std::scoped_lock lk(clients_mtx_);
        return clients_.size();
    }

    // Callable from any thread; writes happen on each client's strand.
    void broadcast(const std::string &topic, const nlohmann::json &payload)
    {
        broadcast_raw(nlohmann::json{{"topic", topic}, {"payload", payload}}.dump());
    }

    void broadcast_raw(const std::string &msg)
    {
        std::vector<std::shared_ptr<Session>> targets;
        {
            std::scoped_lock lk(clients_mtx_);
            for (auto it = clients_.begin(); it != clients_.end();)
            {
                if (auto s = it->second.lock())
                {
                    targets.push_back(std::move(s));
                    ++it;
                }
                else
                    it = clients_.erase(it);
            }
        }
        auto shared = std::make_shared<const std::string>(msg);
        for (auto &s : targets)
            s->send(shared);
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(boost::asio::make_strand(ioc_), [this](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket)
                               {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (!ec) std::make_shared<Session>(std::move(socket), *this)->run();
            do_accept(); });
    }

    void add(const std::shared_ptr<Session> &s)
    {
        std::scoped_lock lk(clients_mtx_);
        clients_[s.get()] = s;
    }

    void drop(Session *s)
    {
        std::scoped_lock lk(clients_mtx_);
        clients_.erase(s);
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        websocket::stream<boost::beast::tcp_stream> ws;
        boost::beast::flat_buffer buffer;
        WsServer &server;
        std::deque<std::shared_ptr<const std::string>> queue; // strand only
        bool closed = false;

        Session(boost::asio::ip::tcp::socket &&s, WsServer &sv)
            : ws(std::move(s)), server(sv) {}

        void run()
        {
            boost::asio::dispatch(ws.get_executor(), [self = shared_from_this()]
                                  { self->on_run(); });
        }

        void on_run()
        {
            ws.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
            ws.text(true);
            ws.async_accept([self = shared_from_this()](boost::beast::error_code ec)
                            {
                if (ec)
                {
                    self->server.log_.debug("ws: handshake failed: " + ec.message());
                    return;
                }
                self->server.add(self);
                self->do_read(); });
        }

        void do_read()
        {
            ws.async_read(buffer, [self = shared_from_this()](boost::beast::error_code ec, std::size_t)
                          {
                if (ec)
                    return self->fail(ec);
                self->buffer.consume(self->buffer.size());
                self->do_read(); });
        }

        void send(std::shared_ptr<const std::string> msg)
        {
            boost::asio::post(ws.get_executor(), [self = shared_from_this(), msg = std::move(msg)]
                              {
                if (self->closed)
                    return;
                if (self->queue.size() >= kMaxQueuedEvents)
                {
                    self->server.log_.warn("ws: client too slow, dropping it");
                    self->closed = true;
                    self->server.drop(self.get());
                    boost::beast::get_lowest_layer(self->ws).close();
                    return;
                }
                self->queue.push_back(msg);
                if (self->queue.size() == 1)
                    self->do_write(); });
        }

        void do_write()
        {
            ws.async_write(boost::asio::buffer(*queue.front()),
                           [self = shared_from_this()](boost::beast::error_code ec, std::size_t)
                           {
                // the front buffer is released only here, once the write is done with it
                if (!self->queue.empty())
                    self->queue.pop_front();
                if (ec || self->closed)
                {
                    self->queue.clear();
                    if (ec)
                        self->fail(ec);
                    return;
                }
                if (!self->queue.empty())
                    self->do_write(); });
        }

        // Leaves the queue alone: an async_write may still be reading from
        // its front. The write handler clears it.
        void fail(boost::beast::error_code ec)
        {
            if (closed)
                return;
            closed = true;
            server.drop(this);
            if (ec != websocket::error::closed && ec != boost::asio::error::operation_aborted)
                server.log_.debug("ws: client dropped: " + ec.message());
        }
    };
};
