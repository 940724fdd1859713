/*
 * File: src/rig_server.hpp
 * Project: Rig Marshal
 * Purpose: Device TCP server: acceptor, per-connection handler, heartbeat sweep
 * Notes:
 *  - Frames are a 4-byte big-endian length followed by UTF-8 JSON
 *  - Reads and writes are both bounded by read_timeout
 *  - Messages before hello are dropped
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include <poll.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "common/wire.hpp"
#include "rig_registry.hpp"
#include "rig_state.hpp"

namespace net = boost::asio;
namespace beast = boost::beast;
using tcp = boost::asio::ip::tcp;

class ConnectionServer;

// One accepted device socket. Reads run as an async chain on the
// connection's strand, so frames from one device are handled in order.
// Writes are synchronous, may come from any thread, and give up after
// read_timeout; a peer that stops reading is treated as a write error.
class TcpConnection : public DeviceLink, public std::enable_shared_from_this<TcpConnection>
{
public:
    enum class State
    {
        kAwaitingHello,
        kRegistered,
        kClosed,
    };

    TcpConnection(tcp::socket &&socket, ConnectionServer &server);

    void run();

    bool send(const std::string &frame) override;
    void close() override;
    std::string peer() const override { return peer_; }

    State state() const { return state_.load(); }
    const std::string &device_id() const { return device_id_; }

private:
    void do_read_header();
    void on_header(beast::error_code ec, std::size_t);
    void on_body(beast::error_code ec, std::size_t);
    void handle(Message msg);
    void finish(DisconnectReason reason);

    beast::tcp_stream stream_;
    ConnectionServer &server_;
    std::array<uint8_t, kFrameHeaderBytes> header_{};
    std::string body_;
    std::atomic<State> state_{State::kAwaitingHello};
    std::string device_id_; // written once, on the read strand
    std::string peer_;
    std::mutex send_mtx_;
    std::mutex fd_mtx_;
    bool fd_closed_ = false;
};


class ConnectionServer
{
public:
    using Clock = std::chrono::steady_clock;
    using ConnectedFn = std::function<void(const ConnectedDevice &)>;
    using DisconnectedFn = std::function<void(const ConnectedDevice &, DisconnectReason)>;
    using MessageFn = std::function<void(const std::string &, const Message &)>;

    ConnectionServer(HubConfig config, Logger &log)
        : config_(std::move(config)),
          log_(log),
          registry_(log),
          connected_(log, "device"),
          disconnected_(log, "disconnect"),
          messages_(log, "message"),
          ioc_(config_.io_threads),
          strand_(net::make_strand(ioc_)),
          acceptor_(strand_),
          heartbeat_(strand_)
    {
        registry_.set_removal_handler([this](const ConnectedDevice &dev, DisconnectReason reason)
                                      { disconnected_.notify(dev, reason); });
        log_.info("ConnectionServer initialized for port " + std::to_string(config_.port));
    }

    ~ConnectionServer() { stop(); }

    ConnectionServer(const ConnectionServer &) = delete;
    ConnectionServer &operator=(const ConnectionServer &) = delete;

    // Binds and starts the worker threads. A bind failure is the one fatal
    // error: it is logged and reported as false.
    bool start()
    {
        std::scoped_lock lk(lifecycle_mtx_);
        if (running_)
        {
            log_.warn("server already running");
            return true;
        }
        std::string why;
        if (!config_.validate(&why))
        {
            log_.error("invalid server config: " + why);
            return false;
        }

        boost::system::error_code ec;
        auto addr = net::ip::make_address(config_.bind_address, ec);
        if (ec)
        {
            log_.error("bad bind address " + config_.bind_address + ": " + ec.message());
            return false;
        }
        tcp::endpoint ep{addr, config_.port};
        ioc_.restart();

        auto fail = [&](const char *step)
        {
            log_.error(std::string("Failed to start server (") + step + "): " + ec.message());
            boost::system::error_code ignored;
            acceptor_.close(ignored);
            return false;
        };
        acceptor_.open(ep.protocol(), ec);
        if (ec)
            return fail("open");
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec)
            return fail("reuse_address");
        acceptor_.bind(ep, ec);
        if (ec)
            return fail("bind");
        acceptor_.listen(config_.backlog, ec);
        if (ec)
            return fail("listen");
        port_ = acceptor_.local_endpoint(ec).port();

        running_ = true;
        work_.emplace(net::make_work_guard(ioc_));
        net::post(strand_, [this]
                  { do_accept(); arm_heartbeat(); });
        {
            std::scoped_lock elk(exit_mtx_);
            live_threads_ = config_.io_threads;
        }
        for (int i = 0; i < config_.io_threads; ++i)
            threads_.emplace_back([this]
                                  { run_worker(); });

        log_.info("server listening on " + config_.bind_address + ":" + std::to_string(port_));
        return true;
    }

    // Stops accepting, disconnects every device through the normal path,
    // then joins the workers (bounded by shutdown_timeout). Safe to repeat.
    // Must not be called from a server callback.
    void stop()
    {
        std::scoped_lock lk(lifecycle_mtx_);
        if (!running_.exchange(false))
            return;
        log_.info("Stopping server...");

        net::post(strand_, [this]
                  {
            boost::system::error_code ignored;
            acceptor_.close(ignored);
            heartbeat_.cancel(); });

        for (const auto &id : registry_.ids())
            registry_.unregister(id, DisconnectReason::kShutdown);

        std::vector<std::shared_ptr<TcpConnection>> pending;
        {
            std::scoped_lock clk(conns_mtx_);
            for (auto &kv : conns_)
                if (auto c = kv.second.lock())
                    pending.push_back(std::move(c));
        }
        for (auto &c : pending)
            c->close();
        pending.clear();

        work_.reset();
        {
            std::unique_lock elk(exit_mtx_);
            if (!exit_cv_.wait_for(elk, config_.shutdown_timeout, [this]
                                   { return live_threads_ == 0; }))
            {
                log_.warn("io threads still busy after shutdown timeout; forcing stop");
                ioc_.stop();
            }
        }
        for (auto &t : threads_)
            if (t.joinable())
                t.join();
        threads_.clear();

        boost::system::error_code ignored;
        acceptor_.close(ignored);
        {
            std::scoped_lock clk(conns_mtx_);
            conns_.clear();
        }
        log_.info("server stopped");
    }

    bool running() const { return running_.load(); }
    uint16_t port() const { return port_; }
    const HubConfig &config() const { return config_; }
    Logger &log() { return log_; }
    DeviceRegistry &registry() { return registry_; }
    net::io_context &io_context() { return ioc_; }

    void add_connected_callback(ConnectedFn fn) { connected_.add(std::move(fn)); }
    void add_disconnected_callback(DisconnectedFn fn) { disconnected_.add(std::move(fn)); }
    void add_message_callback(MessageFn fn) { messages_.add(std::move(fn)); }

    // Unknown device, unencodable message or failed write -> false.
    bool send(const std::string &device_id, const Message &m)
    {
        const auto frame = encode(m);
        if (!frame)
            return false;
        const bool ok = registry_.send(device_id, *frame);
        if (ok)
            log_.debug("Sent " + message_type(m) + " to " + device_id);
        return ok;
    }

    std::size_t broadcast(const Message &m, std::vector<std::string> *delivered = nullptr)
    {
        const auto frame = encode(m);
        if (!frame)
            return 0;
        return registry_.broadcast(*frame, delivered);
    }

    bool disconnect(const std::string &device_id, DisconnectReason reason = DisconnectReason::kAdministrative)
    {
        return registry_.unregister(device_id, reason);
    }

    std::vector<ConnectedDevice> connected_devices() const { return registry_.snapshot(); }

    // Handshake entry point. A device id already held by another link is
    // evicted first (the device reconnected before its old socket died).
    bool admit(const HelloMsg &hello, std::shared_ptr<DeviceLink> link)
    {
        ConnectedDevice dev;
        dev.device_id = hello.device_id;
        dev.capabilities.insert(hello.capabilities.begin(), hello.capabilities.end());
        dev.connection_time = std::chrono::system_clock::now();
        dev.last_heartbeat = Clock::now();
        dev.address = link ? link->peer() : std::string();
        dev.link = std::move(link);
        dev.connection = ++next_connection_;

        if (!registry_.register_device(dev))
        {
            log_.warn("device id " + dev.device_id + " already connected; replacing old connection");
            registry_.unregister(dev.device_id, DisconnectReason::kReplaced);
            if (!registry_.register_device(dev))
            {
                log_.error("could not register " + dev.device_id + " after eviction");
                return false;
            }
        }

        std::string caps;
        for (const auto &c : dev.capabilities)
            caps += (caps.empty() ? "" : ",") + c;
        log_.info("Device registered: " + dev.device_id + " with capabilities: [" + caps + "]");
        connected_.notify(dev);
        return true;
    }

    // Every decoded message of a registered device comes through here.
    void deliver(const std::string &device_id, const Message &m)
    {
        if (!registry_.touch(device_id))
            return;
        log_.debug("Received " + message_type(m) + " from " + device_id);
        messages_.notify(device_id, m);
    }

    std::vector<std::string> sweep_heartbeats(Clock::time_point now = Clock::now())
    {
        return registry_.sweep(now, config_.heartbeat_timeout);
    }

private:
    friend class TcpConnection;

    // Non-UTF-8 strings and oversized payloads are rejected here rather than
    // thrown at the caller.
    std::optional<std::string> encode(const Message &m)
    {
        try
        {
            return encode_frame(m, config_.max_frame_bytes);
        }
        catch (const nlohmann::json::exception &e)
        {
            log_.error("cannot encode " + message_type(m) + ": " + e.what());
        }
        catch (const std::length_error &e)
        {
            log_.error("cannot encode " + message_type(m) + ": " + e.what());
        }
        return std::nullopt;
    }

    void run_worker()
    {
        for (;;)
        {
            try
            {
                ioc_.run();
                break;
            }
            catch (const std::exception &e)
            {
                log_.error(std::string("io thread error: ") + e.what());
            }
        }
        {
            std::scoped_lock elk(exit_mtx_);
            --live_threads_;
        }
        exit_cv_.notify_all();
    }

    void do_accept()
    {
        acceptor_.async_accept(net::make_strand(ioc_), [this](beast::error_code ec, tcp::socket socket)
                               {
            if (ec)
            {
                if (ec == net::error::operation_aborted || !running_)
                    return;
                log_.error("accept failed: " + ec.message());
            }
            else
            {
                auto conn = std::make_shared<TcpConnection>(std::move(socket), *this);
                {
                    std::scoped_lock clk(conns_mtx_);
                    conns_[conn.get()] = conn;
                }
                log_.info("New connection from " + conn->peer());
                conn->run();
            }
            if (running_)
                do_accept(); });
    }

    void arm_heartbeat()
    {
        heartbeat_.expires_after(config_.heartbeat_interval);
        heartbeat_.async_wait([this](beast::error_code ec)
                              {
            if (ec || !running_)
                return;
            sweep_heartbeats();
            arm_heartbeat(); });
    }

    void forget(const TcpConnection *c)
    {
        std::scoped_lock clk(conns_mtx_);
        conns_.erase(c);
    }

    HubConfig config_;
    Logger &log_;
    DeviceRegistry registry_;
    ObserverList<ConnectedDevice> connected_;
    ObserverList<ConnectedDevice, DisconnectReason> disconnected_;
    ObserverList<std::string, Message> messages_;

    net::io_context ioc_;
    net::strand<net::io_context::executor_type> strand_; // acceptor + heartbeat timer
    tcp::acceptor acceptor_;
    net::steady_timer heartbeat_;
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    uint16_t port_ = 0;
    std::atomic<uint64_t> next_connection_{0};
    std::mutex lifecycle_mtx_;

    std::mutex conns_mtx_;
    std::map<const TcpConnection *, std::weak_ptr<TcpConnection>> conns_;

    std::mutex exit_mtx_;
    std::condition_variable exit_cv_;
    int live_threads_ = 0;
};


// -------- TcpConnection --------

inline TcpConnection::TcpConnection(tcp::socket &&socket, ConnectionServer &server)
    : stream_(std::move(socket)), server_(server)
{
    boost::system::error_code ec;
    auto ep = stream_.socket().remote_endpoint(ec);
    peer_ = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
    stream_.socket().set_option(tcp::no_delay(true), ec);
    // sync writes return would_block instead of parking in the kernel
    stream_.socket().non_blocking(true, ec);
}

// Waits until fd accepts more bytes or the deadline passes.
inline bool wait_writable(int fd, std::chrono::steady_clock::time_point deadline)
{
    for (;;)
    {
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0)
            return false;
        pollfd p{fd, POLLOUT, 0};
        const int r = ::poll(&p, 1, static_cast<int>(left.count()));
        if (r > 0)
            return true;
        if (r < 0 && errno != EINTR)
            return false;
    }
}

inline void TcpConnection::run()
{
    net::dispatch(stream_.get_executor(), beast::bind_front_handler(&TcpConnection::do_read_header, shared_from_this()));
}

inline void TcpConnection::do_read_header()
{
    stream_.expires_after(server_.config().read_timeout);
    net::async_read(stream_, net::buffer(header_),
                    beast::bind_front_handler(&TcpConnection::on_header, shared_from_this()));
}

inline DisconnectReason read_failure_reason(const beast::error_code &ec)
{
    if (ec == beast::error::timeout)
        return DisconnectReason::kReadTimeout;
    if (ec == net::error::eof || ec == net::error::connection_reset)
        return DisconnectReason::kPeerClosed;
    return DisconnectReason::kReadError;
}

inline void TcpConnection::on_header(beast::error_code ec, std::size_t)
{
    if (ec)
        return finish(read_failure_reason(ec));

    const uint32_t n = read_frame_length(header_);
    if (!frame_length_ok(n, server_.config().max_frame_bytes))
    {
        server_.log().error("Invalid message length " + std::to_string(n) + " from " + peer_);
        return finish(DisconnectReason::kProtocolError);
    }
    body_.resize(n);
    stream_.expires_after(server_.config().read_timeout);
    net::async_read(stream_, net::buffer(body_),
                    beast::bind_front_handler(&TcpConnection::on_body, shared_from_this()));
}

inline void TcpConnection::on_body(beast::error_code ec, std::size_t)
{
    if (ec)
        return finish(read_failure_reason(ec));

    DecodeResult r = decode_message(body_);
    if (!r)
        server_.log().warn("Failed to parse message from " + peer_ + ": " + to_string(r.error) + " (" + r.detail + ")");
    else
        handle(std::move(*r.message));

    if (state_ != State::kClosed)
        do_read_header();
}

inline void TcpConnection::handle(Message msg)
{
    if (auto *hello = std::get_if<HelloMsg>(&msg))
    {
        if (state_ == State::kAwaitingHello)
        {
            if (!server_.admit(*hello, shared_from_this()))
                return finish(DisconnectReason::kProtocolError);
            device_id_ = hello->device_id;
            state_ = State::kRegistered;
        }
        else
        {
            server_.log().debug("duplicate hello from " + device_id_ + " ignored");
        }
    }

    if (state_ != State::kRegistered)
    {
        server_.log().warn("dropping " + message_type(msg) + " from " + peer_ + ": no hello yet");
        return;
    }
    server_.deliver(device_id_, msg);
}

inline bool TcpConnection::send(const std::string &frame)
{
    std::scoped_lock lk(send_mtx_);
    {
        std::scoped_lock flk(fd_mtx_);
        if (fd_closed_)
            return false;
    }
    auto &sock = stream_.socket();
    const auto deadline = std::chrono::steady_clock::now() + server_.config().read_timeout;
    std::size_t sent = 0;
    while (sent < frame.size())
    {
        beast::error_code ec;
        sent += sock.write_some(net::buffer(frame.data() + sent, frame.size() - sent), ec);
        if (ec == net::error::would_block || ec == net::error::try_again)
        {
            if (!wait_writable(sock.native_handle(), deadline))
            {
                server_.log().warn("write to " + peer_ + " timed out after " +
                                   std::to_string(sent) + "/" + std::to_string(frame.size()) + " bytes");
                return false;
            }
        }
        else if (ec)
        {
            server_.log().warn("write to " + peer_ + " failed: " + ec.message());
            return false;
        }
    }
    return true;
}

inline void TcpConnection::close()
{
    std::scoped_lock flk(fd_mtx_);
    if (fd_closed_)
        return;
    // shutdown only; the read chain sees the error and releases the socket
    beast::error_code ec;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
}

inline void TcpConnection::finish(DisconnectReason reason)
{
    const State prev = state_.exchange(State::kClosed);
    if (prev == State::kClosed)
        return;

    if (prev == State::kRegistered)
        server_.registry().unregister(device_id_, reason, this);
    else
        server_.log().info("connection from " + peer_ + " closed before hello (" + to_string(reason) + ")");

    close();
    {
        std::scoped_lock lk(send_mtx_, fd_mtx_);
        beast::error_code ec;
        stream_.socket().close(ec);
        fd_closed_ = true;
    }
    server_.forget(this);
}
