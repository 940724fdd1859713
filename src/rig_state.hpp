/*
 * File: src/rig_state.hpp
 * Project: Rig Marshal
 * Purpose: Shared configuration, logging and device records
 * Notes:
 *  - Logger writes "[tag] LEVEL: msg" to stderr unless a sink is set
 *  - ObserverList isolates throwing callbacks
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <exception>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/wire.hpp"


struct HubConfig
{
    std::string bind_address{"0.0.0.0"};
    uint16_t port{9000}; // 0 picks an ephemeral port
    int backlog{5};
    std::chrono::milliseconds read_timeout{30000};
    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds heartbeat_timeout{60000};
    std::chrono::milliseconds data_timeout{60000};
    std::chrono::milliseconds shutdown_timeout{5000};
    uint32_t max_frame_bytes{kMaxFrameBytes};
    int io_threads{2};
    std::string data_dir{"/data"};
    std::string http_bind{"0.0.0.0:8080"};
    std::string ws_bind{"0.0.0.0:8090"};

    bool validate(std::string *error = nullptr) const
    {
        auto fail = [&](const char *what)
        {
            if (error)
                *error = what;
            return false;
        };
        if (bind_address.empty())
            return fail("bind_address is empty");
        if (backlog <= 0)
            return fail("backlog must be positive");
        if (read_timeout.count() <= 0)
            return fail("read_timeout must be positive");
        if (heartbeat_interval.count() <= 0)
            return fail("heartbeat_interval must be positive");
        if (heartbeat_timeout < heartbeat_interval)
            return fail("heartbeat_timeout must be >= heartbeat_interval");
        if (max_frame_bytes == 0)
            return fail("max_frame_bytes must be positive");
        if (io_threads <= 0)
            return fail("io_threads must be positive");
        if (shutdown_timeout.count() <= 0)
            return fail("shutdown_timeout must be positive");
        return true;
    }
};


// RFC3339 UTC with milliseconds (e.g., 2025-09-12T14:59:01.234Z)
inline std::string iso8601_ms(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;
    auto ms = duration_cast<milliseconds>(tp.time_since_epoch()) % 1000;
    if (ms.count() < 0)
        ms += milliseconds(1000);
    std::time_t tt = system_clock::to_time_t(time_point_cast<system_clock::duration>(tp - ms));
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

inline int64_t epoch_ms(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(tp.time_since_epoch()).count();
}


enum class LogLevel
{
    kDebug,
    kInfo,
    kWarn,
    kError,
};

inline const char *to_string(LogLevel l)
{
    switch (l)
    {
    case LogLevel::kDebug:
        return "DEBUG";
    case LogLevel::kInfo:
        return "INFO";
    case LogLevel::kWarn:
        return "WARN";
    case LogLevel::kError:
        return "ERROR";
    }
    return "?";
}

// Line logger handed to every component; writes "[tag] LEVEL: msg" to stderr
// unless a sink is installed.
class Logger
{
public:
    using Sink = std::function<void(LogLevel, const std::string &)>;

    explicit Logger(std::string tag = "rig", LogLevel min = LogLevel::kInfo, Sink sink = {})
        : tag_(std::move(tag)), min_(min), sink_(std::move(sink)) {}

    void set_level(LogLevel l)
    {
        std::scoped_lock lk(m_);
        min_ = l;
    }

    void log(LogLevel l, const std::string &msg)
    {
        std::scoped_lock lk(m_);
        if (l < min_)
            return;
        if (sink_)
        {
            sink_(l, msg);
            return;
        }
        std::cerr << "[" << tag_ << "] " << to_string(l) << ": " << msg << "\n";
    }

    void debug(const std::string &msg) { log(LogLevel::kDebug, msg); }
    void info(const std::string &msg) { log(LogLevel::kInfo, msg); }
    void warn(const std::string &msg) { log(LogLevel::kWarn, msg); }
    void error(const std::string &msg) { log(LogLevel::kError, msg); }

private:
    std::mutex m_;
    std::string tag_;
    LogLevel min_;
    Sink sink_;
};


// Opaque connection handle the registry sends through. TcpConnection is the
// real one; tests plug in fakes.
class DeviceLink
{
public:
    virtual ~DeviceLink() = default;
    // Write one complete frame. false means the link is dead.
    virtual bool send(const std::string &frame) = 0;
    // Idempotent. Unblocks any pending read.
    virtual void close() = 0;
    virtual std::string peer() const = 0;
};


struct ConnectedDevice
{
    std::string device_id;
    std::set<std::string> capabilities;
    std::chrono::system_clock::time_point connection_time;
    std::chrono::steady_clock::time_point last_heartbeat;
    nlohmann::json status = nlohmann::json::object(); // battery, storage, temperature, recording, connected
    std::shared_ptr<DeviceLink> link;
    std::string address;
    uint64_t connection = 0; // per-admission id; a reconnect gets a new one
};


enum class DisconnectReason
{
    kPeerClosed,
    kReadTimeout,
    kReadError,
    kProtocolError,
    kWriteError,
    kHeartbeatTimeout,
    kAdministrative,
    kReplaced,
    kShutdown,
};

inline const char *to_string(DisconnectReason r)
{
    switch (r)
    {
    case DisconnectReason::kPeerClosed:
        return "peer closed";
    case DisconnectReason::kReadTimeout:
        return "read timeout";
    case DisconnectReason::kReadError:
        return "read error";
    case DisconnectReason::kProtocolError:
        return "protocol error";
    case DisconnectReason::kWriteError:
        return "write error";
    case DisconnectReason::kHeartbeatTimeout:
        return "heartbeat timeout";
    case DisconnectReason::kAdministrative:
        return "administrative";
    case DisconnectReason::kReplaced:
        return "replaced by new connection";
    case DisconnectReason::kShutdown:
        return "shutdown";
    }
    return "unknown";
}


// Mutex-guarded callback list. notify() runs every observer in registration
// order on the calling thread; a throwing observer is logged and skipped.
template <typename... Args>
class ObserverList
{
public:
    using Fn = std::function<void(const Args &...)>;

    ObserverList(Logger &log, std::string name) : log_(log), name_(std::move(name)) {}

    void add(Fn fn)
    {
        std::scoped_lock lk(m_);
        fns_.push_back(std::move(fn));
    }

    std::size_t size() const
    {
        std::scoped_lock lk(m_);
        return fns_.size();
    }

    // Returns how many observers threw.
    std::size_t notify(const Args &...args) const
    {
        std::vector<Fn> fns;
        {
            std::scoped_lock lk(m_);
            fns = fns_;
        }
        std::size_t failures = 0;
        for (auto &fn : fns)
        {
            try
            {
                fn(args...);
            }
            catch (const std::exception &e)
            {
                ++failures;
                log_.error("error in " + name_ + " callback: " + e.what());
            }
            catch (...)
            {
                ++failures;
                log_.error("error in " + name_ + " callback: non-standard exception");
            }
        }
        return failures;
    }

private:
    mutable std::mutex m_;
    std::vector<Fn> fns_;
    Logger &log_;
    std::string name_;
};
