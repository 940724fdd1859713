/*
 * File: src/rig_manager.hpp
 * Project: Rig Marshal
 * Purpose: Device manager: session orchestration, sync signals, data routing
 * Notes:
 *  - Callbacks fire after the manager lock is released
 *  - One active session at a time; start/stop are serialized
 * Last updated: 2026-10-18
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/wire.hpp"
#include "rig_server.hpp"
#include "rig_state.hpp"
#include "rig_transfer.hpp"


struct ShimmerDataSample
{
    double timestamp = 0;
    std::string device_id; // sensor stream, "<android id>:shimmer"
    std::string android_device_id;
    std::map<std::string, double> sensor_values;
    std::optional<std::string> session_id;
};

struct ShimmerStream
{
    std::string stream_id;
    std::string android_device_id;
    uint64_t samples = 0;
    std::map<std::string, double> last_values;
    double last_timestamp = 0;
};

struct SessionInfo
{
    std::string session_id;
    std::chrono::system_clock::time_point start_time;
    std::optional<std::chrono::system_clock::time_point> end_time;
    std::set<std::string> participating_devices;
    std::set<std::string> dropped_devices; // left before the session ended
    std::set<std::string> shimmer_devices;
    uint64_t data_samples = 0;
    std::map<std::string, std::vector<std::string>> files_collected;

    bool active() const { return !end_time.has_value(); }

    double duration_s() const
    {
        auto end = end_time.value_or(std::chrono::system_clock::now());
        return std::chrono::duration<double>(end - start_time).count();
    }
};

struct AndroidDevice
{
    std::string device_id;
    std::set<std::string> capabilities;
    std::chrono::system_clock::time_point connection_time;
    std::chrono::steady_clock::time_point last_heartbeat;
    nlohmann::json status = nlohmann::json::object();
    std::string address;
    uint64_t connection = 0;

    uint64_t messages_received = 0;
    uint64_t messages_sent = 0;
    uint64_t data_samples_received = 0;
    uint64_t acks_received = 0;
    uint64_t ack_errors = 0;
    std::optional<double> last_data_timestamp;

    bool is_recording = false;
    std::optional<std::string> current_session_id;

    std::map<std::string, ShimmerStream> shimmer_streams;
    std::map<std::string, TransferProgress> pending_files;

    bool has_capability(const std::string &c) const { return capabilities.count(c) != 0; }
};


// -------- JSON views (HTTP, WS, session records) --------

inline nlohmann::json session_to_json(const SessionInfo &s)
{
    using nlohmann::json;
    json files = json::object();
    for (const auto &[dev, names] : s.files_collected)
        files[dev] = names;
    json j{
        {"session_id", s.session_id},
        {"start_time", iso8601_ms(s.start_time)},
        {"end_time", s.end_time ? json(iso8601_ms(*s.end_time)) : json(nullptr)},
        {"duration_s", s.duration_s()},
        {"active", s.active()},
        {"participating_devices", s.participating_devices},
        {"dropped_devices", s.dropped_devices},
        {"shimmer_devices", s.shimmer_devices},
        {"data_samples", s.data_samples},
        {"files_collected", files}};
    return j;
}

inline nlohmann::json device_to_json(const AndroidDevice &d)
{
    using nlohmann::json;
    json pending = json::object();
    for (const auto &[name, p] : d.pending_files)
        pending[name] = json{{"expected_size", p.expected_size},
                             {"received_bytes", p.received_bytes},
                             {"chunks", p.chunk_count},
                             {"start_time", iso8601_ms(p.start_time)}};
    return json{
        {"device_id", d.device_id},
        {"capabilities", d.capabilities},
        {"address", d.address},
        {"connection_time", iso8601_ms(d.connection_time)},
        {"status", d.status},
        {"messages_received", d.messages_received},
        {"messages_sent", d.messages_sent},
        {"data_samples_received", d.data_samples_received},
        {"acks_received", d.acks_received},
        {"ack_errors", d.ack_errors},
        {"is_recording", d.is_recording},
        {"current_session_id", d.current_session_id ? json(*d.current_session_id) : json(nullptr)},
        {"pending_files", pending}};
}

inline nlohmann::json sample_to_json(const ShimmerDataSample &s)
{
    using nlohmann::json;
    return json{
        {"timestamp", s.timestamp},
        {"device_id", s.device_id},
        {"android_device_id", s.android_device_id},
        {"sensor_values", s.sensor_values},
        {"session_id", s.session_id ? json(*s.session_id) : json(nullptr)}};
}

inline nlohmann::json stream_to_json(const ShimmerStream &s)
{
    return nlohmann::json{
        {"stream_id", s.stream_id},
        {"android_device_id", s.android_device_id},
        {"samples", s.samples},
        {"last_values", s.last_values},
        {"last_timestamp", s.last_timestamp}};
}

inline nlohmann::json transfer_to_json(const CompletedTransfer &t)
{
    using nlohmann::json;
    return json{
        {"device_id", t.device_id},
        {"name", t.name},
        {"expected_size", t.expected_size},
        {"size_bytes", t.bytes.size()},
        {"chunks", t.chunk_count},
        {"gaps", t.gaps},
        {"complete", t.complete()},
        {"session_id", t.session_id ? json(*t.session_id) : json(nullptr)},
        {"start_time", iso8601_ms(t.start_time)},
        {"end_time", iso8601_ms(t.end_time)}};
}


// Domain layer over ConnectionServer. The server must outlive the manager.
//
// Locking: m_ guards devices and sessions; session_op_mtx_ serializes
// start/stop. Broadcasts and callbacks always run with m_ released, since a
// failed send re-enters through the disconnect callback.
class DeviceManager
{
public:
    using DataFn = std::function<void(const ShimmerDataSample &)>;
    using StatusFn = std::function<void(const std::string &, const AndroidDevice &)>;
    using SessionFn = std::function<void(const SessionInfo &)>;
    using FileFn = std::function<void(const CompletedTransfer &)>;

    explicit DeviceManager(ConnectionServer &server)
        : server_(server),
          log_(server.log()),
          data_(log_, "data"),
          status_(log_, "status"),
          session_(log_, "session"),
          files_(log_, "file")
    {
        server_.add_connected_callback([this](const ConnectedDevice &dev)
                                       { on_device_connected(dev); });
        server_.add_disconnected_callback([this](const ConnectedDevice &dev, DisconnectReason)
                                          { on_device_disconnected(dev.device_id, dev.connection); });
        server_.add_message_callback([this](const std::string &id, const Message &m)
                                     { on_message(id, m); });
        log_.info("DeviceManager initialized");
    }

    ~DeviceManager() { shutdown(); }

    DeviceManager(const DeviceManager &) = delete;
    DeviceManager &operator=(const DeviceManager &) = delete;

    bool initialize()
    {
        if (initialized_)
            return true;
        log_.info("Initializing DeviceManager...");
        if (!server_.start())
        {
            log_.error("Failed to start device server");
            return false;
        }
        monitor_ = std::make_unique<net::steady_timer>(net::make_strand(server_.io_context()));
        arm_monitor();
        initialized_ = true;
        log_.info("DeviceManager initialized successfully");
        return true;
    }

    void shutdown()
    {
        if (!initialized_.exchange(false))
            return;
        log_.info("Shutting down DeviceManager...");
        if (get_current_session())
            stop_session();
        if (monitor_)
            net::post(monitor_->get_executor(), [t = monitor_.get()]
                      { t->cancel(); });
        for (const auto &id : device_ids())
            disconnect_device(id);
        server_.stop();
        monitor_.reset();
        log_.info("DeviceManager shutdown completed");
    }

    bool initialized() const { return initialized_.load(); }

    // Starts a session on every connected device. Succeeds if at least one
    // device received start_record; devices that did not stay idle.
    bool start_session(const std::string &session_id, bool record_shimmer = true,
                       bool record_video = true, bool record_thermal = true)
    {
        std::scoped_lock op(session_op_mtx_);
        if (session_id.empty())
        {
            log_.warn("refusing to start a session with an empty id");
            return false;
        }

        SessionInfo s;
        {
            std::scoped_lock lk(m_);
            if (current_)
            {
                log_.warn("Session already active: " + current_->session_id);
                return false;
            }
            s.session_id = session_id;
            s.start_time = std::chrono::system_clock::now();
            for (const auto &kv : devices_)
                s.participating_devices.insert(kv.first);
        }
        log_.info("Starting session: " + session_id);

        StartRecordCmd cmd;
        cmd.session_id = session_id;
        cmd.record_video = record_video;
        cmd.record_thermal = record_thermal;
        cmd.record_shimmer = record_shimmer;
        std::vector<std::string> delivered;
        const std::size_t n = server_.broadcast(cmd, &delivered);
        if (n == 0)
        {
            log_.error("Failed to start session " + session_id + " on any device");
            return false;
        }

        SessionInfo started;
        {
            std::scoped_lock lk(m_);
            for (const auto &id : s.participating_devices)
                if (!devices_.count(id))
                    s.dropped_devices.insert(id);
            current_ = s;
            for (const auto &id : delivered)
            {
                auto it = devices_.find(id);
                if (it == devices_.end())
                    continue;
                it->second.view.messages_sent++;
                it->second.view.is_recording = true;
                it->second.view.current_session_id = session_id;
            }
            started = *current_;
        }
        log_.info("Session " + session_id + " started on " + std::to_string(n) + " of " +
                  std::to_string(s.participating_devices.size()) + " devices");
        session_.notify(started);
        return true;
    }

    bool stop_session()
    {
        std::scoped_lock op(session_op_mtx_);
        std::string session_id;
        {
            std::scoped_lock lk(m_);
            if (!current_)
            {
                log_.warn("No active session to stop");
                return false;
            }
            session_id = current_->session_id;
        }
        log_.info("Stopping session: " + session_id);

        std::vector<std::string> delivered;
        const std::size_t n = server_.broadcast(StopRecordCmd{}, &delivered);

        SessionInfo done;
        std::vector<std::string> unfinished;
        {
            std::scoped_lock lk(m_);
            current_->end_time = std::chrono::system_clock::now();
            done = *current_;
            history_.push_back(done);
            current_.reset();
            for (auto &[id, rec] : devices_)
            {
                rec.view.is_recording = false;
                rec.view.current_session_id.reset();
                for (const auto &kv : rec.view.pending_files)
                    unfinished.push_back(id + "/" + kv.first);
            }
            for (const auto &id : delivered)
                if (auto it = devices_.find(id); it != devices_.end())
                    it->second.view.messages_sent++;
        }
        for (const auto &f : unfinished)
            log_.warn("session " + session_id + " ended with transfer still pending: " + f);
        log_.info("Session stopped: " + session_id + " (stop sent to " + std::to_string(n) + " devices, " +
                  std::to_string(done.data_samples) + " samples)");
        session_.notify(done);
        return true;
    }

    std::size_t send_sync_flash(int duration_ms = 200, std::optional<std::string> sync_id = std::nullopt)
    {
        FlashSyncCmd cmd;
        cmd.duration_ms = duration_ms;
        cmd.sync_id = std::move(sync_id);
        const std::size_t n = broadcast_counted(cmd);
        log_.info("Sent flash sync to " + std::to_string(n) + " devices");
        return n;
    }

    std::size_t send_sync_beep(int frequency_hz = 1000, int duration_ms = 200, double volume = 0.8,
                               std::optional<std::string> sync_id = std::nullopt)
    {
        BeepSyncCmd cmd;
        cmd.frequency_hz = frequency_hz;
        cmd.duration_ms = duration_ms;
        cmd.volume = volume;
        cmd.sync_id = std::move(sync_id);
        const std::size_t n = broadcast_counted(cmd);
        log_.info("Sent beep sync to " + std::to_string(n) + " devices");
        return n;
    }

    // Administrative removal; goes through the server's disconnect path so
    // the usual callbacks fire.
    bool disconnect_device(const std::string &device_id)
    {
        uint64_t connection = 0;
        {
            std::scoped_lock lk(m_);
            auto it = devices_.find(device_id);
            if (it == devices_.end())
            {
                log_.warn("Device not connected: " + device_id);
                return false;
            }
            connection = it->second.view.connection;
        }
        if (!server_.disconnect(device_id, DisconnectReason::kAdministrative))
            on_device_disconnected(device_id, connection); // registry already dropped it
        return true;
    }

    std::map<std::string, AndroidDevice> get_connected_devices() const
    {
        std::scoped_lock lk(m_);
        std::map<std::string, AndroidDevice> out;
        for (const auto &[id, rec] : devices_)
            out.emplace(id, rec.view);
        return out;
    }

    std::optional<AndroidDevice> get_device(const std::string &device_id) const
    {
        std::scoped_lock lk(m_);
        auto it = devices_.find(device_id);
        if (it == devices_.end())
            return std::nullopt;
        return it->second.view;
    }

    std::map<std::string, ShimmerStream> get_shimmer_devices() const
    {
        std::scoped_lock lk(m_);
        std::map<std::string, ShimmerStream> out;
        for (const auto &kv : devices_)
            for (const auto &[stream_id, stream] : kv.second.view.shimmer_streams)
                out.emplace(stream_id, stream);
        return out;
    }

    std::optional<SessionInfo> get_current_session() const
    {
        std::scoped_lock lk(m_);
        return current_;
    }

    std::vector<SessionInfo> get_session_history() const
    {
        std::scoped_lock lk(m_);
        return history_;
    }

    void add_data_callback(DataFn fn) { data_.add(std::move(fn)); }
    void add_status_callback(StatusFn fn) { status_.add(std::move(fn)); }
    void add_session_callback(SessionFn fn) { session_.add(std::move(fn)); }
    void add_file_callback(FileFn fn) { files_.add(std::move(fn)); }

    // One pass of the data-stream monitor; the timer calls this periodically.
    std::vector<std::string> check_data_streams(double now_s = wire_now())
    {
        std::vector<std::string> stale;
        std::optional<SessionInfo> session;
        const double limit = std::chrono::duration<double>(server_.config().data_timeout).count();
        {
            std::scoped_lock lk(m_);
            for (const auto &[id, rec] : devices_)
                if (rec.view.last_data_timestamp && now_s - *rec.view.last_data_timestamp > limit)
                    stale.push_back(id);
            session = current_;
        }
        for (const auto &id : stale)
            log_.warn("Device " + id + " data stream appears stale");
        if (session)
            log_.info("Session " + session->session_id + ": " + std::to_string(session->participating_devices.size()) +
                      " devices, " + std::to_string(session->data_samples) + " samples, " +
                      std::to_string(static_cast<long long>(session->duration_s())) + "s duration");
        return stale;
    }

private:
    struct DeviceRecord
    {
        AndroidDevice view;
        FileTransferAssembler transfers;
    };

    // Notifications gathered under m_ and fired after it is released.
    struct Outbox
    {
        std::optional<ShimmerDataSample> sample;
        std::optional<AndroidDevice> status;
        std::optional<CompletedTransfer> file;
        std::optional<nlohmann::json> registry_status;
    };

    std::vector<std::string> device_ids() const
    {
        std::scoped_lock lk(m_);
        std::vector<std::string> out;
        for (const auto &kv : devices_)
            out.push_back(kv.first);
        return out;
    }

    template <typename Cmd>
    std::size_t broadcast_counted(const Cmd &cmd)
    {
        std::vector<std::string> delivered;
        const std::size_t n = server_.broadcast(cmd, &delivered);
        std::scoped_lock lk(m_);
        for (const auto &id : delivered)
            if (auto it = devices_.find(id); it != devices_.end())
                it->second.view.messages_sent++;
        return n;
    }

    void arm_monitor()
    {
        monitor_->expires_after(server_.config().heartbeat_interval);
        monitor_->async_wait([this](const boost::system::error_code &ec)
                             {
            if (ec || !initialized_)
                return;
            check_data_streams();
            arm_monitor(); });
    }

    void on_device_connected(const ConnectedDevice &dev)
    {
        const std::string &id = dev.device_id;
        DeviceRecord rec{AndroidDevice{}, FileTransferAssembler(id)};
        rec.view.device_id = id;
        rec.view.capabilities = dev.capabilities;
        rec.view.connection_time = dev.connection_time;
        rec.view.last_heartbeat = dev.last_heartbeat;
        rec.view.status = dev.status;
        rec.view.address = dev.address;
        rec.view.connection = dev.connection;
        AndroidDevice view = rec.view;
        {
            std::scoped_lock lk(m_);
            auto it = devices_.find(id);
            if (it != devices_.end() && it->second.view.connection > dev.connection)
                return; // a newer connection already registered
            devices_.insert_or_assign(id, std::move(rec));
        }
        log_.info("Android device connected: " + id);
        if (view.has_capability("shimmer"))
            log_.info("Device " + id + " supports Shimmer integration");
        status_.notify(id, view);
    }

    // Only the record of that very connection is dropped: a late callback for
    // a replaced connection must not remove the device's new record.
    void on_device_disconnected(const std::string &id, uint64_t connection)
    {
        std::vector<PendingFileTransfer> orphans;
        {
            std::scoped_lock lk(m_);
            auto it = devices_.find(id);
            if (it == devices_.end())
                return;
            if (it->second.view.connection != connection)
            {
                log_.debug("stale disconnect for " + id + " ignored");
                return;
            }
            orphans = it->second.transfers.abandon();
            if (current_ && current_->participating_devices.count(id))
                current_->dropped_devices.insert(id);
            devices_.erase(it);
        }
        for (const auto &t : orphans)
            log_.warn("incomplete transfer dropped: " + id + "/" + t.name + " (" +
                      std::to_string(t.received_bytes) + "/" + std::to_string(t.expected_size) + " bytes)");
        log_.info("Android device disconnected: " + id);
    }

    void on_message(const std::string &id, const Message &msg)
    {
        Outbox out;
        {
            std::scoped_lock lk(m_);
            auto it = devices_.find(id);
            if (it == devices_.end())
            {
                log_.warn("Received message from unknown device: " + id);
                return;
            }
            DeviceRecord &rec = it->second;
            rec.view.messages_received++;
            rec.view.last_heartbeat = std::chrono::steady_clock::now();

            std::visit(overloaded{
                           [&](const StatusMsg &m) { on_status(rec, m, out); },
                           [&](const SensorDataMsg &m) { on_sensor_data(rec, m, out); },
                           [&](const FileInfoMsg &m) { on_file_info(rec, m); },
                           [&](const FileChunkMsg &m) { on_file_chunk(rec, m); },
                           [&](const FileEndMsg &m) { on_file_end(rec, m, out); },
                           [&](const AckMsg &m) { on_ack(rec, m); },
                           [&](const HelloMsg &) {},
                           [&](const GenericMsg &m)
                           { log_.debug("unhandled message type '" + m.type + "' from " + id); },
                           [&](const auto &m)
                           { log_.warn("unexpected " + message_type(Message{m}) + " from device " + id); }},
                       msg);
        }

        if (out.registry_status)
            server_.registry().update_status(id, *out.registry_status);
        if (out.status)
            status_.notify(id, *out.status);
        if (out.sample)
            data_.notify(*out.sample);
        if (out.file)
            files_.notify(*out.file);
    }

    void on_status(DeviceRecord &rec, const StatusMsg &m, Outbox &out)
    {
        using nlohmann::json;
        json fields{
            {"battery", m.battery ? json(*m.battery) : json(nullptr)},
            {"storage", m.storage ? json(*m.storage) : json(nullptr)},
            {"temperature", m.temperature ? json(*m.temperature) : json(nullptr)},
            {"recording", m.recording},
            {"connected", m.connected}};
        rec.view.status.update(fields);
        rec.view.is_recording = m.recording;
        if (m.recording && current_)
            rec.view.current_session_id = current_->session_id;
        else if (!m.recording)
            rec.view.current_session_id.reset();
        log_.debug("Status update from " + rec.view.device_id + ": " + fields.dump());
        out.registry_status = std::move(fields);
        out.status = rec.view;
    }

    void on_sensor_data(DeviceRecord &rec, const SensorDataMsg &m, Outbox &out)
    {
        const std::string &id = rec.view.device_id;
        ShimmerDataSample sample;
        sample.timestamp = m.timestamp > 0 ? m.timestamp : wire_now();
        sample.device_id = id + ":shimmer";
        sample.android_device_id = id;
        sample.sensor_values = m.values;
        if (current_)
            sample.session_id = current_->session_id;

        rec.view.data_samples_received++;
        rec.view.last_data_timestamp = sample.timestamp;
        auto &stream = rec.view.shimmer_streams[sample.device_id];
        stream.stream_id = sample.device_id;
        stream.android_device_id = id;
        stream.samples++;
        stream.last_values = m.values;
        stream.last_timestamp = sample.timestamp;

        if (current_)
        {
            current_->data_samples++;
            current_->shimmer_devices.insert(sample.device_id);
        }
        out.sample = std::move(sample);
    }

    void on_file_info(DeviceRecord &rec, const FileInfoMsg &m)
    {
        const std::string &id = rec.view.device_id;
        if (rec.transfers.begin(m))
            log_.warn("File transfer restarted by " + id + ": " + m.name);
        log_.info("File transfer started from " + id + ": " + m.name + " (" + std::to_string(m.size) + " bytes)");
        rec.view.pending_files = rec.transfers.progress();
    }

    void on_file_chunk(DeviceRecord &rec, const FileChunkMsg &m)
    {
        const std::string &id = rec.view.device_id;
        switch (rec.transfers.add_chunk(m))
        {
        case FileTransferAssembler::ChunkResult::kStored:
            log_.debug("File chunk " + std::to_string(m.seq) + " received from " + id);
            break;
        case FileTransferAssembler::ChunkResult::kReplaced:
            log_.debug("Duplicate file chunk " + std::to_string(m.seq) + " from " + id + " replaced");
            break;
        case FileTransferAssembler::ChunkResult::kNoActiveTransfer:
            log_.warn("File chunk " + std::to_string(m.seq) + " from " + id + " without file_info; dropped");
            break;
        case FileTransferAssembler::ChunkResult::kBadPayload:
            log_.warn("File chunk " + std::to_string(m.seq) + " from " + id + " is not valid base64; dropped");
            break;
        }
        rec.view.pending_files = rec.transfers.progress();
    }

    void on_file_end(DeviceRecord &rec, const FileEndMsg &m, Outbox &out)
    {
        const std::string &id = rec.view.device_id;
        auto done = rec.transfers.finish(m);
        rec.view.pending_files = rec.transfers.progress();
        if (!done)
        {
            log_.warn("file_end for unknown transfer from " + id + ": " + m.name);
            return;
        }
        if (current_)
        {
            done->session_id = current_->session_id;
            current_->files_collected[id].push_back(m.name);
        }
        log_.info("File transfer completed from " + id + ": " + m.name + " (" + std::to_string(done->bytes.size()) + " bytes)");
        if (!done->complete())
            log_.warn("transfer " + id + "/" + m.name + " incomplete: " + std::to_string(done->gaps.size()) +
                      " missing chunks, " + std::to_string(done->bytes.size()) + "/" +
                      std::to_string(done->expected_size) + " bytes");
        out.file = std::move(*done);
    }

    void on_ack(DeviceRecord &rec, const AckMsg &m)
    {
        rec.view.acks_received++;
        log_.debug("ACK from " + rec.view.device_id + ": " + m.cmd + " - " + m.status);
        if (m.status == "error")
        {
            rec.view.ack_errors++;
            log_.warn("Command error from " + rec.view.device_id + ": " + m.cmd +
                      (m.message ? " (" + *m.message + ")" : std::string()));
        }
    }

    ConnectionServer &server_;
    Logger &log_;
    ObserverList<ShimmerDataSample> data_;
    ObserverList<std::string, AndroidDevice> status_;
    ObserverList<SessionInfo> session_;
    ObserverList<CompletedTransfer> files_;

    mutable std::mutex m_;
    std::map<std::string, DeviceRecord> devices_;
    std::optional<SessionInfo> current_;
    std::vector<SessionInfo> history_;
    std::mutex session_op_mtx_;

    std::atomic<bool> initialized_{false};
    std::unique_ptr<net::steady_timer> monitor_;
};
