/*
 * File: include/common/wire.hpp
 * Project: Rig Marshal
 * Purpose: Device wire protocol: framing and the closed message set
 * Notes:
 *  - Frames are a 4-byte big-endian length followed by UTF-8 JSON
 *  - Unknown message types decode to GenericMsg
 *  - Missing timestamps are filled with the receive time
 * Last updated: 2026-10-18
 */

#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

constexpr uint32_t kMaxFrameBytes = 1024 * 1024;
constexpr std::size_t kFrameHeaderBytes = 4;

// Wall-clock seconds since the epoch, the unit of every `timestamp` field.
inline double wire_now()
{
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

// -------- device -> server --------

struct HelloMsg
{
    double timestamp = 0;
    std::string device_id;
    std::vector<std::string> capabilities;
};

struct StatusMsg
{
    double timestamp = 0;
    std::optional<int> battery;
    std::optional<std::string> storage;
    std::optional<double> temperature;
    bool recording = false;
    bool connected = true;
};

struct SensorDataMsg
{
    double timestamp = 0;
    std::map<std::string, double> values;
};

struct AckMsg
{
    double timestamp = 0;
    std::string cmd;
    std::string status = "ok"; // "ok" or "error"
    std::optional<std::string> message;
};

struct FileInfoMsg
{
    double timestamp = 0;
    std::string name;
    uint64_t size = 0;
};

struct FileChunkMsg
{
    double timestamp = 0;
    int64_t seq = 0;
    std::string data; // base64
};

struct FileEndMsg
{
    double timestamp = 0;
    std::string name;
};

// -------- server -> device --------

struct StartRecordCmd
{
    double timestamp = 0;
    std::string session_id;
    bool record_video = true;
    bool record_thermal = true;
    bool record_shimmer = false;
};

struct StopRecordCmd
{
    double timestamp = 0;
};

struct FlashSyncCmd
{
    double timestamp = 0;
    int duration_ms = 200;
    std::optional<std::string> sync_id;
};

struct BeepSyncCmd
{
    double timestamp = 0;
    int frequency_hz = 1000;
    int duration_ms = 200;
    double volume = 0.8;
    std::optional<std::string> sync_id;
};

// Any `type` we do not know. Kept whole so newer devices are not dropped.
struct GenericMsg
{
    double timestamp = 0;
    std::string type;
    nlohmann::json fields = nlohmann::json::object();
};

using Message = std::variant<HelloMsg, StatusMsg, SensorDataMsg, AckMsg,
                             FileInfoMsg, FileChunkMsg, FileEndMsg,
                             StartRecordCmd, StopRecordCmd, FlashSyncCmd, BeepSyncCmd,
                             GenericMsg>;

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

inline std::string message_type(const Message &m)
{
    return std::visit(overloaded{
                          [](const HelloMsg &) { return std::string("hello"); },
                          [](const StatusMsg &) { return std::string("status"); },
                          [](const SensorDataMsg &) { return std::string("sensor_data"); },
                          [](const AckMsg &) { return std::string("ack"); },
                          [](const FileInfoMsg &) { return std::string("file_info"); },
                          [](const FileChunkMsg &) { return std::string("file_chunk"); },
                          [](const FileEndMsg &) { return std::string("file_end"); },
                          [](const StartRecordCmd &) { return std::string("start_record"); },
                          [](const StopRecordCmd &) { return std::string("stop_record"); },
                          [](const FlashSyncCmd &) { return std::string("flash_sync"); },
                          [](const BeepSyncCmd &) { return std::string("beep_sync"); },
                          [](const GenericMsg &g) { return g.type; }},
                      m);
}

inline double message_timestamp(const Message &m)
{
    return std::visit([](const auto &v) { return v.timestamp; }, m);
}

// -------- JSON mapping --------

inline nlohmann::json message_to_json(const Message &m)
{
    using nlohmann::json;
    auto opt = [](json &j, const char *key, const auto &v)
    {
        if (v)
            j[key] = *v;
        else
            j[key] = nullptr;
    };

    json j = std::visit(overloaded{
                            [](const HelloMsg &v) { return json{{"device_id", v.device_id}, {"capabilities", v.capabilities}}; },
                            [&](const StatusMsg &v)
                            {
                                json o{{"recording", v.recording}, {"connected", v.connected}};
                                opt(o, "battery", v.battery);
                                opt(o, "storage", v.storage);
                                opt(o, "temperature", v.temperature);
                                return o;
                            },
                            [](const SensorDataMsg &v) { return json{{"values", v.values}}; },
                            [&](const AckMsg &v)
                            {
                                json o{{"cmd", v.cmd}, {"status", v.status}};
                                opt(o, "message", v.message);
                                return o;
                            },
                            [](const FileInfoMsg &v) { return json{{"name", v.name}, {"size", v.size}}; },
                            [](const FileChunkMsg &v) { return json{{"seq", v.seq}, {"data", v.data}}; },
                            [](const FileEndMsg &v) { return json{{"name", v.name}}; },
                            [](const StartRecordCmd &v)
                            {
                                return json{{"session_id", v.session_id},
                                            {"record_video", v.record_video},
                                            {"record_thermal", v.record_thermal},
                                            {"record_shimmer", v.record_shimmer}};
                            },
                            [](const StopRecordCmd &) { return json::object(); },
                            [&](const FlashSyncCmd &v)
                            {
                                json o{{"duration_ms", v.duration_ms}};
                                opt(o, "sync_id", v.sync_id);
                                return o;
                            },
                            [&](const BeepSyncCmd &v)
                            {
                                json o{{"frequency_hz", v.frequency_hz}, {"duration_ms", v.duration_ms}, {"volume", v.volume}};
                                opt(o, "sync_id", v.sync_id);
                                return o;
                            },
                            [](const GenericMsg &v) { return v.fields.is_object() ? v.fields : json::object(); }},
                        m);

    j["type"] = message_type(m);
    const double ts = message_timestamp(m);
    j["timestamp"] = ts > 0 ? ts : wire_now();
    return j;
}

enum class DecodeError
{
    kNone,
    kBadFrameLength,
    kMalformedJson,
    kNotAnObject,
    kMissingType,
    kMissingField,
    kBadFieldType,
};

inline const char *to_string(DecodeError e)
{
    switch (e)
    {
    case DecodeError::kNone:
        return "none";
    case DecodeError::kBadFrameLength:
        return "bad frame length";
    case DecodeError::kMalformedJson:
        return "malformed json";
    case DecodeError::kNotAnObject:
        return "not a json object";
    case DecodeError::kMissingType:
        return "missing type";
    case DecodeError::kMissingField:
        return "missing field";
    case DecodeError::kBadFieldType:
        return "bad field type";
    }
    return "unknown";
}

struct DecodeResult
{
    std::optional<Message> message;
    DecodeError error = DecodeError::kNone;
    std::string detail;

    explicit operator bool() const { return message.has_value(); }

    static DecodeResult fail(DecodeError e, std::string what)
    {
        DecodeResult r;
        r.error = e;
        r.detail = std::move(what);
        return r;
    }
};

namespace wire_detail
{
    struct FieldError
    {
        DecodeError error;
        std::string field;
    };

    template <typename T>
    T required(const nlohmann::json &j, const char *key)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            throw FieldError{DecodeError::kMissingField, key};
        try
        {
            return it->get<T>();
        }
        catch (const nlohmann::json::exception &)
        {
            throw FieldError{DecodeError::kBadFieldType, key};
        }
    }

    template <typename T>
    T optional_or(const nlohmann::json &j, const char *key, T fallback)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return fallback;
        try
        {
            return it->get<T>();
        }
        catch (const nlohmann::json::exception &)
        {
            throw FieldError{DecodeError::kBadFieldType, key};
        }
    }

    template <typename T>
    std::optional<T> maybe(const nlohmann::json &j, const char *key)
    {
        auto it = j.find(key);
        if (it == j.end() || it->is_null())
            return std::nullopt;
        try
        {
            return it->get<T>();
        }
        catch (const nlohmann::json::exception &)
        {
            throw FieldError{DecodeError::kBadFieldType, key};
        }
    }
} // namespace wire_detail

// Map an already-parsed JSON object onto the message set.
inline DecodeResult message_from_json(const nlohmann::json &j)
{
    using namespace wire_detail;
    if (!j.is_object())
        return DecodeResult::fail(DecodeError::kNotAnObject, "frame is not a json object");
    auto t = j.find("type");
    if (t == j.end() || !t->is_string())
        return DecodeResult::fail(DecodeError::kMissingType, "no string 'type' field");
    const std::string type = t->get<std::string>();

    try
    {
        const double ts = optional_or<double>(j, "timestamp", 0.0);
        const double stamp = ts > 0 ? ts : wire_now();
        DecodeResult r;

        if (type == "hello")
        {
            HelloMsg m;
            m.timestamp = stamp;
            m.device_id = required<std::string>(j, "device_id");
            if (m.device_id.empty())
                throw FieldError{DecodeError::kMissingField, "device_id"};
            m.capabilities = optional_or<std::vector<std::string>>(j, "capabilities", {});
            r.message = m;
        }
        else if (type == "status")
        {
            StatusMsg m;
            m.timestamp = stamp;
            m.battery = maybe<int>(j, "battery");
            m.storage = maybe<std::string>(j, "storage");
            m.temperature = maybe<double>(j, "temperature");
            m.recording = optional_or<bool>(j, "recording", false);
            m.connected = optional_or<bool>(j, "connected", true);
            r.message = m;
        }
        else if (type == "sensor_data")
        {
            SensorDataMsg m;
            m.timestamp = stamp;
            m.values = required<std::map<std::string, double>>(j, "values");
            r.message = m;
        }
        else if (type == "ack")
        {
            AckMsg m;
            m.timestamp = stamp;
            m.cmd = required<std::string>(j, "cmd");
            m.status = optional_or<std::string>(j, "status", "ok");
            m.message = maybe<std::string>(j, "message");
            r.message = m;
        }
        else if (type == "file_info")
        {
            FileInfoMsg m;
            m.timestamp = stamp;
            m.name = required<std::string>(j, "name");
            m.size = required<uint64_t>(j, "size");
            r.message = m;
        }
        else if (type == "file_chunk")
        {
            FileChunkMsg m;
            m.timestamp = stamp;
            m.seq = required<int64_t>(j, "seq");
            m.data = required<std::string>(j, "data");
            r.message = m;
        }
        else if (type == "file_end")
        {
            FileEndMsg m;
            m.timestamp = stamp;
            m.name = required<std::string>(j, "name");
            r.message = m;
        }
        else if (type == "start_record")
        {
            StartRecordCmd m;
            m.timestamp = stamp;
            m.session_id = required<std::string>(j, "session_id");
            m.record_video = optional_or<bool>(j, "record_video", true);
            m.record_thermal = optional_or<bool>(j, "record_thermal", true);
            m.record_shimmer = optional_or<bool>(j, "record_shimmer", false);
            r.message = m;
        }
        else if (type == "stop_record")
        {
            r.message = StopRecordCmd{stamp};
        }
        else if (type == "flash_sync")
        {
            FlashSyncCmd m;
            m.timestamp = stamp;
            m.duration_ms = optional_or<int>(j, "duration_ms", 200);
            m.sync_id = maybe<std::string>(j, "sync_id");
            r.message = m;
        }
        else if (type == "beep_sync")
        {
            BeepSyncCmd m;
            m.timestamp = stamp;
            m.frequency_hz = optional_or<int>(j, "frequency_hz", 1000);
            m.duration_ms = optional_or<int>(j, "duration_ms", 200);
            m.volume = optional_or<double>(j, "volume", 0.8);
            m.sync_id = maybe<std::string>(j, "sync_id");
            r.message = m;
        }
        else
        {
            GenericMsg m;
            m.timestamp = stamp;
            m.type = type;
            m.fields = j;
            m.fields.erase("type");
            m.fields.erase("timestamp");
            r.message = m;
        }
        return r;
    }
    catch (const FieldError &fe)
    {
        return DecodeResult::fail(fe.error, type + "." + fe.field);
    }
}

inline DecodeResult decode_message(std::string_view text)
{
    auto j = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded())
        return DecodeResult::fail(DecodeError::kMalformedJson, "json parse failed");
    return message_from_json(j);
}

// -------- framing --------

inline bool frame_length_ok(uint32_t n, uint32_t max_bytes = kMaxFrameBytes)
{
    return n > 0 && n <= max_bytes;
}

inline uint32_t read_frame_length(const std::array<uint8_t, kFrameHeaderBytes> &h)
{
    return (static_cast<uint32_t>(h[0]) << 24) | (static_cast<uint32_t>(h[1]) << 16) |
           (static_cast<uint32_t>(h[2]) << 8) | static_cast<uint32_t>(h[3]);
}

inline std::string encode_payload(const Message &m)
{
    return message_to_json(m).dump();
}

// Throws std::length_error when the payload would not fit in a frame.
inline std::string encode_frame(const Message &m, uint32_t max_bytes = kMaxFrameBytes)
{
    const std::string body = encode_payload(m);
    if (body.size() > max_bytes)
        throw std::length_error("frame payload exceeds " + std::to_string(max_bytes) + " bytes");
    const auto n = static_cast<uint32_t>(body.size());
    std::string out;
    out.reserve(kFrameHeaderBytes + body.size());
    out.push_back(static_cast<char>((n >> 24) & 0xFF));
    out.push_back(static_cast<char>((n >> 16) & 0xFF));
    out.push_back(static_cast<char>((n >> 8) & 0xFF));
    out.push_back(static_cast<char>(n & 0xFF));
    out += body;
    return out;
}

// Decode one complete frame held in memory. The length prefix is checked
// before the body is looked at.
inline DecodeResult decode_frame(std::string_view bytes, uint32_t max_bytes = kMaxFrameBytes)
{
    if (bytes.size() < kFrameHeaderBytes)
        return DecodeResult::fail(DecodeError::kBadFrameLength, "short header");
    std::array<uint8_t, kFrameHeaderBytes> h{};
    for (std::size_t i = 0; i < kFrameHeaderBytes; ++i)
        h[i] = static_cast<uint8_t>(bytes[i]);
    const uint32_t n = read_frame_length(h);
    if (!frame_length_ok(n, max_bytes))
        return DecodeResult::fail(DecodeError::kBadFrameLength, "declared length " + std::to_string(n));
    if (bytes.size() - kFrameHeaderBytes < n)
        return DecodeResult::fail(DecodeError::kBadFrameLength, "truncated body");
    return decode_message(bytes.substr(kFrameHeaderBytes, n));
}
