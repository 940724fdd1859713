/*
 * File: tests/test_wire_codec.cpp
 * Project: Rig Marshal
 * Purpose: Framing and message codec
 * Notes:
 *  - Frames are a 4-byte big-endian length followed by UTF-8 JSON
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include "common/wire.hpp"

using nlohmann::json;

namespace
{
    template <typename T>
    T roundtrip(const T &m)
    {
        auto r = decode_frame(encode_frame(m));
        REQUIRE(r);
        REQUIRE(std::holds_alternative<T>(*r.message));
        return std::get<T>(*r.message);
    }

    std::string frame_with_length(uint32_t n, const std::string &body = {})
    {
        std::string out;
        out.push_back(static_cast<char>((n >> 24) & 0xFF));
        out.push_back(static_cast<char>((n >> 16) & 0xFF));
        out.push_back(static_cast<char>((n >> 8) & 0xFF));
        out.push_back(static_cast<char>(n & 0xFF));
        return out + body;
    }
}


TEST_CASE("frame header is big-endian payload length")
{
    StopRecordCmd stop;
    stop.timestamp = 1.5;
    auto f = encode_frame(stop);
    const auto body = encode_payload(stop);
    REQUIRE(f.size() == body.size() + 4);
    std::array<uint8_t, 4> h{static_cast<uint8_t>(f[0]), static_cast<uint8_t>(f[1]),
                             static_cast<uint8_t>(f[2]), static_cast<uint8_t>(f[3])};
    REQUIRE(read_frame_length(h) == body.size());
    REQUIRE(f.substr(4) == body);
    REQUIRE(json::parse(body)["type"] == "stop_record");
}

TEST_CASE("device messages survive encode/decode field for field")
{
    SECTION("hello")
    {
        HelloMsg m{1700000000.25, "dev1", {"camera", "thermal", "shimmer"}};
        auto d = roundtrip(m);
        REQUIRE(d.timestamp == m.timestamp);
        REQUIRE(d.device_id == "dev1");
        REQUIRE(d.capabilities == m.capabilities);
    }
    SECTION("status with optionals present and absent")
    {
        StatusMsg m;
        m.timestamp = 10;
        m.battery = 80;
        m.temperature = 36.6;
        m.recording = true;
        auto d = roundtrip(m);
        REQUIRE(d.battery == 80);
        REQUIRE_FALSE(d.storage.has_value());
        REQUIRE(d.temperature == Catch::Approx(36.6));
        REQUIRE(d.recording);
        REQUIRE(d.connected);
    }
    SECTION("sensor_data")
    {
        SensorDataMsg m;
        m.timestamp = 11;
        m.values = {{"gsr", 1.25}, {"ppg", -3.5}};
        REQUIRE(roundtrip(m).values == m.values);
    }
    SECTION("ack with error message")
    {
        AckMsg m{12, "start_record", "error", std::string("disk full")};
        auto d = roundtrip(m);
        REQUIRE(d.cmd == "start_record");
        REQUIRE(d.status == "error");
        REQUIRE(d.message == std::string("disk full"));
    }
    SECTION("file messages")
    {
        auto info = roundtrip(FileInfoMsg{13, "video.mp4", 123456789012ULL});
        REQUIRE(info.name == "video.mp4");
        REQUIRE(info.size == 123456789012ULL);
        auto c = roundtrip(FileChunkMsg{14, 7, "aGVsbG8="});
        REQUIRE(c.seq == 7);
        REQUIRE(c.data == "aGVsbG8=");
        REQUIRE(roundtrip(FileEndMsg{15, "video.mp4"}).name == "video.mp4");
    }
}

TEST_CASE("server commands survive encode/decode field for field")
{
    StartRecordCmd start{20, "s1", false, true, true};
    auto s = roundtrip(start);
    REQUIRE(s.session_id == "s1");
    REQUIRE_FALSE(s.record_video);
    REQUIRE(s.record_thermal);
    REQUIRE(s.record_shimmer);

    auto f = roundtrip(FlashSyncCmd{21, 150, std::string("sync-1")});
    REQUIRE(f.duration_ms == 150);
    REQUIRE(f.sync_id == std::string("sync-1"));

    auto b = roundtrip(BeepSyncCmd{22, 2000, 100, 0.5, std::nullopt});
    REQUIRE(b.frequency_hz == 2000);
    REQUIRE(b.duration_ms == 100);
    REQUIRE(b.volume == Catch::Approx(0.5));
    REQUIRE_FALSE(b.sync_id.has_value());
}

TEST_CASE("omitted fields take protocol defaults")
{
    auto r = decode_message(R"({"type":"beep_sync"})");
    REQUIRE(r);
    auto b = std::get<BeepSyncCmd>(*r.message);
    REQUIRE(b.frequency_hz == 1000);
    REQUIRE(b.duration_ms == 200);
    REQUIRE(b.volume == Catch::Approx(0.8));

    auto st = std::get<StartRecordCmd>(*decode_message(R"({"type":"start_record","session_id":"x"})").message);
    REQUIRE(st.record_video);
    REQUIRE(st.record_thermal);
    REQUIRE_FALSE(st.record_shimmer);

    auto status = std::get<StatusMsg>(*decode_message(R"({"type":"status"})").message);
    REQUIRE_FALSE(status.recording);
    REQUIRE(status.connected);
    REQUIRE_FALSE(status.battery.has_value());

    auto ack = std::get<AckMsg>(*decode_message(R"({"type":"ack","cmd":"stop_record"})").message);
    REQUIRE(ack.status == "ok");
}

TEST_CASE("missing timestamp is stamped at receipt and at send")
{
    const double before = wire_now();
    auto r = decode_message(R"({"type":"file_end","name":"a"})");
    REQUIRE(r);
    REQUIRE(message_timestamp(*r.message) >= before);

    auto j = message_to_json(StopRecordCmd{});
    REQUIRE(j["timestamp"].get<double>() >= before);
}

TEST_CASE("unknown types pass through as generic messages")
{
    auto r = decode_message(R"({"type":"calibration_result","timestamp":5,"rms":0.42,"ok":true})");
    REQUIRE(r);
    auto g = std::get<GenericMsg>(*r.message);
    REQUIRE(g.type == "calibration_result");
    REQUIRE(g.timestamp == 5);
    REQUIRE(g.fields["rms"] == 0.42);
    REQUIRE(g.fields["ok"] == true);
    REQUIRE_FALSE(g.fields.contains("type"));

    auto j = message_to_json(g);
    REQUIRE(j["type"] == "calibration_result");
    REQUIRE(j["rms"] == 0.42);
    REQUIRE(message_type(g) == "calibration_result");
}

TEST_CASE("decode failures are typed")
{
    REQUIRE(decode_message("{not json").error == DecodeError::kMalformedJson);
    REQUIRE(decode_message("[1,2,3]").error == DecodeError::kNotAnObject);
    REQUIRE(decode_message(R"({"device_id":"x"})").error == DecodeError::kMissingType);
    REQUIRE(decode_message(R"({"type":42})").error == DecodeError::kMissingType);
    REQUIRE(decode_message(R"({"type":"hello"})").error == DecodeError::kMissingField);
    REQUIRE(decode_message(R"({"type":"hello","device_id":""})").error == DecodeError::kMissingField);
    REQUIRE(decode_message(R"({"type":"file_info","name":"a"})").error == DecodeError::kMissingField);
    REQUIRE(decode_message(R"({"type":"file_chunk","seq":"one","data":""})").error == DecodeError::kBadFieldType);
    REQUIRE(decode_message(R"({"type":"sensor_data","values":{"gsr":"high"}})").error == DecodeError::kBadFieldType);
    REQUIRE(decode_message(R"({"type":"start_record"})").error == DecodeError::kMissingField);

    auto r = decode_message(R"({"type":"ack"})");
    REQUIRE_FALSE(r);
    REQUIRE(r.detail.find("cmd") != std::string::npos);
}

TEST_CASE("frame length is checked before the body")
{
    SECTION("oversized header fails without a body present")
    {
        auto r = decode_frame(frame_with_length(kMaxFrameBytes + 1));
        REQUIRE(r.error == DecodeError::kBadFrameLength);
        REQUIRE(r.detail.find("declared length") != std::string::npos);
    }
    SECTION("zero length is rejected")
    {
        REQUIRE(decode_frame(frame_with_length(0)).error == DecodeError::kBadFrameLength);
    }
    SECTION("custom limit applies")
    {
        REQUIRE(decode_frame(frame_with_length(100, std::string(100, ' ')), 64).error == DecodeError::kBadFrameLength);
    }
    SECTION("truncated body")
    {
        REQUIRE(decode_frame(frame_with_length(10, "{}")).error == DecodeError::kBadFrameLength);
    }
    REQUIRE(frame_length_ok(1));
    REQUIRE(frame_length_ok(kMaxFrameBytes));
    REQUIRE_FALSE(frame_length_ok(kMaxFrameBytes + 1));
}

TEST_CASE("encode_frame refuses payloads over the limit")
{
    GenericMsg big;
    big.type = "blob";
    big.fields["data"] = std::string(2048, 'x');
    REQUIRE_THROWS_AS(encode_frame(big, 1024), std::length_error);
    REQUIRE_NOTHROW(encode_frame(big));
}
