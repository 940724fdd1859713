/*
 * File: tests/test_device_manager.cpp
 * Project: Rig Marshal
 * Purpose: Session orchestration, sync signals and routing over fake links
 * Notes:
 *  - Server is never started; devices arrive through admit() with fake links
 * Last updated: 2026-10-18
 */

#include <catch2/catch_all.hpp>
#include <future>
#include <thread>
#include "rig_manager.hpp"
#include "test_helpers.hpp"

namespace
{
    // Server that is never started: devices arrive through admit() with
    // fake links, so no sockets are involved.
    struct Rig
    {
        CapturedLog cap;
        HubConfig cfg;
        ConnectionServer server{cfg, cap.log};
        DeviceManager mgr{server};

        std::shared_ptr<FakeLink> connect(const std::string &id,
                                          std::vector<std::string> caps = {"camera", "thermal", "shimmer"})
        {
            auto link = std::make_shared<FakeLink>(id + ":5555");
            HelloMsg h;
            h.device_id = id;
            h.capabilities = std::move(caps);
            REQUIRE(server.admit(h, link));
            return link;
        }

        void from(const std::string &id, const Message &m) { server.deliver(id, m); }
    };

    template <typename T>
    std::vector<T> of_type(const std::vector<Message> &msgs)
    {
        std::vector<T> out;
        for (const auto &m : msgs)
            if (auto *v = std::get_if<T>(&m))
                out.push_back(*v);
        return out;
    }
}


TEST_CASE("hello makes the device visible to the manager")
{
    Rig rig;
    std::vector<std::string> seen;
    rig.mgr.add_status_callback([&](const std::string &id, const AndroidDevice &)
                                { seen.push_back(id); });
    rig.connect("dev1");

    auto devs = rig.mgr.get_connected_devices();
    REQUIRE(devs.size() == 1);
    const auto &d = devs.at("dev1");
    REQUIRE(d.capabilities == std::set<std::string>{"camera", "shimmer", "thermal"});
    REQUIRE(d.address == "dev1:5555");
    REQUIRE_FALSE(d.is_recording);
    REQUIRE(seen == std::vector<std::string>{"dev1"});
    REQUIRE(rig.mgr.get_device("dev1"));
    REQUIRE_FALSE(rig.mgr.get_device("dev2"));
}

TEST_CASE("session start on two devices records both")
{
    Rig rig;
    auto l1 = rig.connect("dev1");
    auto l2 = rig.connect("dev2");
    std::vector<SessionInfo> events;
    rig.mgr.add_session_callback([&](const SessionInfo &s)
                                 { events.push_back(s); });

    REQUIRE(rig.mgr.start_session("s1", true, false, true));

    for (auto &l : {l1, l2})
    {
        auto starts = of_type<StartRecordCmd>(l->messages());
        REQUIRE(starts.size() == 1);
        REQUIRE(starts[0].session_id == "s1");
        REQUIRE(starts[0].record_shimmer);
        REQUIRE_FALSE(starts[0].record_video);
        REQUIRE(starts[0].record_thermal);
    }
    auto cur = rig.mgr.get_current_session();
    REQUIRE(cur);
    REQUIRE(cur->session_id == "s1");
    REQUIRE(cur->active());
    REQUIRE(cur->participating_devices == std::set<std::string>{"dev1", "dev2"});
    for (const auto &[id, d] : rig.mgr.get_connected_devices())
    {
        REQUIRE(d.is_recording);
        REQUIRE(d.current_session_id == std::string("s1"));
        REQUIRE(d.messages_sent == 1);
    }
    REQUIRE(events.size() == 1);
    REQUIRE(events[0].active());
}

TEST_CASE("only one session is active at a time")
{
    Rig rig;
    rig.connect("dev1");
    REQUIRE(rig.mgr.start_session("s1"));
    REQUIRE_FALSE(rig.mgr.start_session("s2"));
    REQUIRE(rig.mgr.get_current_session()->session_id == "s1");
    REQUIRE(rig.mgr.stop_session());
    REQUIRE(rig.mgr.start_session("s2"));
}

TEST_CASE("session start fails with no reachable device")
{
    Rig rig;
    REQUIRE_FALSE(rig.mgr.start_session("s1"));
    REQUIRE_FALSE(rig.mgr.get_current_session());

    auto l = rig.connect("dev1");
    l->fail = true;
    REQUIRE_FALSE(rig.mgr.start_session("s1"));
    REQUIRE_FALSE(rig.mgr.get_current_session());
    REQUIRE(rig.cap.contains(LogLevel::kError, "Failed to start session"));
}

TEST_CASE("empty session id is refused")
{
    Rig rig;
    auto l = rig.connect("dev1");
    REQUIRE_FALSE(rig.mgr.start_session(""));
    REQUIRE(l->frame_count() == 0);
}

TEST_CASE("partial start keeps the devices that did not get the command idle")
{
    Rig rig;
    auto good = rig.connect("dev1");
    auto bad = rig.connect("dev2");
    bad->fail = true;

    REQUIRE(rig.mgr.start_session("s1"));
    auto cur = rig.mgr.get_current_session();
    REQUIRE(cur->participating_devices.count("dev2") == 1);
    REQUIRE(cur->dropped_devices == std::set<std::string>{"dev2"});
    REQUIRE(rig.mgr.get_device("dev1")->is_recording);
    REQUIRE_FALSE(rig.mgr.get_device("dev2"));
    REQUIRE(bad->closes == 1);
}

TEST_CASE("a sample during a session carries its id")
{
    Rig rig;
    rig.connect("dev1");
    std::vector<ShimmerDataSample> samples;
    rig.mgr.add_data_callback([&](const ShimmerDataSample &s)
                              { samples.push_back(s); });

    rig.from("dev1", sample({{"gsr", 1.5}}));
    REQUIRE(samples.size() == 1);
    REQUIRE_FALSE(samples[0].session_id.has_value());

    REQUIRE(rig.mgr.start_session("s1"));
    auto m = sample({{"gsr", 2.5}, {"ppg", 0.25}});
    m.timestamp = 1700000000.5;
    rig.from("dev1", m);

    REQUIRE(samples.size() == 2);
    REQUIRE(samples[1].session_id == std::string("s1"));
    REQUIRE(samples[1].device_id == "dev1:shimmer");
    REQUIRE(samples[1].android_device_id == "dev1");
    REQUIRE(samples[1].timestamp == 1700000000.5);
    REQUIRE(samples[1].sensor_values.at("ppg") == 0.25);

    auto cur = rig.mgr.get_current_session();
    REQUIRE(cur->data_samples == 1);
    REQUIRE(cur->shimmer_devices == std::set<std::string>{"dev1:shimmer"});

    auto streams = rig.mgr.get_shimmer_devices();
    REQUIRE(streams.size() == 1);
    REQUIRE(streams.at("dev1:shimmer").samples == 2);
    REQUIRE(streams.at("dev1:shimmer").last_values.at("gsr") == 2.5);

    auto d = rig.mgr.get_device("dev1");
    REQUIRE(d->data_samples_received == 2);
    REQUIRE(d->messages_received == 2);
}

TEST_CASE("status merges into the device view and the registry")
{
    Rig rig;
    rig.connect("dev1");
    int calls = 0;
    rig.mgr.add_status_callback([&](const std::string &, const AndroidDevice &)
                                { ++calls; });

    StatusMsg st;
    st.battery = 80;
    st.storage = "12GB";
    rig.from("dev1", st);

    auto d = rig.mgr.get_device("dev1");
    REQUIRE(d->status["battery"] == 80);
    REQUIRE(d->status["storage"] == "12GB");
    REQUIRE(d->status["recording"] == false);
    REQUIRE(rig.server.registry().find("dev1")->status["battery"] == 80);
    REQUIRE(calls == 1);
}

TEST_CASE("device-reported recording state follows the active session")
{
    Rig rig;
    rig.connect("dev1");
    REQUIRE(rig.mgr.start_session("s1"));

    StatusMsg idle;
    idle.recording = false;
    rig.from("dev1", idle);
    auto d = rig.mgr.get_device("dev1");
    REQUIRE_FALSE(d->is_recording);
    REQUIRE_FALSE(d->current_session_id.has_value());

    StatusMsg busy;
    busy.recording = true;
    rig.from("dev1", busy);
    d = rig.mgr.get_device("dev1");
    REQUIRE(d->is_recording);
    REQUIRE(d->current_session_id == std::string("s1"));
}

TEST_CASE("a full file transfer is signalled and leaves nothing pending")
{
    Rig rig;
    rig.connect("dev1");
    REQUIRE(rig.mgr.start_session("s1"));
    std::vector<CompletedTransfer> files;
    rig.mgr.add_file_callback([&](const CompletedTransfer &t)
                              { files.push_back(t); });

    rig.from("dev1", FileInfoMsg{0, "thermal.bin", 8});
    REQUIRE(rig.mgr.get_device("dev1")->pending_files.count("thermal.bin") == 1);
    rig.from("dev1", chunk(1, "5678"));
    rig.from("dev1", chunk(0, "1234"));
    REQUIRE(rig.mgr.get_device("dev1")->pending_files.at("thermal.bin").received_bytes == 8);
    rig.from("dev1", FileEndMsg{0, "thermal.bin"});

    REQUIRE(files.size() == 1);
    REQUIRE(files[0].bytes == "12345678");
    REQUIRE(files[0].session_id == std::string("s1"));
    REQUIRE(files[0].complete());
    REQUIRE(rig.mgr.get_device("dev1")->pending_files.empty());
    REQUIRE(rig.mgr.get_current_session()->files_collected.at("dev1") == std::vector<std::string>{"thermal.bin"});
}

TEST_CASE("stopping seals the session and clears recording state")
{
    Rig rig;
    auto l = rig.connect("dev1");
    REQUIRE_FALSE(rig.mgr.stop_session());
    REQUIRE(rig.mgr.start_session("s1"));
    rig.from("dev1", FileInfoMsg{0, "late.mp4", 10});

    std::vector<SessionInfo> events;
    rig.mgr.add_session_callback([&](const SessionInfo &s)
                                 { events.push_back(s); });
    REQUIRE(rig.mgr.stop_session());

    REQUIRE(of_type<StopRecordCmd>(l->messages()).size() == 1);
    REQUIRE_FALSE(rig.mgr.get_current_session());
    auto hist = rig.mgr.get_session_history();
    REQUIRE(hist.size() == 1);
    REQUIRE(hist[0].session_id == "s1");
    REQUIRE(hist[0].end_time.has_value());
    REQUIRE(*hist[0].end_time >= hist[0].start_time);
    REQUIRE(events.size() == 1);
    REQUIRE_FALSE(events[0].active());
    auto d = rig.mgr.get_device("dev1");
    REQUIRE_FALSE(d->is_recording);
    REQUIRE_FALSE(d->current_session_id.has_value());
    REQUIRE(rig.cap.contains(LogLevel::kWarn, "late.mp4"));
    REQUIRE_FALSE(rig.mgr.stop_session());
}

TEST_CASE("flash with one failing socket returns 1")
{
    Rig rig;
    auto ok = rig.connect("dev1");
    auto broken = rig.connect("dev2");
    broken->fail = true;

    REQUIRE(rig.mgr.send_sync_flash(150, std::string("sync-7")) == 1);
    auto flashes = of_type<FlashSyncCmd>(ok->messages());
    REQUIRE(flashes.size() == 1);
    REQUIRE(flashes[0].duration_ms == 150);
    REQUIRE(flashes[0].sync_id == std::string("sync-7"));
    REQUIRE_FALSE(rig.mgr.get_device("dev2"));
    REQUIRE(rig.mgr.get_device("dev1")->messages_sent == 1);
}

TEST_CASE("beep uses protocol defaults and reports the count")
{
    Rig rig;
    auto l1 = rig.connect("dev1");
    auto l2 = rig.connect("dev2");
    REQUIRE(rig.mgr.send_sync_beep() == 2);
    auto beeps = of_type<BeepSyncCmd>(l2->messages());
    REQUIRE(beeps.size() == 1);
    REQUIRE(beeps[0].frequency_hz == 1000);
    REQUIRE(beeps[0].duration_ms == 200);
    REQUIRE(beeps[0].volume == Catch::Approx(0.8));
    REQUIRE_FALSE(beeps[0].sync_id.has_value());
    REQUIRE(rig.mgr.send_sync_flash() == 2);
    REQUIRE(of_type<FlashSyncCmd>(l1->messages()).size() == 1);

    Rig empty;
    REQUIRE(empty.mgr.send_sync_flash() == 0);
}

TEST_CASE("administrative disconnect uses the normal removal path")
{
    Rig rig;
    auto l = rig.connect("dev1");
    REQUIRE(rig.mgr.start_session("s1"));
    std::vector<std::string> gone;
    std::vector<DisconnectReason> reasons;
    rig.server.add_disconnected_callback([&](const ConnectedDevice &d, DisconnectReason reason)
                                         {
        gone.push_back(d.device_id);
        reasons.push_back(reason); });

    REQUIRE_FALSE(rig.mgr.disconnect_device("nope"));
    REQUIRE(rig.mgr.disconnect_device("dev1"));
    REQUIRE(gone == std::vector<std::string>{"dev1"});
    REQUIRE(reasons == std::vector<DisconnectReason>{DisconnectReason::kAdministrative});
    REQUIRE(l->closes == 1);
    REQUIRE_FALSE(rig.server.registry().contains("dev1"));
    REQUIRE(rig.mgr.get_connected_devices().empty());
    REQUIRE(rig.mgr.get_current_session()->dropped_devices == std::set<std::string>{"dev1"});
    REQUIRE_FALSE(rig.mgr.disconnect_device("dev1"));
}

TEST_CASE("disconnect drops pending transfers with a warning")
{
    Rig rig;
    rig.connect("dev1");
    rig.from("dev1", FileInfoMsg{0, "half.mp4", 100});
    rig.from("dev1", chunk(0, "abc"));
    rig.server.disconnect("dev1", DisconnectReason::kReadError);
    REQUIRE(rig.cap.contains(LogLevel::kWarn, "incomplete transfer dropped: dev1/half.mp4"));
}

TEST_CASE("a reconnect with the same id replaces the old link")
{
    Rig rig;
    auto first = rig.connect("dev1");
    auto second = rig.connect("dev1");
    REQUIRE(first->closes == 1);
    REQUIRE(rig.mgr.get_connected_devices().size() == 1);
    REQUIRE(rig.mgr.send_sync_flash() == 1);
    REQUIRE(second->frame_count() == 1);
    REQUIRE(first->frame_count() == 0);
}

TEST_CASE("a late disconnect of the old connection keeps the reconnected device")
{
    CapturedLog cap;
    HubConfig cfg;
    ConnectionServer server{cfg, cap.log};

    // Registered before the manager, so it runs first and holds the old
    // connection's removal back until the device has reconnected.
    std::promise<void> reconnected;
    auto gate = reconnected.get_future().share();
    server.add_disconnected_callback([gate](const ConnectedDevice &, DisconnectReason)
                                     { gate.wait(); });
    DeviceManager mgr{server};

    HelloMsg h;
    h.device_id = "dev1";
    h.capabilities = {"shimmer"};
    auto old_link = std::make_shared<FakeLink>();
    REQUIRE(server.admit(h, old_link));

    std::thread dropper([&]
                        { server.disconnect("dev1", DisconnectReason::kReadError); });
    REQUIRE(wait_until([&]
                       { return old_link->closes.load() == 1; }));
    REQUIRE_FALSE(server.registry().contains("dev1"));

    auto new_link = std::make_shared<FakeLink>();
    REQUIRE(server.admit(h, new_link));
    reconnected.set_value();
    dropper.join();

    REQUIRE(server.registry().contains("dev1"));
    REQUIRE(mgr.get_device("dev1"));
    server.deliver("dev1", sample({{"gsr", 1}}));
    REQUIRE(mgr.get_device("dev1")->data_samples_received == 1);
    REQUIRE_FALSE(cap.contains(LogLevel::kWarn, "unknown device"));
    REQUIRE(mgr.send_sync_flash() == 1);
    REQUIRE(new_link->frame_count() == 1);
}

TEST_CASE("commands that cannot be encoded fail without throwing")
{
    Rig rig;
    auto link = rig.connect("dev1");

    bool started = true;
    REQUIRE_NOTHROW(started = rig.mgr.start_session("s\xff"));
    REQUIRE_FALSE(started);
    REQUIRE_FALSE(rig.mgr.get_current_session());
    REQUIRE(rig.cap.contains(LogLevel::kError, "cannot encode start_record"));

    std::size_t sent = 1;
    REQUIRE_NOTHROW(sent = rig.mgr.send_sync_flash(200, std::string(2 * 1024 * 1024, 'a')));
    REQUIRE(sent == 0);
    REQUIRE(rig.cap.contains(LogLevel::kError, "frame payload exceeds"));

    FlashSyncCmd bad;
    bad.sync_id = std::string("\xc3");
    REQUIRE_FALSE(rig.server.send("dev1", bad));

    // the device itself is fine and still reachable
    REQUIRE(link->frame_count() == 0);
    REQUIRE(rig.server.registry().contains("dev1"));
    REQUIRE(rig.mgr.send_sync_flash() == 1);
    REQUIRE(rig.mgr.start_session("s1"));
}

TEST_CASE("a throwing data callback does not starve later ones")
{
    Rig rig;
    rig.connect("dev1");
    int after = 0;
    rig.mgr.add_data_callback([](const ShimmerDataSample &)
                              { throw std::runtime_error("boom"); });
    rig.mgr.add_data_callback([&](const ShimmerDataSample &)
                              { ++after; });
    rig.from("dev1", sample({{"gsr", 1}}));
    REQUIRE(after == 1);
    REQUIRE(rig.cap.contains(LogLevel::kError, "boom"));
}

TEST_CASE("acks are logged and counted, errors as warnings")
{
    Rig rig;
    rig.connect("dev1");
    rig.from("dev1", AckMsg{0, "start_record", "ok", std::nullopt});
    rig.from("dev1", AckMsg{0, "start_record", "error", std::string("no storage")});
    REQUIRE(rig.cap.contains(LogLevel::kDebug, "ACK from dev1: start_record"));
    REQUIRE(rig.cap.contains(LogLevel::kWarn, "no storage"));
    auto dev = rig.mgr.get_device("dev1");
    REQUIRE(dev->messages_received == 2);
    REQUIRE(dev->acks_received == 2);
    REQUIRE(dev->ack_errors == 1);
    REQUIRE(device_to_json(*dev)["ack_errors"] == 1);
}

TEST_CASE("data monitor flags devices whose stream went quiet")
{
    Rig rig;
    rig.connect("dev1");
    rig.connect("dev2");
    auto m = sample({{"gsr", 1}});
    m.timestamp = 1000.0;
    rig.from("dev1", m);

    auto stale = rig.mgr.check_data_streams(1000.0 + 61);
    REQUIRE(stale == std::vector<std::string>{"dev1"});
    REQUIRE(rig.mgr.check_data_streams(1000.0 + 30).empty());
}
