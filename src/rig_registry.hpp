/*
 * File: src/rig_registry.hpp
 * Project: Rig Marshal
 * Purpose: Connected-device table and heartbeat bookkeeping
 * Notes:
 *  - unregister_if() is the only removal path
 *  - Heartbeat is any inbound message; there is no ping type
 * Last updated: 2026-10-18
 */

#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "rig_state.hpp"


// The only table written by several threads (connection handlers, the
// heartbeat sweep, orchestrator sends). unregister() is the single way out:
// it erases under the lock, so the removal handler runs once per device no
// matter how many paths race to remove it.
class DeviceRegistry
{
public:
    using RemovalHandler = std::function<void(const ConnectedDevice &, DisconnectReason)>;
    using Clock = std::chrono::steady_clock;

    explicit DeviceRegistry(Logger &log) : log_(log) {}

    DeviceRegistry(const DeviceRegistry &) = delete;
    DeviceRegistry &operator=(const DeviceRegistry &) = delete;

    void set_removal_handler(RemovalHandler h)
    {
        std::scoped_lock lk(m_);
        on_removed_ = std::move(h);
    }

    // false if the id is taken; the caller decides whether to evict first.
    bool register_device(ConnectedDevice dev)
    {
        std::scoped_lock lk(m_);
        auto id = dev.device_id;
        return devices_.emplace(std::move(id), std::move(dev)).second;
    }

    bool touch(const std::string &id, Clock::time_point now = Clock::now())
    {
        std::scoped_lock lk(m_);
        auto it = devices_.find(id);
        if (it == devices_.end())
            return false;
        it->second.last_heartbeat = now;
        return true;
    }

    bool update_status(const std::string &id, const nlohmann::json &fields)
    {
        std::scoped_lock lk(m_);
        auto it = devices_.find(id);
        if (it == devices_.end())
            return false;
        it->second.status.update(fields);
        return true;
    }

    // Removes the device, closes its link and fires the removal handler.
    // With `expected` set, only removes the entry if it still belongs to that
    // link, so a dead connection cannot evict a newer one with the same id.
    bool unregister(const std::string &id, DisconnectReason reason, const DeviceLink *expected = nullptr)
    {
        return unregister_if(id, reason, [expected](const ConnectedDevice &d)
                             { return !expected || d.link.get() == expected; });
    }

    // Same as unregister(), but the predicate is checked under the lock.
    template <typename Pred>
    bool unregister_if(const std::string &id, DisconnectReason reason, Pred pred)
    {
        ConnectedDevice gone;
        RemovalHandler handler;
        {
            std::scoped_lock lk(m_);
            auto it = devices_.find(id);
            if (it == devices_.end())
                return false;
            if (!pred(it->second))
                return false;
            gone = std::move(it->second);
            devices_.erase(it);
            handler = on_removed_;
        }
        if (gone.link)
            gone.link->close();
        log_.info("device disconnected: " + id + " (" + to_string(reason) + ")");
        if (handler)
            handler(gone, reason);
        return true;
    }

    std::vector<ConnectedDevice> snapshot() const
    {
        std::scoped_lock lk(m_);
        std::vector<ConnectedDevice> out;
        out.reserve(devices_.size());
        for (const auto &[id, dev] : devices_)
            out.push_back(dev);
        return out;
    }

    std::optional<ConnectedDevice> find(const std::string &id) const
    {
        std::scoped_lock lk(m_);
        auto it = devices_.find(id);
        if (it == devices_.end())
            return std::nullopt;
        return it->second;
    }

    std::vector<std::string> ids() const
    {
        std::scoped_lock lk(m_);
        std::vector<std::string> out;
        out.reserve(devices_.size());
        for (const auto &kv : devices_)
            out.push_back(kv.first);
        return out;
    }

    bool contains(const std::string &id) const
    {
        std::scoped_lock lk(m_);
        return devices_.count(id) != 0;
    }

    std::size_t size() const
    {
        std::scoped_lock lk(m_);
        return devices_.size();
    }

    // Unknown id -> false. A failed write disconnects the device.
    bool send(const std::string &id, const std::string &frame)
    {
        std::shared_ptr<DeviceLink> link;
        {
            std::scoped_lock lk(m_);
            auto it = devices_.find(id);
            if (it == devices_.end())
            {
                log_.debug("send to unknown device: " + id);
                return false;
            }
            link = it->second.link;
        }
        if (link && link->send(frame))
            return true;
        log_.warn("send failed to " + id + ", disconnecting");
        unregister(id, DisconnectReason::kWriteError, link.get());
        return false;
    }

    // Sends to a snapshot of ids. Returns how many writes succeeded and, when
    // asked, which devices they were.
    std::size_t broadcast(const std::string &frame, std::vector<std::string> *delivered = nullptr)
    {
        std::size_t ok = 0;
        for (const auto &id : ids())
        {
            if (send(id, frame))
            {
                ++ok;
                if (delivered)
                    delivered->push_back(id);
            }
        }
        return ok;
    }

    // Disconnects every device silent for longer than `timeout`. Returns the
    // ids this call removed; a concurrent sweep never removes the same one.
    std::vector<std::string> sweep(Clock::time_point now, std::chrono::milliseconds timeout)
    {
        std::vector<std::string> stale;
        {
            std::scoped_lock lk(m_);
            for (const auto &[id, dev] : devices_)
                if (now - dev.last_heartbeat > timeout)
                    stale.push_back(id);
        }
        std::vector<std::string> removed;
        for (const auto &id : stale)
        {
            // re-checked under the lock: traffic may have arrived meanwhile
            auto still_stale = [&](const ConnectedDevice &d)
            { return now - d.last_heartbeat > timeout; };
            if (unregister_if(id, DisconnectReason::kHeartbeatTimeout, still_stale))
                removed.push_back(id);
        }
        return removed;
    }

private:
    mutable std::mutex m_;
    std::map<std::string, ConnectedDevice> devices_;
    RemovalHandler on_removed_;
    Logger &log_;
};
