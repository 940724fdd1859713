/*
 * File: src/rig_transfer.hpp
 * Project: Rig Marshal
 * Purpose: Per-device chunked file transfer reassembly
 * Notes:
 *  - Chunks go to the most recently announced file
 *  - Duplicate sequence numbers replace the earlier chunk
 * Last updated: 2026-10-18
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/base64.hpp"
#include "common/wire.hpp"


struct PendingFileTransfer
{
    std::string name;
    uint64_t expected_size = 0;
    uint64_t received_bytes = 0;
    std::map<int64_t, std::string> chunks; // seq -> decoded bytes
    std::chrono::system_clock::time_point start_time;

    // Missing sequence numbers, counting from 0 up to the highest received.
    std::vector<int64_t> gaps() const
    {
        std::vector<int64_t> out;
        if (chunks.empty())
            return out;
        int64_t want = std::min<int64_t>(0, chunks.begin()->first);
        for (const auto &kv : chunks)
        {
            for (; want < kv.first; ++want)
                out.push_back(want);
            want = kv.first + 1;
        }
        return out;
    }
};

// Progress view published on the device record.
struct TransferProgress
{
    std::string name;
    uint64_t expected_size = 0;
    uint64_t received_bytes = 0;
    std::size_t chunk_count = 0;
    std::chrono::system_clock::time_point start_time;
};

struct CompletedTransfer
{
    std::string device_id;
    std::string name;
    uint64_t expected_size = 0;
    std::string bytes; // chunks concatenated in sequence order
    std::size_t chunk_count = 0;
    std::vector<int64_t> gaps;
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    std::optional<std::string> session_id;

    bool complete() const { return gaps.empty() && bytes.size() == expected_size; }
};


// Chunk custody for one device. Not locked; the device manager serializes
// access under its own mutex.
class FileTransferAssembler
{
public:
    enum class ChunkResult
    {
        kStored,
        kReplaced,
        kNoActiveTransfer,
        kBadPayload,
    };

    explicit FileTransferAssembler(std::string device_id = {}) : device_id_(std::move(device_id)) {}

    // Starts (or restarts) a transfer. The announced file receives the
    // chunks that follow; a restart of a pending name discards its chunks.
    bool begin(const FileInfoMsg &info)
    {
        PendingFileTransfer t;
        t.name = info.name;
        t.expected_size = info.size;
        t.start_time = std::chrono::system_clock::now();
        const bool restarted = pending_.count(info.name) != 0;
        pending_[info.name] = std::move(t);
        active_ = info.name;
        return restarted;
    }

    ChunkResult add_chunk(const FileChunkMsg &chunk)
    {
        if (!active_)
            return ChunkResult::kNoActiveTransfer;
        auto it = pending_.find(*active_);
        if (it == pending_.end())
            return ChunkResult::kNoActiveTransfer;
        auto bytes = base64_decode(chunk.data);
        if (!bytes)
            return ChunkResult::kBadPayload;

        auto &t = it->second;
        auto [slot, inserted] = t.chunks.try_emplace(chunk.seq);
        if (!inserted)
            t.received_bytes -= slot->second.size();
        slot->second = std::move(*bytes);
        t.received_bytes += slot->second.size();
        return inserted ? ChunkResult::kStored : ChunkResult::kReplaced;
    }

    // Removes the pending entry and hands back the stitched bytes. nullopt if
    // no transfer with that name is pending.
    std::optional<CompletedTransfer> finish(const FileEndMsg &end)
    {
        auto it = pending_.find(end.name);
        if (it == pending_.end())
            return std::nullopt;
        PendingFileTransfer t = std::move(it->second);
        pending_.erase(it);
        if (active_ && *active_ == end.name)
            active_.reset();

        CompletedTransfer done;
        done.device_id = device_id_;
        done.name = t.name;
        done.expected_size = t.expected_size;
        done.chunk_count = t.chunks.size();
        done.gaps = t.gaps();
        done.start_time = t.start_time;
        done.end_time = std::chrono::system_clock::now();
        done.bytes.reserve(static_cast<std::size_t>(t.received_bytes));
        for (const auto &kv : t.chunks)
            done.bytes += kv.second;
        return done;
    }

    // Drops everything still pending (disconnect). Returns what was dropped.
    std::vector<PendingFileTransfer> abandon()
    {
        std::vector<PendingFileTransfer> out;
        for (auto &kv : pending_)
            out.push_back(std::move(kv.second));
        pending_.clear();
        active_.reset();
        return out;
    }

    const PendingFileTransfer *find(const std::string &name) const
    {
        auto it = pending_.find(name);
        return it == pending_.end() ? nullptr : &it->second;
    }

    std::map<std::string, TransferProgress> progress() const
    {
        std::map<std::string, TransferProgress> out;
        for (const auto &[name, t] : pending_)
            out[name] = TransferProgress{t.name, t.expected_size, t.received_bytes, t.chunks.size(), t.start_time};
        return out;
    }

    std::size_t pending_count() const { return pending_.size(); }
    const std::optional<std::string> &active() const { return active_; }

private:
    std::string device_id_;
    std::map<std::string, PendingFileTransfer> pending_;
    std::optional<std::string> active_;
};
