/*
 * File: src/rig_store.hpp
 * Project: Rig Marshal
 * Purpose: On-disk persistence of received files and sealed sessions
 * Notes:
 *  - Files land under <data>/sessions/<session>/<device>/
 *  - Session files written atomically via include/atomic_write.hpp
 * Last updated: 2026-10-18
 */

#pragma once
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "atomic_write.hpp"
#include "rig_manager.hpp"
#include "rig_state.hpp"

namespace fs = std::filesystem;

// Keeps [A-Za-z0-9._-], maps everything else to '_'. Empty, "." and ".."
// come back as nullopt.
inline std::optional<std::string> sanitize_name(const std::string &name)
{
    std::string out;
    out.reserve(name.size());
    for (char c : name)
    {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                        c == '.' || c == '_' || c == '-';
        out += ok ? c : '_';
    }
    if (out.empty() || out == "." || out == "..")
        return std::nullopt;
    return out;
}

inline void ensure_dir(const fs::path &p)
{
    std::error_code ec;
    if (!fs::exists(p, ec))
    {
        fs::create_directories(p, ec);
        if (ec)
            throw std::runtime_error("create_directories failed: " + ec.message());
    }
}

inline bool read_file_all(const fs::path &p, std::string &out)
{
    std::ifstream f(p);
    if (!f)
        return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}


// Layout under <data_dir>/sessions:
//   <session or _unsessioned>/<device>/<file>   received files
//   <session>/session.json                       sealed session record
//   index.jsonl, latest.json                     session index
class SessionStore
{
public:
    SessionStore(fs::path data_dir, Logger &log) : root_(std::move(data_dir) / "sessions"), log_(log) {}

    const fs::path &root() const { return root_; }

    // Returns where the file landed; nullopt if a name was rejected or the
    // write failed (both logged).
    std::optional<fs::path> save_file(const CompletedTransfer &t)
    {
        auto session = sanitize_name(t.session_id.value_or("_unsessioned"));
        auto device = sanitize_name(t.device_id);
        auto file = sanitize_name(t.name);
        if (!session || !device || !file)
        {
            log_.warn("rejected file name " + t.device_id + "/" + t.name);
            return std::nullopt;
        }
        fs::path dir = root_ / *session / *device;
        fs::path dst = dir / *file;
        try
        {
            std::scoped_lock lk(m_);
            ensure_dir(dir);
            write_atomic(dst, t.bytes);
        }
        catch (const std::exception &e)
        {
            log_.error("failed to store " + dst.string() + ": " + e.what());
            return std::nullopt;
        }
        log_.info("stored " + dst.string() + " (" + std::to_string(t.bytes.size()) + " bytes)");
        return dst;
    }

    bool record_session(const SessionInfo &s)
    {
        auto name = sanitize_name(s.session_id);
        if (!name)
        {
            log_.warn("rejected session id '" + s.session_id + "'");
            return false;
        }
        nlohmann::json entry = session_to_json(s);
        entry["path"] = (root_ / *name).string();
        const std::string dump = entry.dump();
        try
        {
            std::scoped_lock lk(m_);
            ensure_dir(root_ / *name);
            write_atomic(root_ / *name / "session.json", entry.dump(2));
            append_line(root_ / "index.jsonl", dump);
            write_atomic(root_ / "latest.json", dump);
        }
        catch (const std::exception &e)
        {
            log_.error("failed to record session " + s.session_id + ": " + e.what());
            return false;
        }
        return true;
    }

    // Contents of latest.json, if any session was ever recorded.
    std::optional<nlohmann::json> latest() const
    {
        std::string s;
        {
            std::scoped_lock lk(m_);
            if (!read_file_all(root_ / "latest.json", s) || s.empty())
                return std::nullopt;
        }
        auto j = nlohmann::json::parse(s, nullptr, false);
        if (j.is_discarded())
            return std::nullopt;
        return j;
    }

private:
    fs::path root_;
    Logger &log_;
    mutable std::mutex m_;
};
