/*
 * File: include/atomic_write.hpp
 * Project: Rig Marshal
 * Purpose: Atomic file writes for received files and session records
 * Notes:
 *  - Writes go to <path>.tmp, are fsynced, then renamed over <path>
 *  - Failures throw std::runtime_error; callers catch and log
 * Last updated: 2026-10-18
 */


#pragma once
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>

// Writes <path>.tmp, fsyncs it, then rename()s over the final path. Readers
// see either the old file or the complete new one.
inline void // Atomic write helper
write_atomic(const std::filesystem::path& final_path, std::string_view data) {
    namespace fs = std::filesystem;
    fs::path tmp = final_path;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) throw std::runtime_error("Failed to open temp file: " + tmp.string());
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.flush();
        if (!ofs) throw std::runtime_error("Failed to write temp file: " + tmp.string());
    }
    int fd = ::open(tmp.c_str(), O_RDONLY);
    if (fd >= 0) {
        ::fsync(fd);
        ::close(fd);
    }
    std::error_code ec;
    fs::rename(tmp, final_path, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw std::runtime_error("Failed to rename temp file to " + final_path.string());
    }
}

// Appends one line (e.g. a JSONL record); not atomic across crashes.
inline void append_line(const std::filesystem::path& dst, const std::string& line) {
    std::ofstream f(dst, std::ios::app);
    if (!f) throw std::runtime_error("open for append failed: " + dst.string());
    f << line << '\n';
    if (!f) throw std::runtime_error("append failed: " + dst.string());
}
