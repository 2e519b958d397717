/*
 * File: include/atomic_write.hpp
 * Project: Rep Session Bridge
 * Purpose: Replace-in-place file writes for files another process polls
 * Notes:
 *  - State files live under --root, see DESIGN.md
 *  - Workout-id writes are atomic via include/atomic_write.hpp
 *  - Events go out over WebSocket as {topic, payload}
 * Last updated: 2026-10-18
 */


#pragma once
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unistd.h>
#include <fcntl.h>

// Writes <path>.tmp, fsyncs it, then renames over <path>. A reader never sees
// a half-written document, only the old or the new one.
inline void // Atomic write helper
write_atomic(const std::filesystem::path& final_path, const std::string& data) {
    std::filesystem::path tmp = final_path;
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
    std::filesystem::rename(tmp, final_path, ec);
    if (ec) {
        const std::string why = ec.message();
        std::filesystem::remove(tmp, ec);
        throw std::runtime_error("Failed to replace " + final_path.string() + ": " + why);
    }
}
