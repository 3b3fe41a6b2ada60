/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Debug builds log to the console from the header; this file backs release builds
#ifndef DEBUG

#include "core/Logger.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string_view>

namespace Delve {
namespace {

namespace fs = std::filesystem;

constexpr const char* LOG_FILE_NAME = "delve.log";
constexpr std::uintmax_t ROTATE_BYTES = 1024 * 1024;
constexpr int KEPT_BACKUPS = 3;

// Appends to <dir>/delve.log. When the file passes ROTATE_BYTES it becomes
// delve.log.1, older backups shift up and delve.log.3 is dropped.
class RotatingLogFile {
public:
    static RotatingLogFile& Instance() {
        static RotatingLogFile sink;
        return sink;
    }

    RotatingLogFile(const RotatingLogFile&) = delete;
    RotatingLogFile& operator=(const RotatingLogFile&) = delete;

    void setDirectory(const std::string& directory) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_opened) {
            return;
        }
        m_directory = directory;
    }

    void append(std::string_view level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_opened) {
            open();
        }

        if (!m_file.is_open()) {
            std::fprintf(stderr, "Delve [%s] %.*s: %s\n", system,
                         static_cast<int>(level.size()), level.data(), message);
            return;
        }

        m_file << timestamp() << ' ' << level << ' ' << system << ": " << message << '\n';
        // Only CRITICAL and ERROR reach this sink, each is written through
        m_file.flush();

        std::error_code ec;
        const std::uintmax_t bytes = fs::file_size(m_path, ec);
        if (!ec && bytes >= ROTATE_BYTES) {
            rotate();
        }
    }

private:
    RotatingLogFile() = default;

    static std::string timestamp() {
        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &now);
#else
        localtime_r(&now, &local);
#endif
        char buffer[32];
        const size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &local);
        return std::string(buffer, written);
    }

    fs::path backupPath(int index) const {
        return fs::path(m_path.string() + "." + std::to_string(index));
    }

    void open() {
        m_opened = true;
        if (m_directory.empty()) {
            return;
        }

        std::error_code ec;
        fs::create_directories(m_directory, ec);
        if (ec) {
            std::fprintf(stderr, "Delve: cannot create log directory %s: %s\n",
                         m_directory.c_str(), ec.message().c_str());
            return;
        }

        m_path = fs::path(m_directory) / LOG_FILE_NAME;
        m_file.open(m_path, std::ios::out | std::ios::app);
        if (!m_file.is_open()) {
            std::fprintf(stderr, "Delve: cannot open %s\n", m_path.string().c_str());
        }
    }

    void rotate() {
        m_file.close();

        std::error_code ec;
        fs::remove(backupPath(KEPT_BACKUPS), ec);
        for (int i = KEPT_BACKUPS - 1; i >= 1; --i) {
            if (fs::exists(backupPath(i), ec)) {
                fs::rename(backupPath(i), backupPath(i + 1), ec);
            }
        }
        fs::rename(m_path, backupPath(1), ec);

        m_file.open(m_path, std::ios::out | std::ios::trunc);
    }

    std::mutex m_mutex;
    std::ofstream m_file;
    std::string m_directory;
    fs::path m_path;
    bool m_opened{false};
};

} // namespace

void Logger::SetLogDirectory(const std::string& directory) {
    RotatingLogFile::Instance().setDirectory(directory);
}

void Logger::Log(const char* level, const char* system, const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    RotatingLogFile::Instance().append(level, system, message);
}

} // namespace Delve

#endif // DEBUG
