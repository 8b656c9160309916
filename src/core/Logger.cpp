/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Only compile this file for release builds - debug builds log to stdout inline
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace KeeperEngine {
namespace {

constexpr size_t KEEP_LOG_FILES = 5;
constexpr size_t FLUSH_EVERY = 50;

std::tm localTimeNow(std::chrono::system_clock::time_point now) {
    auto timeNow = std::chrono::system_clock::to_time_t(now);
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &timeNow);
#else
    localtime_r(&timeNow, &timeinfo);
#endif
    return timeinfo;
}

// Session log file under the SDL preference directory
class SessionLogFile {
public:
    static SessionLogFile& Instance() {
        static SessionLogFile instance;
        return instance;
    }

    SessionLogFile(const SessionLogFile&) = delete;
    SessionLogFile& operator=(const SessionLogFile&) = delete;

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!m_opened) {
            open();
        }
        if (!m_stream.is_open()) {
            return;
        }

        // Format: YYYY-MM-DD HH:MM:SS.mmm [LEVEL] [SYSTEM] message
        auto now = std::chrono::system_clock::now();
        std::tm timeinfo = localTimeNow(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;

        m_stream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
                 << std::setfill('0') << std::setw(3) << ms.count() << " ["
                 << level << "] [" << system << "] " << message << '\n';

        if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= FLUSH_EVERY) {
            m_stream.flush();
            m_pending = 0;
        }
    }

private:
    SessionLogFile() = default;

    ~SessionLogFile() {
        if (m_stream.is_open()) {
            m_stream.flush();
        }
    }

    void open() {
        namespace fs = std::filesystem;
        m_opened = true;

        // KEEPER_APP_NAME is defined by CMake from ${PROJECT_NAME}
        char* prefPath = SDL_GetPrefPath("HammerForged", KEEPER_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }
        fs::path logDir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }
        pruneOldLogs(logDir);

        std::tm timeinfo = localTimeNow(std::chrono::system_clock::now());
        std::ostringstream filename;
        filename << "keeper_" << std::put_time(&timeinfo, "%Y%m%d_%H%M%S") << ".log";

        m_stream.open(logDir / filename.str(), std::ios::out | std::ios::app);
        if (m_stream.is_open()) {
            m_stream << "=== " << KEEPER_APP_NAME << " simulation log ===\n"
                     << "Started: " << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S")
                     << "\n\n";
            m_stream.flush();
        }
    }

    // Keeps the newest KEEP_LOG_FILES - 1 logs so the new one makes KEEP_LOG_FILES
    static void pruneOldLogs(const std::filesystem::path& logDir) {
        namespace fs = std::filesystem;
        std::vector<fs::directory_entry> logs;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            if (entry.path().extension() == ".log" &&
                entry.path().filename().string().starts_with("keeper_")) {
                logs.push_back(entry);
            }
        }
        if (logs.size() < KEEP_LOG_FILES) {
            return;
        }

        std::sort(logs.begin(), logs.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return fs::last_write_time(a) < fs::last_write_time(b);
                  });
        size_t excess = logs.size() - (KEEP_LOG_FILES - 1);
        for (size_t i = 0; i < excess; ++i) {
            fs::remove(logs[i].path(), ec);
        }
    }

    std::mutex m_mutex;
    std::ofstream m_stream;
    bool m_opened{false};
    size_t m_pending{0};
};

} // anonymous namespace

void Logger::Log(const char* level, const char* system,
                 const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_benchmarkMode.load(std::memory_order_relaxed)) {
        return;
    }
    SessionLogFile::Instance().write(level, system, message);
}

} // namespace KeeperEngine

#endif // ifndef DEBUG
