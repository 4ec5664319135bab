/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only; debug builds log to the console from the header
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace Ironclad {
namespace {

constexpr const char* kLogPrefix = "ironclad_";
constexpr size_t kKeptLogFiles = 5;
constexpr size_t kFlushInterval = 20;

std::tm localTime(std::time_t stamp) {
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &stamp);
#else
    localtime_r(&stamp, &timeinfo);
#endif
    return timeinfo;
}

// Rotating session log under the SDL preference path
class SessionLog {
public:
    static SessionLog& Instance() {
        static SessionLog instance;
        return instance;
    }

    void append(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_mutex);

        if (!m_opened) {
            open();
        }
        if (!m_stream.is_open()) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        std::tm timeinfo = localTime(std::chrono::system_clock::to_time_t(now));
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;

        m_stream << std::put_time(&timeinfo, "%H:%M:%S") << '.'
                 << std::setfill('0') << std::setw(3) << ms.count() << " ["
                 << level << "] [" << system << "] " << message << '\n';

        if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= kFlushInterval) {
            m_stream.flush();
            m_pending = 0;
        }
    }

    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

private:
    SessionLog() = default;
    ~SessionLog() {
        if (m_stream.is_open()) {
            m_stream.flush();
        }
    }

    void open() {
        namespace fs = std::filesystem;
        m_opened = true;

        // IRONCLAD_APP_NAME comes from CMake (${PROJECT_NAME})
        char* prefPath = SDL_GetPrefPath("HammerForged", IRONCLAD_APP_NAME);
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

        std::tm timeinfo = localTime(std::time(nullptr));
        std::ostringstream name;
        name << kLogPrefix << std::put_time(&timeinfo, "%Y%m%d_%H%M%S") << ".log";

        m_stream.open(logDir / name.str(), std::ios::out | std::ios::app);
        if (m_stream.is_open()) {
            m_stream << "=== " << IRONCLAD_APP_NAME << " session "
                     << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << " ===\n";
        }
    }

    // Keeps the newest kKeptLogFiles - 1 files so the new session makes kKeptLogFiles
    static void pruneOldLogs(const std::filesystem::path& logDir) {
        namespace fs = std::filesystem;
        std::vector<fs::directory_entry> logs;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            const std::string fileName = entry.path().filename().string();
            if (entry.path().extension() == ".log" && fileName.starts_with(kLogPrefix)) {
                logs.push_back(entry);
            }
        }
        if (logs.size() < kKeptLogFiles) {
            return;
        }

        std::sort(logs.begin(), logs.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return a.last_write_time() < b.last_write_time();
                  });
        const size_t excess = logs.size() - (kKeptLogFiles - 1);
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
    SessionLog::Instance().append(level, system, message);
}

} // namespace Ironclad

#endif // ifndef DEBUG
