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

namespace SoloAdventure {
namespace {

constexpr size_t KEEP_LOG_FILES = 5;
constexpr size_t FLUSH_INTERVAL = 20;

std::tm localTime(std::time_t when) {
    std::tm timeinfo{};
#ifdef _WIN32
    localtime_s(&timeinfo, &when);
#else
    localtime_r(&when, &timeinfo);
#endif
    return timeinfo;
}

// Release-build sink: one timestamped file per run under <pref path>/logs
class FileLogger {
public:
    static FileLogger& Instance() {
        static FileLogger instance;
        return instance;
    }

    void write(const char* level, const char* system, const char* message) {
        std::lock_guard<std::mutex> lock(m_fileMutex);

        if (!m_initialized) {
            open();
        }
        if (!m_fileStream.is_open()) {
            return;
        }

        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) % 1000;
        std::tm timeinfo = localTime(std::chrono::system_clock::to_time_t(now));

        m_fileStream << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S") << '.'
                     << std::setfill('0') << std::setw(3) << ms.count() << " ["
                     << level << "] [" << system << "] " << message << '\n';

        // Game sessions are short and crash-prone during play testing, flush often
        if (std::strcmp(level, "CRITICAL") == 0 || ++m_pending >= FLUSH_INTERVAL) {
            m_fileStream.flush();
            m_pending = 0;
        }
    }

private:
    FileLogger() = default;

    ~FileLogger() {
        if (m_fileStream.is_open()) {
            m_fileStream.flush();
        }
    }

    FileLogger(const FileLogger&) = delete;
    FileLogger& operator=(const FileLogger&) = delete;

    void open() {
        m_initialized = true;

        // SOLO_APP_NAME is defined via CMake from ${PROJECT_NAME}
        char* prefPath = SDL_GetPrefPath("HammerForged", SOLO_APP_NAME);
        if (prefPath == nullptr) {
            return;
        }

        namespace fs = std::filesystem;
        fs::path logDir = fs::path(prefPath) / "logs";
        SDL_free(prefPath);

        std::error_code ec;
        fs::create_directories(logDir, ec);
        if (ec) {
            return;
        }

        pruneLogs(logDir);

        std::tm timeinfo = localTime(
            std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()));

        std::ostringstream filename;
        filename << "solo_" << std::put_time(&timeinfo, "%Y%m%d_%H%M%S") << ".log";

        m_fileStream.open(logDir / filename.str(), std::ios::out | std::ios::app);
        if (m_fileStream.is_open()) {
            m_fileStream << "=== " << SOLO_APP_NAME << " Log ===\n"
                         << "Started: "
                         << std::put_time(&timeinfo, "%Y-%m-%d %H:%M:%S")
                         << "\n\n";
            m_fileStream.flush();
        }
    }

    void pruneLogs(const std::filesystem::path& logDir) {
        namespace fs = std::filesystem;

        std::vector<fs::directory_entry> logFiles;
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(logDir, ec)) {
            if (entry.path().extension() == ".log" &&
                entry.path().filename().string().starts_with("solo_")) {
                logFiles.push_back(entry);
            }
        }

        // Keep one slot free for the file this run is about to create
        if (logFiles.size() < KEEP_LOG_FILES) {
            return;
        }

        std::sort(logFiles.begin(), logFiles.end(),
                  [](const fs::directory_entry& a, const fs::directory_entry& b) {
                      return a.last_write_time() < b.last_write_time();
                  });

        size_t toRemove = logFiles.size() - KEEP_LOG_FILES + 1;
        for (size_t i = 0; i < toRemove; ++i) {
            fs::remove(logFiles[i].path(), ec);
        }
    }

    std::mutex m_fileMutex;
    std::ofstream m_fileStream;
    bool m_initialized = false;
    size_t m_pending = 0;
};

} // anonymous namespace

void Logger::Log(const char* level, const char* system,
                 const std::string& message) {
    Log(level, system, message.c_str());
}

void Logger::Log(const char* level, const char* system, const char* message) {
    if (s_quietMode.load(std::memory_order_relaxed)) {
        return;
    }
    FileLogger::Instance().write(level, system, message);
}

} // namespace SoloAdventure

#endif // ifndef DEBUG
