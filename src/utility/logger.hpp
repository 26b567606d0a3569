#pragma once

#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>

namespace flock {

/**
 * Thread-safe logging system for DEBUG builds only
 * Zero overhead in release builds (NDEBUG defined)
 */
class Logger {
  public:
    enum Level {
        DEBUG_LEVEL = 0,
        INFO_LEVEL = 1,
        WARN_LEVEL = 2,
        ERROR_LEVEL = 3
    };

    /**
     * @brief Drops every message below @p level.
     */
    static void set_level(Level level) noexcept {
        min_level().store(level, std::memory_order_relaxed);
    }

    static Level get_level() noexcept {
        return min_level().load(std::memory_order_relaxed);
    }

    static void log(Level level, const std::string &file, int line,
                    const std::string &message) {
#ifdef DEBUG
        if (level < get_level()) {
            return;
        }

        static std::mutex log_mutex;
        std::lock_guard<std::mutex> lock(log_mutex);

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      now.time_since_epoch()) %
                  1000;

        std::string filename = file;
        size_t last_slash = filename.find_last_of("/\\");
        if (last_slash != std::string::npos) {
            filename = filename.substr(last_slash + 1);
        }

        std::cerr << "[" << level_to_string(level) << "]["
                  << std::put_time(std::localtime(&time_t), "%H:%M:%S") << "."
                  << std::setfill('0') << std::setw(3) << ms.count() << "]["
                  << filename << ":" << line << "] " << message << std::endl;
#else
        (void)level;
        (void)file;
        (void)line;
        (void)message;
#endif
    }

  private:
    static std::atomic<Level> &min_level() noexcept {
        static std::atomic<Level> level{DEBUG_LEVEL};
        return level;
    }

    static const char *level_to_string(Level level) {
        switch (level) {
        case DEBUG_LEVEL:
            return "DEBUG";
        case INFO_LEVEL:
            return "INFO ";
        case WARN_LEVEL:
            return "WARN ";
        case ERROR_LEVEL:
            return "ERROR";
        default:
            return "UNKNOWN";
        }
    }
};

} // namespace flock

// Logging macros - compile to nothing in release builds
#ifdef DEBUG
#define LOG_DEBUG(msg)                                                         \
    flock::Logger::log(flock::Logger::DEBUG_LEVEL, __FILE__, __LINE__, msg)
#define LOG_INFO(msg)                                                          \
    flock::Logger::log(flock::Logger::INFO_LEVEL, __FILE__, __LINE__, msg)
#define LOG_WARN(msg)                                                          \
    flock::Logger::log(flock::Logger::WARN_LEVEL, __FILE__, __LINE__, msg)
#define LOG_ERROR(msg)                                                         \
    flock::Logger::log(flock::Logger::ERROR_LEVEL, __FILE__, __LINE__, msg)
#else
#define LOG_DEBUG(msg)                                                         \
    do {                                                                       \
    } while (0)
#define LOG_INFO(msg)                                                          \
    do {                                                                       \
    } while (0)
#define LOG_WARN(msg)                                                          \
    do {                                                                       \
    } while (0)
#define LOG_ERROR(msg)                                                         \
    do {                                                                       \
    } while (0)
#endif
