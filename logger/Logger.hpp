//
// Created by Revhome on 13.10.2025.
//

#ifndef HAR_REPLAY_APP_LOGGER_HPP
#define HAR_REPLAY_APP_LOGGER_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>

/**
 * Логгер с уровнями DEBUG, INFO, WARNING, ERROR
 *
 * Использование:
 *   Logger::setLevel(LogLevel::DEBUG);
 *   HAR_LOG_DEBUG("Request matched: " << url);
 *   Logger::setSink([](LogLevel level, const std::string &line) { ... });
 *
 * Потокобезопасен. По умолчанию WARNING/ERROR идут в std::cerr, остальное в std::cout.
 */

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    NONE = 4  // Логирование выключено
};

class Logger {
public:
    using Sink = std::function<void(LogLevel, const std::string &)>;

    static void setLevel(LogLevel level) { current_level_.store(level); }

    static LogLevel getLevel() { return current_level_.load(); }

    static void setShowTimestamp(bool show);

    // Пустая функция возвращает вывод в консоль
    static void setSink(Sink sink);

    static bool isEnabled(LogLevel level) {
        return level != LogLevel::NONE && level >= current_level_.load();
    }

    static void log(LogLevel level, const std::string &message);

    static const char *levelToString(LogLevel level);

private:
    static std::atomic<LogLevel> current_level_;
    static bool show_timestamp_;
    static Sink sink_;
    static std::mutex mutex_;
};

#define HAR_LOG_AT(level, msg) \
    do { \
        if (Logger::isEnabled(level)) { \
            std::ostringstream har_log_oss_; \
            har_log_oss_ << msg; \
            Logger::log(level, har_log_oss_.str()); \
        } \
    } while (0)

#define HAR_LOG_DEBUG(msg) HAR_LOG_AT(LogLevel::DEBUG, msg)
#define HAR_LOG_INFO(msg) HAR_LOG_AT(LogLevel::INFO, msg)
#define HAR_LOG_WARNING(msg) HAR_LOG_AT(LogLevel::WARNING, msg)
#define HAR_LOG_ERROR(msg) HAR_LOG_AT(LogLevel::ERROR, msg)

#endif //HAR_REPLAY_APP_LOGGER_HPP
