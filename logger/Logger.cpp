//
// Created by Revhome on 13.10.2025.
//

#include "Logger.hpp"
#include <ctime>
#include <iostream>

std::atomic<LogLevel> Logger::current_level_{LogLevel::ERROR};
bool Logger::show_timestamp_ = false;
Logger::Sink Logger::sink_;
std::mutex Logger::mutex_;

void Logger::setShowTimestamp(const bool show) {
    std::lock_guard<std::mutex> lock(mutex_);
    show_timestamp_ = show;
}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::log(const LogLevel level, const std::string &message) {
    if (!isEnabled(level)) {
        return;
    }

    std::ostringstream oss;
    Sink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (show_timestamp_) {
            const time_t now = time(nullptr);
            tm local{};
            localtime_r(&now, &local);
            char buf[32];
            strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
            oss << "[" << buf << "] ";
        }
        oss << "[" << levelToString(level) << "] " << message;

        if (!sink_) {
            if (level >= LogLevel::WARNING) {
                std::cerr << oss.str() << "\n" << std::flush;
            } else {
                std::cout << oss.str() << "\n" << std::flush;
            }
            return;
        }
        sink = sink_;
    }

    // Sink вызывается без блокировки: он может сам писать в лог или менять sink
    sink(level, oss.str());
}

const char *Logger::levelToString(const LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARN";
        case LogLevel::ERROR:   return "ERROR";
        default:                return "UNKNOWN";
    }
}
