#include "onionchat/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

#include "onionchat/errors.hpp"

namespace OnionChat {

    static std::atomic<int> g_log_level{static_cast<int>(LogLevel::INFO)};
    static std::mutex g_log_mutex;

    void Log::set_level(LogLevel level) {
        g_log_level = static_cast<int>(level);
    }

    LogLevel Log::level() {
        return static_cast<LogLevel>(g_log_level.load());
    }

    LogLevel Log::parse_level(const std::string& name) {
        if (name == "error") return LogLevel::ERROR;
        if (name == "warn" || name == "warning") return LogLevel::WARN;
        if (name == "info") return LogLevel::INFO;
        if (name == "debug") return LogLevel::DEBUG;
        throw InvalidArgument("Unknown log level: " + name);
    }

    void Log::error(const std::string& message) { write(LogLevel::ERROR, message); }
    void Log::warn(const std::string& message) { write(LogLevel::WARN, message); }
    void Log::info(const std::string& message) { write(LogLevel::INFO, message); }
    void Log::debug(const std::string& message) { write(LogLevel::DEBUG, message); }

    void Log::write(LogLevel level, const std::string& message) {
        if (static_cast<int>(level) > g_log_level.load()) {
            return;
        }
        const char* tag = "";
        switch (level) {
            case LogLevel::ERROR: tag = "[ERROR] "; break;
            case LogLevel::WARN: tag = "[WARN] "; break;
            case LogLevel::INFO: tag = "[INFO] "; break;
            case LogLevel::DEBUG: tag = "[DEBUG] "; break;
        }
        std::lock_guard<std::mutex> lock(g_log_mutex);
        std::cerr << tag << message << std::endl;
    }

} // namespace OnionChat
