#ifndef ONIONCHAT_LOG_HPP
#define ONIONCHAT_LOG_HPP

#include <string>

namespace OnionChat {

    enum class LogLevel {
        ERROR = 0,
        WARN = 1,
        INFO = 2,
        DEBUG = 3
    };

    /**
     * @brief Process-wide diagnostics on std::cerr.
     *
     * Never pass key material or message plaintext to these functions.
     */
    class Log {
    public:
        static void set_level(LogLevel level);
        static LogLevel level();

        /**
         * @brief Parses "error", "warn", "info" or "debug".
         * @throws InvalidArgument for any other name.
         */
        static LogLevel parse_level(const std::string& name);

        static void error(const std::string& message);
        static void warn(const std::string& message);
        static void info(const std::string& message);
        static void debug(const std::string& message);

    private:
        static void write(LogLevel level, const std::string& message);
    };

} // namespace OnionChat

#endif // ONIONCHAT_LOG_HPP
