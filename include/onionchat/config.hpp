#ifndef ONIONCHAT_CONFIG_HPP
#define ONIONCHAT_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace OnionChat {

    struct TorConfig {
        std::string socks_host = "127.0.0.1";
        uint16_t socks_port = 9050;
        // Optional SOCKS5 username/password; Tor uses it for stream isolation.
        std::string socks_username;
        std::string socks_password;
        // Where the hidden service forwards inbound connections.
        std::string listen_host = "127.0.0.1";
        uint16_t listen_port = 11009;
        // Port peers dial on the .onion address.
        uint16_t virtual_port = 11009;
    };

    struct ProtocolConfig {
        std::chrono::seconds handshake_timeout{30};
        std::chrono::seconds keepalive_interval{60};
        std::chrono::seconds idle_timeout{180};
        uint32_t max_retries = 3;
        std::chrono::milliseconds backoff_base{1000};
        std::chrono::milliseconds backoff_max{60000};
        uint32_t backoff_jitter_percent = 20;
        size_t max_message_size = 10 * 1024 * 1024;
        size_t padding_block = 256;
        uint32_t max_auth_failures = 5;
        // Hellos stamped further than this from our clock are refused.
        std::chrono::seconds max_clock_skew{300};
    };

    struct SecurityConfig {
        std::string password_cost = "interactive";
    };

    struct LogConfig {
        std::string level = "info";
    };

    /**
     * @brief Node configuration, read from an INI file.
     *
     * Sections [tor], [protocol], [security] and [log]; '#' and ';' start
     * comments. Keys that are absent keep their defaults.
     */
    struct Config {
        TorConfig tor;
        ProtocolConfig protocol;
        SecurityConfig security;
        LogConfig log;

        /**
         * @brief Reads and validates a configuration file.
         * @throws ConfigError if the file cannot be read or a value is invalid.
         */
        static Config load_file(const std::string& path);

        /**
         * @brief Parses INI text and validates the result.
         * @throws ConfigError naming the offending line or key.
         */
        static Config parse(const std::string& text);

        /**
         * @brief Checks cross-field constraints.
         * @throws ConfigError
         */
        void validate() const;
    };

} // namespace OnionChat

#endif // ONIONCHAT_CONFIG_HPP
