#include "onionchat/config.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

#include "onionchat/crypto.hpp"
#include "onionchat/errors.hpp"
#include "onionchat/log.hpp"

namespace OnionChat {

namespace {

std::string trim(const std::string& input) {
    const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    auto begin = std::find_if_not(input.begin(), input.end(), is_space);
    auto end = std::find_if_not(input.rbegin(), input.rend(), is_space).base();
    if (begin >= end) {
        return {};
    }
    return std::string(begin, end);
}

std::string strip_inline_comment(const std::string& input) {
    for (size_t i = 0; i < input.size(); ++i) {
        const char ch = input[i];
        if ((ch == '#' || ch == ';') && (i == 0 || std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
            return trim(input.substr(0, i));
        }
    }
    return input;
}

uint64_t parse_unsigned(const std::string& key, const std::string& text, uint64_t max) {
    if (text.empty() || text.front() == '-') {
        throw ConfigError("Invalid value for " + key + ": expected a non-negative integer.");
    }
    errno = 0;
    char* end_ptr = nullptr;
    const unsigned long long value = std::strtoull(text.c_str(), &end_ptr, 10);
    if (end_ptr == text.c_str() || *end_ptr != '\0' || errno == ERANGE || value > max) {
        throw ConfigError("Invalid value for " + key + ": " + text);
    }
    return value;
}

uint16_t parse_port(const std::string& key, const std::string& text) {
    const uint64_t port = parse_unsigned(key, text, 65535);
    if (port == 0) {
        throw ConfigError("Invalid value for " + key + ": port must not be 0.");
    }
    return static_cast<uint16_t>(port);
}

uint32_t parse_u32(const std::string& key, const std::string& text) {
    return static_cast<uint32_t>(parse_unsigned(key, text, std::numeric_limits<uint32_t>::max()));
}

struct IniState {
    std::string section;
    Config* cfg = nullptr;
};

void apply_kv(IniState& state, const std::string& key, const std::string& value) {
    const std::string qualified = state.section + "." + key;
    Config& cfg = *state.cfg;

    if (state.section == "tor") {
        if (key == "socks_host") {
            cfg.tor.socks_host = value;
        } else if (key == "socks_port") {
            cfg.tor.socks_port = parse_port(qualified, value);
        } else if (key == "socks_username") {
            cfg.tor.socks_username = value;
        } else if (key == "socks_password") {
            cfg.tor.socks_password = value;
        } else if (key == "listen_host") {
            cfg.tor.listen_host = value;
        } else if (key == "listen_port") {
            cfg.tor.listen_port = parse_port(qualified, value);
        } else if (key == "virtual_port") {
            cfg.tor.virtual_port = parse_port(qualified, value);
        } else {
            Log::warn("Ignoring unknown configuration key " + qualified);
        }
        return;
    }
    if (state.section == "protocol") {
        if (key == "handshake_timeout") {
            cfg.protocol.handshake_timeout = std::chrono::seconds(parse_u32(qualified, value));
        } else if (key == "keepalive_interval") {
            cfg.protocol.keepalive_interval = std::chrono::seconds(parse_u32(qualified, value));
        } else if (key == "idle_timeout") {
            cfg.protocol.idle_timeout = std::chrono::seconds(parse_u32(qualified, value));
        } else if (key == "max_retries") {
            cfg.protocol.max_retries = parse_u32(qualified, value);
        } else if (key == "backoff_base_ms") {
            cfg.protocol.backoff_base = std::chrono::milliseconds(parse_u32(qualified, value));
        } else if (key == "backoff_max_ms") {
            cfg.protocol.backoff_max = std::chrono::milliseconds(parse_u32(qualified, value));
        } else if (key == "backoff_jitter_percent") {
            cfg.protocol.backoff_jitter_percent = static_cast<uint32_t>(parse_unsigned(qualified, value, 100));
        } else if (key == "max_message_size") {
            cfg.protocol.max_message_size = static_cast<size_t>(parse_u32(qualified, value));
        } else if (key == "padding_block") {
            cfg.protocol.padding_block = static_cast<size_t>(parse_u32(qualified, value));
        } else if (key == "max_auth_failures") {
            cfg.protocol.max_auth_failures = parse_u32(qualified, value);
        } else if (key == "max_clock_skew") {
            cfg.protocol.max_clock_skew = std::chrono::seconds(parse_u32(qualified, value));
        } else {
            Log::warn("Ignoring unknown configuration key " + qualified);
        }
        return;
    }
    if (state.section == "security") {
        if (key == "password_cost") {
            cfg.security.password_cost = value;
        } else {
            Log::warn("Ignoring unknown configuration key " + qualified);
        }
        return;
    }
    if (state.section == "log") {
        if (key == "level") {
            cfg.log.level = value;
        } else {
            Log::warn("Ignoring unknown configuration key " + qualified);
        }
        return;
    }
    Log::warn("Ignoring key " + key + " in unknown section [" + state.section + "]");
}

} // namespace

Config Config::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Config file not found: " + path);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return parse(contents.str());
}

Config Config::parse(const std::string& text) {
    Config cfg;
    IniState state;
    state.cfg = &cfg;

    std::istringstream input(text);
    std::string line;
    size_t line_no = 0;
    while (std::getline(input, line)) {
        ++line_no;
        const std::string trimmed = strip_inline_comment(trim(line));
        if (trimmed.empty()) {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']') {
            state.section = trim(trimmed.substr(1, trimmed.size() - 2));
            continue;
        }
        const auto pos = trimmed.find('=');
        if (pos == std::string::npos) {
            throw ConfigError("Invalid config line " + std::to_string(line_no) + ": expected key = value.");
        }
        apply_kv(state, trim(trimmed.substr(0, pos)), trim(trimmed.substr(pos + 1)));
    }

    cfg.validate();
    return cfg;
}

void Config::validate() const {
    if (tor.socks_host.empty()) {
        throw ConfigError("tor.socks_host must not be empty.");
    }
    if (protocol.handshake_timeout.count() == 0) {
        throw ConfigError("protocol.handshake_timeout must be positive.");
    }
    if (protocol.keepalive_interval.count() == 0) {
        throw ConfigError("protocol.keepalive_interval must be positive.");
    }
    if (protocol.idle_timeout <= protocol.keepalive_interval) {
        throw ConfigError("protocol.idle_timeout must exceed protocol.keepalive_interval.");
    }
    if (protocol.backoff_base.count() == 0 || protocol.backoff_base > protocol.backoff_max) {
        throw ConfigError("protocol.backoff_base_ms must be positive and not above protocol.backoff_max_ms.");
    }
    if (protocol.max_message_size < 1024) {
        throw ConfigError("protocol.max_message_size must be at least 1024 bytes.");
    }
    if (protocol.padding_block == 0 || protocol.padding_block > protocol.max_message_size / 2) {
        throw ConfigError("protocol.padding_block must be positive and well below protocol.max_message_size.");
    }
    if (protocol.max_auth_failures == 0) {
        throw ConfigError("protocol.max_auth_failures must be positive.");
    }
    if (protocol.max_clock_skew.count() == 0) {
        throw ConfigError("protocol.max_clock_skew must be positive.");
    }
    try {
        PasswordCost::from_name(security.password_cost);
    } catch (const InvalidArgument& e) {
        throw ConfigError(std::string("security.password_cost: ") + e.what());
    }
    try {
        Log::parse_level(log.level);
    } catch (const InvalidArgument& e) {
        throw ConfigError(std::string("log.level: ") + e.what());
    }
}

} // namespace OnionChat
