#include "onionchat/socks5.hpp"

#include "onionchat/errors.hpp"

namespace OnionChat {
namespace net {
namespace socks5 {

byte_vector greeting(const Credentials& credentials) {
    byte_vector req;
    req.push_back(VERSION);
    if (credentials.empty()) {
        req.push_back(0x01);
        req.push_back(METHOD_NO_AUTH);
    } else {
        req.push_back(0x02);
        req.push_back(METHOD_NO_AUTH);
        req.push_back(METHOD_USER_PASS);
    }
    return req;
}

uint8_t parse_method_reply(const byte_vector& reply, const Credentials& credentials) {
    if (reply.size() != METHOD_REPLY_BYTES || reply[0] != VERSION) {
        throw TransportError("Proxy is not a SOCKS5 server.");
    }
    const uint8_t method = reply[1];
    if (method == METHOD_NO_AUTH) {
        return method;
    }
    if (method == METHOD_USER_PASS && !credentials.empty()) {
        return method;
    }
    throw TransportError("Proxy offered no acceptable authentication method.");
}

byte_vector auth_request(const Credentials& credentials) {
    if (credentials.username.size() > 255 || credentials.password.size() > 255) {
        throw InvalidArgument("SOCKS5 username and password are limited to 255 bytes.");
    }
    byte_vector auth;
    auth.reserve(3 + credentials.username.size() + credentials.password.size());
    auth.push_back(AUTH_VERSION);
    auth.push_back(static_cast<uint8_t>(credentials.username.size()));
    auth.insert(auth.end(), credentials.username.begin(), credentials.username.end());
    auth.push_back(static_cast<uint8_t>(credentials.password.size()));
    auth.insert(auth.end(), credentials.password.begin(), credentials.password.end());
    return auth;
}

void parse_auth_reply(const byte_vector& reply) {
    if (reply.size() != AUTH_REPLY_BYTES || reply[0] != AUTH_VERSION || reply[1] != 0x00) {
        throw TransportError("Proxy rejected the SOCKS5 credentials.");
    }
}

byte_vector connect_request(const std::string& host, uint16_t port) {
    if (host.empty() || host.size() > 255) {
        throw InvalidArgument("SOCKS5 domain names must be 1 to 255 bytes long.");
    }
    byte_vector req;
    req.reserve(4 + 1 + host.size() + 2);
    req.push_back(VERSION);
    req.push_back(CMD_CONNECT);
    req.push_back(0x00);
    req.push_back(ATYP_DOMAIN);
    req.push_back(static_cast<uint8_t>(host.size()));
    req.insert(req.end(), host.begin(), host.end());
    req.push_back(static_cast<uint8_t>((port >> 8) & 0xFF));
    req.push_back(static_cast<uint8_t>(port & 0xFF));
    return req;
}

size_t parse_connect_reply_head(const byte_vector& head) {
    if (head.size() != CONNECT_REPLY_HEAD_BYTES || head[0] != VERSION) {
        throw TransportError("Malformed SOCKS5 connect reply.");
    }
    if (head[1] != REPLY_SUCCEEDED) {
        throw TransportError(std::string("SOCKS5 connect failed: ") + reply_message(head[1]));
    }
    // One address byte has already been read as part of the head.
    switch (head[3]) {
        case ATYP_IPV4:
            return 4 - 1 + 2;
        case ATYP_DOMAIN:
            return static_cast<size_t>(head[4]) + 2;
        case ATYP_IPV6:
            return 16 - 1 + 2;
        default:
            throw TransportError("SOCKS5 reply has an unknown address type.");
    }
}

const char* reply_message(uint8_t code) {
    switch (code) {
        case 0x00: return "succeeded";
        case 0x01: return "general SOCKS server failure";
        case 0x02: return "connection not allowed by ruleset";
        case 0x03: return "network unreachable";
        case 0x04: return "host unreachable";
        case 0x05: return "connection refused";
        case 0x06: return "TTL expired";
        case 0x07: return "command not supported";
        case 0x08: return "address type not supported";
        default: return "unknown error";
    }
}

} // namespace socks5
} // namespace net
} // namespace OnionChat
