#ifndef ONIONCHAT_SOCKS5_HPP
#define ONIONCHAT_SOCKS5_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "keys.hpp"

namespace OnionChat {
namespace net {
namespace socks5 {

    // RFC 1928 / RFC 1929 constants.
    constexpr uint8_t VERSION = 0x05;
    constexpr uint8_t AUTH_VERSION = 0x01;
    constexpr uint8_t METHOD_NO_AUTH = 0x00;
    constexpr uint8_t METHOD_USER_PASS = 0x02;
    constexpr uint8_t METHOD_UNACCEPTABLE = 0xFF;
    constexpr uint8_t CMD_CONNECT = 0x01;
    constexpr uint8_t ATYP_IPV4 = 0x01;
    constexpr uint8_t ATYP_DOMAIN = 0x03;
    constexpr uint8_t ATYP_IPV6 = 0x04;
    constexpr uint8_t REPLY_SUCCEEDED = 0x00;

    constexpr size_t METHOD_REPLY_BYTES = 2;
    constexpr size_t AUTH_REPLY_BYTES = 2;
    // VER REP RSV ATYP plus the first address byte, which for a domain is its length.
    constexpr size_t CONNECT_REPLY_HEAD_BYTES = 5;

    struct Credentials {
        std::string username;
        std::string password;

        bool empty() const { return username.empty() && password.empty(); }
    };

    /**
     * @brief Method selection message: offers no-auth, or username/password when credentials are set.
     */
    byte_vector greeting(const Credentials& credentials);

    /**
     * @brief Validates the method selection reply.
     * @return The method chosen by the proxy.
     * @throws TransportError if the reply is malformed or selects a method that was not offered.
     */
    uint8_t parse_method_reply(const byte_vector& reply, const Credentials& credentials);

    /**
     * @brief RFC 1929 username/password request.
     * @throws InvalidArgument if a field is longer than 255 bytes.
     */
    byte_vector auth_request(const Credentials& credentials);

    /**
     * @throws TransportError if the proxy rejected the credentials.
     */
    void parse_auth_reply(const byte_vector& reply);

    /**
     * @brief CONNECT request with a domain-name address.
     * @throws InvalidArgument if host is empty or longer than 255 bytes.
     */
    byte_vector connect_request(const std::string& host, uint16_t port);

    /**
     * @brief Checks the first CONNECT_REPLY_HEAD_BYTES of the reply.
     * @return How many more bytes of bound address and port follow.
     * @throws TransportError carrying the proxy's reason if the request failed.
     */
    size_t parse_connect_reply_head(const byte_vector& head);

    // Text for a REP code, e.g. "host unreachable".
    const char* reply_message(uint8_t code);

} // namespace socks5
} // namespace net
} // namespace OnionChat

#endif // ONIONCHAT_SOCKS5_HPP
