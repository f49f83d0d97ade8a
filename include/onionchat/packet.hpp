#ifndef ONIONCHAT_PACKET_HPP
#define ONIONCHAT_PACKET_HPP

#include <algorithm>
#include <arpa/inet.h>
#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

#include "errors.hpp"
#include "keys.hpp"

namespace OnionChat {

    namespace detail {
        #if __BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__
        inline uint64_t htonll_local(uint64_t val) {
            return (((uint64_t)htonl(static_cast<uint32_t>(val))) << 32) + htonl(static_cast<uint32_t>(val >> 32));
        }
        inline uint64_t ntohll_local(uint64_t val) {
            return (((uint64_t)ntohl(static_cast<uint32_t>(val))) << 32) + ntohl(static_cast<uint32_t>(val >> 32));
        }
        #else
        inline uint64_t htonll_local(uint64_t val) { return val; }
        inline uint64_t ntohll_local(uint64_t val) { return val; }
        #endif

        inline void append_be64(byte_vector& out, uint64_t value) {
            for (int shift = 56; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>(value >> shift));
            }
        }

        inline uint64_t read_be64(const uint8_t* in) {
            uint64_t value = 0;
            for (int i = 0; i < 8; ++i) {
                value = (value << 8) | in[i];
            }
            return value;
        }
    }

    /**
     * @brief A typed record: a 16-bit code followed by length-prefixed parameters.
     * Format: [Code (2)] + [Len (4) + Param]*
     */
    class Payload {
    public:
        using OpCode = uint16_t;

        OpCode op_code = 0;
        byte_vector parameters;

        /**
         * @brief Serializes the payload into a single byte vector.
         */
        byte_vector serialize() const;

        /**
         * @brief Deserializes a byte vector into a Payload object.
         * @throws OnionChat::MalformedMessage if the data is too small.
         */
        static Payload deserialize(const byte_vector& data);
    };

    /**
     * @brief A helper class to build a Payload with parameters.
     */
    class PayloadBuilder {
    public:
        explicit PayloadBuilder(Payload::OpCode op_code);

        PayloadBuilder& add_param(const byte_vector& param);
        PayloadBuilder& add_param(const std::string& param);
        PayloadBuilder& add_param(const char* param);

        PayloadBuilder& add_param(uint8_t param);
        PayloadBuilder& add_param(uint16_t param);
        PayloadBuilder& add_param(uint32_t param);
        PayloadBuilder& add_param(int64_t param);
        PayloadBuilder& add_param(uint64_t param);

        Payload build();

    private:
        Payload payload_;
    };

    /**
     * @brief A helper class to parse parameters from a payload.
     *
     * Every read failure throws MalformedMessage, so a parser can treat a
     * missing or mistyped field the same way as a truncated record.
     */
    class PayloadReader {
    public:
        explicit PayloadReader(const Payload& payload);

        template<typename T>
        T read_param() {
            static_assert(std::is_integral<T>::value, "read_param<T> supports integral types, strings and byte vectors");
            byte_vector vec = read_param_bytes();
            if (vec.size() != sizeof(T)) {
                throw MalformedMessage("Invalid payload data: parameter size mismatch for the requested type.");
            }
            T val;
            std::copy(vec.begin(), vec.end(), reinterpret_cast<uint8_t*>(&val));

            if constexpr (sizeof(T) == 2) {
                return static_cast<T>(ntohs(static_cast<uint16_t>(val)));
            } else if constexpr (sizeof(T) == 4) {
                return static_cast<T>(ntohl(static_cast<uint32_t>(val)));
            } else if constexpr (sizeof(T) == 8) {
                return static_cast<T>(detail::ntohll_local(static_cast<uint64_t>(val)));
            } else {
                return val;
            }
        }

        bool has_more() const;

    private:
        byte_vector read_param_bytes();
        const byte_vector& params_data_;
        size_t offset_ = 0;
    };

    template<>
    inline std::string PayloadReader::read_param<std::string>() {
        byte_vector vec = read_param_bytes();
        return std::string(vec.begin(), vec.end());
    }

    template<>
    inline byte_vector PayloadReader::read_param<byte_vector>() {
        return read_param_bytes();
    }

} // namespace OnionChat

#endif // ONIONCHAT_PACKET_HPP
