#ifndef ONIONCHAT_VERSION_HPP
#define ONIONCHAT_VERSION_HPP

#include <cstdint>
#include <optional>
#include <vector>

namespace OnionChat {

    // Protocol version as a 16-bit integer: 1.0 is 0x0100, 1.1 is 0x0101.
    using Version = uint16_t;

    namespace Versions {
        constexpr Version V1_0 = 0x0100;
    }

    // Supported versions, in descending order of preference.
    const std::vector<Version> SUPPORTED_VERSIONS = {Versions::V1_0};

    /**
     * @brief Picks the protocol version both peers of a handshake speak.
     */
    class VersionNegotiator {
    public:
        /**
         * @brief Selects the best common version.
         *
         * Walks the initiator's list in its order of preference and returns the
         * first entry the responder also supports.
         *
         * @return The selected version, or std::nullopt if there is none.
         */
        static std::optional<Version> negotiate(const std::vector<Version>& initiator_versions,
                                                const std::vector<Version>& responder_versions);

        /**
         * @brief True if the local node supports the given version.
         */
        static bool is_supported(Version version);
    };

} // namespace OnionChat

#endif // ONIONCHAT_VERSION_HPP
