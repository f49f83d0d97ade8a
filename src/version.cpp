#include "onionchat/version.hpp"

#include <algorithm>

namespace OnionChat {

    std::optional<Version> VersionNegotiator::negotiate(const std::vector<Version>& initiator_versions,
                                                        const std::vector<Version>& responder_versions) {
        for (const auto& offered : initiator_versions) {
            if (std::find(responder_versions.begin(), responder_versions.end(), offered) != responder_versions.end()) {
                return offered;
            }
        }
        return std::nullopt;
    }

    bool VersionNegotiator::is_supported(Version version) {
        return std::find(SUPPORTED_VERSIONS.begin(), SUPPORTED_VERSIONS.end(), version) != SUPPORTED_VERSIONS.end();
    }

} // namespace OnionChat
