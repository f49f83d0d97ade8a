#include "onionchat/errors.hpp"

namespace OnionChat {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_ARGUMENT: return "invalid argument";
        case ErrorCode::LOGIC: return "logic error";
        case ErrorCode::ENTROPY_FAILURE: return "entropy failure";
        case ErrorCode::CORRUPT_STORAGE: return "corrupt storage";
        case ErrorCode::WRONG_PASSWORD: return "wrong password";
        case ErrorCode::HANDSHAKE_TIMEOUT: return "handshake timeout";
        case ErrorCode::HANDSHAKE_MALFORMED: return "handshake malformed";
        case ErrorCode::KEY_EXCHANGE: return "key exchange failure";
        case ErrorCode::AUTH_FAILURE: return "authentication failure";
        case ErrorCode::REPLAY_REJECTED: return "replay rejected";
        case ErrorCode::SESSION_UNKNOWN: return "session unknown";
        case ErrorCode::SESSION_EXHAUSTED: return "session exhausted";
        case ErrorCode::MALFORMED_MESSAGE: return "malformed message";
        case ErrorCode::NOT_CONNECTED: return "not connected";
        case ErrorCode::TRANSPORT_ERROR: return "transport error";
        case ErrorCode::CONFIG_ERROR: return "configuration error";
        case ErrorCode::UNKNOWN: break;
    }
    return "unknown error";
}

} // namespace OnionChat
