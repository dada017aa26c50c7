#include "beamproto/errors.hpp"

namespace BeamProto {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::AuthFailure: return "AuthFailure";
        case ErrorCode::MalformedHandshake: return "MalformedHandshake";
        case ErrorCode::TruncatedStream: return "TruncatedStream";
        case ErrorCode::ProtocolError: return "ProtocolError";
        case ErrorCode::TransportUnavailable: return "TransportUnavailable";
        case ErrorCode::SessionAlreadyActive: return "SessionAlreadyActive";
        case ErrorCode::InvalidToken: return "InvalidToken";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::Unknown: return "Unknown";
    }
    return "Unknown";
}

} // namespace BeamProto
