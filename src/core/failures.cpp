#include "pairlink/core/failures.hpp"

namespace pairlink {

std::string_view FailureTypeName(const PairingFailureType type) noexcept {
    switch (type) {
        case PairingFailureType::DuplicateToken: return "DuplicateToken";
        case PairingFailureType::DirectoryUnavailable: return "DirectoryUnavailable";
        case PairingFailureType::NotFound: return "NotFound";
        case PairingFailureType::Unreachable: return "Unreachable";
        case PairingFailureType::InvalidHandshake: return "InvalidHandshake";
        case PairingFailureType::Expired: return "Expired";
        case PairingFailureType::Cancelled: return "Cancelled";
        case PairingFailureType::InvalidFormat: return "InvalidFormat";
        case PairingFailureType::InvalidState: return "InvalidState";
        case PairingFailureType::KeyGeneration: return "KeyGeneration";
        case PairingFailureType::Crypto: return "Crypto";
        case PairingFailureType::Decode: return "Decode";
        case PairingFailureType::Encode: return "Encode";
        case PairingFailureType::Storage: return "Storage";
        case PairingFailureType::RejectedByPeer: return "RejectedByPeer";
        case PairingFailureType::RejectedLocally: return "RejectedLocally";
    }
    return "Unknown";
}

std::string_view UserFacingMessage(const PairingFailureType type) noexcept {
    switch (type) {
        case PairingFailureType::NotFound:
        case PairingFailureType::InvalidFormat:
            return "invalid or expired code";
        case PairingFailureType::Unreachable:
            return "could not connect";
        case PairingFailureType::Expired:
            return "pairing code expired";
        case PairingFailureType::Cancelled:
            return "pairing cancelled";
        case PairingFailureType::RejectedByPeer:
        case PairingFailureType::RejectedLocally:
            return "pairing declined";
        case PairingFailureType::DirectoryUnavailable:
            return "network unavailable";
        default:
            return "pairing failed";
    }
}

}
