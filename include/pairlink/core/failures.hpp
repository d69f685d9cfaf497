#pragma once
#include <string>
#include <string_view>
namespace pairlink {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooSmall,
    BufferTooLarge,
    SecureWipeFailed,
    AllocationFailed,
    WriteOperationFailed,
    ReadOperationFailed,
    ComparisonFailed,
    InvalidOperation
};
enum class PairingFailureType {
    DuplicateToken,
    DirectoryUnavailable,
    NotFound,
    Unreachable,
    InvalidHandshake,
    Expired,
    Cancelled,
    InvalidFormat,
    InvalidState,
    KeyGeneration,
    Crypto,
    Decode,
    Encode,
    Storage,
    RejectedByPeer,
    RejectedLocally
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooSmall(std::string msg) {
        return {SodiumFailureType::BufferTooSmall, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure SecureWipeFailed(std::string msg) {
        return {SodiumFailureType::SecureWipeFailed, std::move(msg)};
    }
    static SodiumFailure AllocationFailed(std::string msg) {
        return {SodiumFailureType::AllocationFailed, std::move(msg)};
    }
    static SodiumFailure WriteOperationFailed(std::string msg) {
        return {SodiumFailureType::WriteOperationFailed, std::move(msg)};
    }
    static SodiumFailure ReadOperationFailed(std::string msg) {
        return {SodiumFailureType::ReadOperationFailed, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure InvalidOperation(std::string msg) {
        return {SodiumFailureType::InvalidOperation, std::move(msg)};
    }
};

/// Error value carried by every fallible pairing operation.
///
/// `message` is diagnostic text for logs. What a user is shown comes from
/// UserFacingMessage(), which deliberately collapses handshake failures into
/// one generic string.
class PairingFailure {
public:
    PairingFailureType type;
    std::string message;
    PairingFailure(const PairingFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static PairingFailure DuplicateToken(std::string msg) {
        return {PairingFailureType::DuplicateToken, std::move(msg)};
    }
    static PairingFailure DirectoryUnavailable(std::string msg) {
        return {PairingFailureType::DirectoryUnavailable, std::move(msg)};
    }
    static PairingFailure NotFound(std::string msg) {
        return {PairingFailureType::NotFound, std::move(msg)};
    }
    static PairingFailure Unreachable(std::string msg) {
        return {PairingFailureType::Unreachable, std::move(msg)};
    }
    static PairingFailure InvalidHandshake(std::string msg) {
        return {PairingFailureType::InvalidHandshake, std::move(msg)};
    }
    static PairingFailure Expired(std::string msg) {
        return {PairingFailureType::Expired, std::move(msg)};
    }
    static PairingFailure Cancelled(std::string msg) {
        return {PairingFailureType::Cancelled, std::move(msg)};
    }
    static PairingFailure InvalidFormat(std::string msg) {
        return {PairingFailureType::InvalidFormat, std::move(msg)};
    }
    static PairingFailure InvalidState(std::string msg) {
        return {PairingFailureType::InvalidState, std::move(msg)};
    }
    static PairingFailure KeyGeneration(std::string msg) {
        return {PairingFailureType::KeyGeneration, std::move(msg)};
    }
    static PairingFailure Crypto(std::string msg) {
        return {PairingFailureType::Crypto, std::move(msg)};
    }
    static PairingFailure Decode(std::string msg) {
        return {PairingFailureType::Decode, std::move(msg)};
    }
    static PairingFailure Encode(std::string msg) {
        return {PairingFailureType::Encode, std::move(msg)};
    }
    static PairingFailure Storage(std::string msg) {
        return {PairingFailureType::Storage, std::move(msg)};
    }
    static PairingFailure RejectedByPeer(std::string msg) {
        return {PairingFailureType::RejectedByPeer, std::move(msg)};
    }
    static PairingFailure RejectedLocally(std::string msg) {
        return {PairingFailureType::RejectedLocally, std::move(msg)};
    }
    static PairingFailure FromSodiumFailure(const SodiumFailure& sf) {
        return Crypto(sf.message);
    }
    [[nodiscard]] bool IsTransient() const noexcept {
        return type == PairingFailureType::DirectoryUnavailable;
    }
};

[[nodiscard]] std::string_view FailureTypeName(PairingFailureType type) noexcept;

[[nodiscard]] std::string_view UserFacingMessage(PairingFailureType type) noexcept;
}
