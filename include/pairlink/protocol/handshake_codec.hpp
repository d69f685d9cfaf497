#pragma once
#include "pairlink/core/failures.hpp"
#include "pairlink/core/result.hpp"
#include "pairlink/crypto/sodium_secure_memory_handle.hpp"
#include "pairlink/identity/device_identity.hpp"
#include "pairlink/interfaces/i_clock.hpp"
#include "pairlink/session/pairing_state.hpp"
#include "pairing/handshake.pb.h"
#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace pairlink::protocol {

/// Keys both sides derive from the X25519 agreement of their session keys.
/// `pairing_key` is handed to the transfer layer; `confirmation_key` only
/// authenticates the accepting response.
struct PairingKeys {
    std::vector<uint8_t> pairing_key;
    std::vector<uint8_t> confirmation_key;

    void Wipe();
};

/// What a consumer already knows about the peer before the response
/// arrives. Empty key fields are not pinned (nearby pairing has no record).
struct ResponseExpectation {
    uint32_t token_prefix = 0;
    std::vector<uint8_t> nonce;
    std::string responder_identifier;
    std::vector<uint8_t> responder_public_key;
    std::vector<uint8_t> responder_session_public_key;
};

/**
 * @brief Builds, signs, encodes and checks pairing handshake messages
 *
 * Wire format is the PairingEnvelope protobuf. Signatures are Ed25519 over
 * a canonical transcript: a domain label followed by every field except
 * the signature, each length-prefixed (u32 big-endian), integers in
 * big-endian. The response transcript covers the key confirmation, so a
 * relay in the middle cannot strip or swap it.
 *
 * Verify* return InvalidHandshake for every failed check. The message
 * names the check for the debug log only; callers must not forward it.
 */
class HandshakeCodec {
public:
    [[nodiscard]] static Result<proto::pairing::PairingRequest, PairingFailure> BuildRequest(
        const identity::DeviceIdentity& identity,
        uint32_t token_prefix,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> session_public_key,
        session::PairingMethod method,
        interfaces::TimePoint sent_at,
        interfaces::TimePoint session_expires_at,
        const identity::DeviceDescriptor& device);

    /// `session_public_key` and `key_confirmation` are ignored when
    /// `accepted` is false.
    [[nodiscard]] static Result<proto::pairing::PairingResponse, PairingFailure> BuildResponse(
        const identity::DeviceIdentity& identity,
        const proto::pairing::PairingRequest& request,
        bool accepted,
        std::span<const uint8_t> session_public_key,
        std::span<const uint8_t> key_confirmation,
        const identity::DeviceDescriptor& device);

    [[nodiscard]] static Result<std::vector<uint8_t>, PairingFailure> Encode(
        const proto::pairing::PairingRequest& request);

    [[nodiscard]] static Result<std::vector<uint8_t>, PairingFailure> Encode(
        const proto::pairing::PairingResponse& response);

    /// Decode fails on garbage, an empty envelope or a foreign version.
    [[nodiscard]] static Result<proto::pairing::PairingEnvelope, PairingFailure> Decode(
        std::span<const uint8_t> bytes);

    /**
     * @brief Stateless checks on an inbound request
     *
     * Field sizes, identifier/key binding, signature, `now` against both
     * the expiry carried in the message and `local_expires_at`, and a
     * `sent_at` no further than `max_clock_skew` in the future. Replay is
     * the caller's job (NonceLedger).
     */
    [[nodiscard]] static Result<Unit, PairingFailure> VerifyRequest(
        const proto::pairing::PairingRequest& request,
        interfaces::TimePoint now,
        interfaces::TimePoint local_expires_at,
        std::chrono::seconds max_clock_skew);

    /// Token prefix, nonce echo, pinned identity and keys, signature.
    [[nodiscard]] static Result<Unit, PairingFailure> VerifyResponse(
        const proto::pairing::PairingResponse& response,
        const ResponseExpectation& expected);

    [[nodiscard]] static Result<PairingKeys, PairingFailure> DeriveKeys(
        const crypto::SecureMemoryHandle& local_session_secret,
        std::span<const uint8_t> peer_session_public_key,
        std::span<const uint8_t> request_nonce);

    [[nodiscard]] static Result<std::vector<uint8_t>, PairingFailure> ComputeKeyConfirmation(
        std::span<const uint8_t> confirmation_key,
        uint32_t token_prefix,
        std::span<const uint8_t> request_nonce,
        std::span<const uint8_t> responder_session_public_key);

    [[nodiscard]] static Result<Unit, PairingFailure> VerifyKeyConfirmation(
        const PairingKeys& keys,
        const proto::pairing::PairingResponse& response);

    [[nodiscard]] static std::vector<uint8_t> RequestTranscript(const proto::pairing::PairingRequest& request);

    [[nodiscard]] static std::vector<uint8_t> ResponseTranscript(const proto::pairing::PairingResponse& response);

    [[nodiscard]] static proto::pairing::PairingMethod ToProto(session::PairingMethod method) noexcept;

    [[nodiscard]] static session::PairingMethod FromProto(proto::pairing::PairingMethod method) noexcept;

private:
    HandshakeCodec() = delete;
};

}
