#include "pairlink/protocol/handshake_codec.hpp"
#include "pairlink/crypto/hkdf.hpp"
#include "pairlink/crypto/sodium_interop.hpp"
#include "pairlink/core/constants.hpp"
#include "../codec/proto_mapping.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace pairlink::protocol {
using crypto::Hkdf;
using crypto::SodiumInterop;
using codec::detail::AsBytes;
using proto::pairing::PairingEnvelope;
using proto::pairing::PairingRequest;
using proto::pairing::PairingResponse;

namespace {

class TranscriptBuilder {
public:
    explicit TranscriptBuilder(std::string_view label) {
        bytes_.assign(label.begin(), label.end());
    }

    TranscriptBuilder& U32(const uint32_t value) {
        for (int shift = 24; shift >= 0; shift -= 8) {
            bytes_.push_back(static_cast<uint8_t>(value >> shift));
        }
        return *this;
    }

    TranscriptBuilder& U64(const uint64_t value) {
        for (int shift = 56; shift >= 0; shift -= 8) {
            bytes_.push_back(static_cast<uint8_t>(value >> shift));
        }
        return *this;
    }

    TranscriptBuilder& Field(std::span<const uint8_t> field) {
        U32(static_cast<uint32_t>(field.size()));
        bytes_.insert(bytes_.end(), field.begin(), field.end());
        return *this;
    }

    TranscriptBuilder& Field(const std::string& field) {
        return Field(AsBytes(field));
    }

    TranscriptBuilder& Device(const proto::pairing::DeviceDescriptor& device) {
        return Field(device.hostname()).Field(device.os()).Field(device.platform()).Field(device.arch());
    }

    std::vector<uint8_t> Take() {
        return std::move(bytes_);
    }

private:
    std::vector<uint8_t> bytes_;
};

Result<Unit, PairingFailure> Reject(std::string_view check) {
    return Result<Unit, PairingFailure>::Err(PairingFailure::InvalidHandshake(std::string(check)));
}

bool BytesEqual(std::span<const uint8_t> a, std::span<const uint8_t> b) {
    auto compared = SodiumInterop::ConstantTimeEquals(a, b);
    return compared.IsOk() && compared.Unwrap();
}

}

void PairingKeys::Wipe() {
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(pairing_key));
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(confirmation_key));
}

proto::pairing::PairingMethod HandshakeCodec::ToProto(const session::PairingMethod method) noexcept {
    return method == session::PairingMethod::Direct
        ? proto::pairing::PAIRING_METHOD_DIRECT
        : proto::pairing::PAIRING_METHOD_CODE;
}

session::PairingMethod HandshakeCodec::FromProto(const proto::pairing::PairingMethod method) noexcept {
    return method == proto::pairing::PAIRING_METHOD_DIRECT
        ? session::PairingMethod::Direct
        : session::PairingMethod::Code;
}

std::vector<uint8_t> HandshakeCodec::RequestTranscript(const PairingRequest& request) {
    return TranscriptBuilder(kRequestTranscriptLabel)
        .U32(request.version())
        .U32(request.token_prefix())
        .Field(request.initiator_identifier())
        .Field(request.initiator_display_name())
        .Field(request.nonce())
        .Field(request.initiator_public_key())
        .Field(request.initiator_session_public_key())
        .U32(static_cast<uint32_t>(request.method()))
        .U64(request.sent_at_ms())
        .U64(request.session_expires_at_ms())
        .Device(request.device())
        .Take();
}

std::vector<uint8_t> HandshakeCodec::ResponseTranscript(const PairingResponse& response) {
    return TranscriptBuilder(kResponseTranscriptLabel)
        .U32(response.version())
        .U32(response.token_prefix())
        .U32(response.accepted() ? 1u : 0u)
        .Field(response.responder_display_name())
        .Field(response.nonce_echo())
        .Field(response.responder_identifier())
        .Field(response.responder_public_key())
        .Field(response.responder_session_public_key())
        .Field(response.key_confirmation())
        .Device(response.device())
        .Take();
}

Result<PairingRequest, PairingFailure> HandshakeCodec::BuildRequest(
    const identity::DeviceIdentity& identity,
    const uint32_t token_prefix,
    std::span<const uint8_t> nonce,
    std::span<const uint8_t> session_public_key,
    const session::PairingMethod method,
    const interfaces::TimePoint sent_at,
    const interfaces::TimePoint session_expires_at,
    const identity::DeviceDescriptor& device) {
    if (nonce.size() != kHandshakeNonceBytes || session_public_key.size() != kX25519PublicKeyBytes) {
        return Result<PairingRequest, PairingFailure>::Err(
            PairingFailure::Encode("Request nonce or session key has wrong size"));
    }
    PairingRequest request;
    request.set_version(kPairingProtocolVersion);
    request.set_token_prefix(token_prefix);
    request.set_initiator_identifier(identity.GetPublicIdentifier());
    request.set_initiator_display_name(identity.GetDisplayName());
    request.set_nonce(nonce.data(), nonce.size());
    request.set_initiator_public_key(identity.GetPublicKey().data(), identity.GetPublicKey().size());
    request.set_initiator_session_public_key(session_public_key.data(), session_public_key.size());
    request.set_method(ToProto(method));
    request.set_sent_at_ms(interfaces::ToUnixMillis(sent_at));
    request.set_session_expires_at_ms(interfaces::ToUnixMillis(session_expires_at));
    codec::detail::ToProto(device, request.mutable_device());

    auto signature = identity.Sign(RequestTranscript(request));
    if (signature.IsErr()) {
        return Result<PairingRequest, PairingFailure>::Err(std::move(signature).UnwrapErr());
    }
    const auto& signature_bytes = signature.Unwrap();
    request.set_signature(signature_bytes.data(), signature_bytes.size());
    return Result<PairingRequest, PairingFailure>::Ok(std::move(request));
}

Result<PairingResponse, PairingFailure> HandshakeCodec::BuildResponse(
    const identity::DeviceIdentity& identity,
    const PairingRequest& request,
    const bool accepted,
    std::span<const uint8_t> session_public_key,
    std::span<const uint8_t> key_confirmation,
    const identity::DeviceDescriptor& device) {
    PairingResponse response;
    response.set_version(kPairingProtocolVersion);
    response.set_token_prefix(request.token_prefix());
    response.set_accepted(accepted);
    response.set_responder_display_name(identity.GetDisplayName());
    response.set_nonce_echo(request.nonce());
    response.set_responder_identifier(identity.GetPublicIdentifier());
    response.set_responder_public_key(identity.GetPublicKey().data(), identity.GetPublicKey().size());
    if (accepted) {
        if (session_public_key.size() != kX25519PublicKeyBytes || key_confirmation.size() != kKeyConfirmationBytes) {
            return Result<PairingResponse, PairingFailure>::Err(
                PairingFailure::Encode("Accepting response needs a session key and key confirmation"));
        }
        response.set_responder_session_public_key(session_public_key.data(), session_public_key.size());
        response.set_key_confirmation(key_confirmation.data(), key_confirmation.size());
    }
    codec::detail::ToProto(device, response.mutable_device());

    auto signature = identity.Sign(ResponseTranscript(response));
    if (signature.IsErr()) {
        return Result<PairingResponse, PairingFailure>::Err(std::move(signature).UnwrapErr());
    }
    const auto& signature_bytes = signature.Unwrap();
    response.set_signature(signature_bytes.data(), signature_bytes.size());
    return Result<PairingResponse, PairingFailure>::Ok(std::move(response));
}

Result<std::vector<uint8_t>, PairingFailure> HandshakeCodec::Encode(const PairingRequest& request) {
    PairingEnvelope envelope;
    *envelope.mutable_request() = request;
    std::vector<uint8_t> bytes;
    if (!codec::detail::SerializeMessage(envelope, bytes)) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::Encode("Failed to serialize pairing request"));
    }
    return Result<std::vector<uint8_t>, PairingFailure>::Ok(std::move(bytes));
}

Result<std::vector<uint8_t>, PairingFailure> HandshakeCodec::Encode(const PairingResponse& response) {
    PairingEnvelope envelope;
    *envelope.mutable_response() = response;
    std::vector<uint8_t> bytes;
    if (!codec::detail::SerializeMessage(envelope, bytes)) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::Encode("Failed to serialize pairing response"));
    }
    return Result<std::vector<uint8_t>, PairingFailure>::Ok(std::move(bytes));
}

Result<PairingEnvelope, PairingFailure> HandshakeCodec::Decode(std::span<const uint8_t> bytes) {
    PairingEnvelope envelope;
    if (!envelope.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<PairingEnvelope, PairingFailure>::Err(
            PairingFailure::Decode("Pairing envelope is not a valid message"));
    }
    uint32_t version = 0;
    switch (envelope.body_case()) {
        case PairingEnvelope::kRequest:
            version = envelope.request().version();
            break;
        case PairingEnvelope::kResponse:
            version = envelope.response().version();
            break;
        case PairingEnvelope::BODY_NOT_SET:
            return Result<PairingEnvelope, PairingFailure>::Err(
                PairingFailure::Decode("Pairing envelope is empty"));
    }
    if (version != kPairingProtocolVersion) {
        return Result<PairingEnvelope, PairingFailure>::Err(
            PairingFailure::Decode(fmt::format("Unsupported pairing protocol version {}", version)));
    }
    return Result<PairingEnvelope, PairingFailure>::Ok(std::move(envelope));
}

Result<Unit, PairingFailure> HandshakeCodec::VerifyRequest(
    const PairingRequest& request,
    const interfaces::TimePoint now,
    const interfaces::TimePoint local_expires_at,
    const std::chrono::seconds max_clock_skew) {
    if (request.token_prefix() >= kShareCodeSpace) {
        return Reject("token prefix out of range");
    }
    if (request.nonce().size() != kHandshakeNonceBytes ||
        request.initiator_public_key().size() != kEd25519PublicKeyBytes ||
        request.initiator_session_public_key().size() != kX25519PublicKeyBytes ||
        request.signature().size() != kEd25519SignatureBytes) {
        return Reject("field size");
    }
    if (identity::DeviceIdentity::DeriveIdentifier(AsBytes(request.initiator_public_key())) !=
        request.initiator_identifier()) {
        return Reject("identifier does not match key");
    }
    if (!SodiumInterop::VerifyDetached(
            AsBytes(request.initiator_public_key()),
            RequestTranscript(request),
            AsBytes(request.signature()))) {
        return Reject("signature");
    }
    if (now > interfaces::FromUnixMillis(request.session_expires_at_ms()) || now > local_expires_at) {
        return Reject("expired");
    }
    if (interfaces::FromUnixMillis(request.sent_at_ms()) > now + max_clock_skew) {
        return Reject("sent in the future");
    }
    return Result<Unit, PairingFailure>::Ok(unit);
}

Result<Unit, PairingFailure> HandshakeCodec::VerifyResponse(
    const PairingResponse& response,
    const ResponseExpectation& expected) {
    if (response.token_prefix() != expected.token_prefix) {
        return Reject("token");
    }
    if (!BytesEqual(AsBytes(response.nonce_echo()), expected.nonce)) {
        return Reject("nonce echo");
    }
    if (response.responder_public_key().size() != kEd25519PublicKeyBytes ||
        response.signature().size() != kEd25519SignatureBytes) {
        return Reject("field size");
    }
    if (identity::DeviceIdentity::DeriveIdentifier(AsBytes(response.responder_public_key())) !=
            response.responder_identifier() ||
        response.responder_identifier() != expected.responder_identifier) {
        return Reject("responder identity");
    }
    if (!expected.responder_public_key.empty() &&
        !BytesEqual(AsBytes(response.responder_public_key()), expected.responder_public_key)) {
        return Reject("responder key");
    }
    if (response.accepted()) {
        if (response.responder_session_public_key().size() != kX25519PublicKeyBytes ||
            response.key_confirmation().size() != kKeyConfirmationBytes) {
            return Reject("session key or confirmation size");
        }
        if (!expected.responder_session_public_key.empty() &&
            !BytesEqual(AsBytes(response.responder_session_public_key()), expected.responder_session_public_key)) {
            return Reject("session key");
        }
    }
    if (!SodiumInterop::VerifyDetached(
            AsBytes(response.responder_public_key()),
            ResponseTranscript(response),
            AsBytes(response.signature()))) {
        return Reject("signature");
    }
    return Result<Unit, PairingFailure>::Ok(unit);
}

Result<PairingKeys, PairingFailure> HandshakeCodec::DeriveKeys(
    const crypto::SecureMemoryHandle& local_session_secret,
    std::span<const uint8_t> peer_session_public_key,
    std::span<const uint8_t> request_nonce) {
    auto shared_result = SodiumInterop::X25519SharedSecret(local_session_secret, peer_session_public_key);
    if (shared_result.IsErr()) {
        return Result<PairingKeys, PairingFailure>::Err(std::move(shared_result).UnwrapErr());
    }
    auto shared = std::move(shared_result).Unwrap();
    auto okm_result = Hkdf::DeriveKeyBytes(
        shared, kPairingKeyBytes + kKeyConfirmationBytes, request_nonce, kPairingKeyInfo);
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(shared));
    if (okm_result.IsErr()) {
        return Result<PairingKeys, PairingFailure>::Err(std::move(okm_result).UnwrapErr());
    }
    auto okm = std::move(okm_result).Unwrap();
    PairingKeys keys;
    keys.pairing_key.assign(okm.begin(), okm.begin() + kPairingKeyBytes);
    keys.confirmation_key.assign(okm.begin() + kPairingKeyBytes, okm.end());
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(okm));
    return Result<PairingKeys, PairingFailure>::Ok(std::move(keys));
}

Result<std::vector<uint8_t>, PairingFailure> HandshakeCodec::ComputeKeyConfirmation(
    std::span<const uint8_t> confirmation_key,
    const uint32_t token_prefix,
    std::span<const uint8_t> request_nonce,
    std::span<const uint8_t> responder_session_public_key) {
    auto message = TranscriptBuilder(kKeyConfirmationInfo)
        .U32(token_prefix)
        .Field(request_nonce)
        .Field(responder_session_public_key)
        .Take();
    return SodiumInterop::HmacSha256(confirmation_key, message);
}

Result<Unit, PairingFailure> HandshakeCodec::VerifyKeyConfirmation(
    const PairingKeys& keys,
    const PairingResponse& response) {
    auto expected = ComputeKeyConfirmation(
        keys.confirmation_key,
        response.token_prefix(),
        AsBytes(response.nonce_echo()),
        AsBytes(response.responder_session_public_key()));
    if (expected.IsErr()) {
        return Reject("key confirmation unavailable");
    }
    if (!BytesEqual(expected.Unwrap(), AsBytes(response.key_confirmation()))) {
        return Reject("key confirmation");
    }
    return Result<Unit, PairingFailure>::Ok(unit);
}

}
