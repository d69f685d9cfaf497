#include "pairlink/directory/rendezvous_directory.hpp"
#include "pairlink/crypto/sodium_interop.hpp"
#include "pairlink/identity/device_identity.hpp"
#include "pairlink/core/constants.hpp"
#include "pairlink/core/logger.hpp"
#include "../codec/proto_mapping.hpp"

#include "pairing/rendezvous.pb.h"

#include <fmt/format.h>

#include <algorithm>

namespace pairlink::directory {
using crypto::SodiumInterop;
using codec::detail::AsBytes;
using codec::detail::ToVector;

namespace {
constexpr uint32_t kRecordVersion = 1;
}

RendezvousDirectory::RendezvousDirectory(interfaces::IKeyValueDirectory& store, const interfaces::IClock& clock)
    : store_(store)
    , clock_(clock) {
}

DirectoryKey RendezvousDirectory::KeyFor(const uint32_t token_prefix) {
    std::vector<uint8_t> preimage(kShareCodeNamespace.begin(), kShareCodeNamespace.end());
    preimage.push_back(static_cast<uint8_t>(token_prefix >> 24));
    preimage.push_back(static_cast<uint8_t>(token_prefix >> 16));
    preimage.push_back(static_cast<uint8_t>(token_prefix >> 8));
    preimage.push_back(static_cast<uint8_t>(token_prefix));
    return SodiumInterop::Sha256(preimage);
}

Result<std::vector<uint8_t>, PairingFailure> RendezvousDirectory::EncodeRecord(const RendezvousRecord& record) {
    proto::pairing::RendezvousRecord message;
    message.set_version(kRecordVersion);
    message.set_session_token_hash(record.session_token_hash.data(), record.session_token_hash.size());
    message.set_publisher_identifier(record.publisher_identifier);
    message.set_publisher_public_key(record.publisher_public_key.data(), record.publisher_public_key.size());
    message.set_publisher_display_name(record.publisher_display_name);
    for (const auto& address : record.reachable_addresses) {
        message.add_reachable_addresses(address);
    }
    message.set_session_public_key(record.session_public_key.data(), record.session_public_key.size());
    codec::detail::ToProto(record.device, message.mutable_device());
    message.set_created_at_ms(interfaces::ToUnixMillis(record.created_at));
    message.set_ttl_seconds(static_cast<uint32_t>(record.ttl.count()));

    std::vector<uint8_t> bytes;
    if (!codec::detail::SerializeMessage(message, bytes)) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::Encode("Failed to serialize rendezvous record"));
    }
    return Result<std::vector<uint8_t>, PairingFailure>::Ok(std::move(bytes));
}

Result<RendezvousRecord, PairingFailure> RendezvousDirectory::DecodeRecord(std::span<const uint8_t> bytes) {
    proto::pairing::RendezvousRecord message;
    if (!message.ParseFromArray(bytes.data(), static_cast<int>(bytes.size()))) {
        return Result<RendezvousRecord, PairingFailure>::Err(
            PairingFailure::Decode("Rendezvous record is not a valid message"));
    }
    if (message.version() != kRecordVersion) {
        return Result<RendezvousRecord, PairingFailure>::Err(
            PairingFailure::Decode(fmt::format("Unsupported rendezvous record version {}", message.version())));
    }
    RendezvousRecord record;
    record.session_token_hash = ToVector(message.session_token_hash());
    record.publisher_identifier = message.publisher_identifier();
    record.publisher_public_key = ToVector(message.publisher_public_key());
    record.publisher_display_name = message.publisher_display_name();
    record.reachable_addresses.assign(message.reachable_addresses().begin(), message.reachable_addresses().end());
    record.session_public_key = ToVector(message.session_public_key());
    record.device = codec::detail::FromProto(message.device());
    record.created_at = interfaces::FromUnixMillis(message.created_at_ms());
    record.ttl = std::chrono::seconds(message.ttl_seconds());
    return Result<RendezvousRecord, PairingFailure>::Ok(std::move(record));
}

bool RendezvousDirectory::DeadlinePassed(
    const interfaces::TimePoint started,
    const std::chrono::milliseconds timeout) const {
    return clock_.Now() - started > timeout;
}

Result<RendezvousRecord, PairingFailure> RendezvousDirectory::ValidateRecord(
    const DirectoryKey& key,
    std::span<const uint8_t> bytes) const {
    auto decoded = DecodeRecord(bytes);
    if (decoded.IsErr()) {
        return Result<RendezvousRecord, PairingFailure>::Err(
            PairingFailure::NotFound(decoded.UnwrapErr().message));
    }
    auto record = std::move(decoded).Unwrap();

    if (!std::equal(key.begin(), key.end(), record.session_token_hash.begin(), record.session_token_hash.end())) {
        return Result<RendezvousRecord, PairingFailure>::Err(
            PairingFailure::NotFound("Record hash does not match its key"));
    }
    if (record.publisher_public_key.size() != kEd25519PublicKeyBytes ||
        identity::DeviceIdentity::DeriveIdentifier(record.publisher_public_key) != record.publisher_identifier) {
        return Result<RendezvousRecord, PairingFailure>::Err(
            PairingFailure::NotFound("Record publisher does not match its public key"));
    }
    if (record.session_public_key.size() != kX25519PublicKeyBytes) {
        return Result<RendezvousRecord, PairingFailure>::Err(
            PairingFailure::NotFound("Record carries a malformed session key"));
    }
    if (!record.IsLive(clock_.Now())) {
        return Result<RendezvousRecord, PairingFailure>::Err(
            PairingFailure::NotFound("Record ttl has elapsed"));
    }
    return Result<RendezvousRecord, PairingFailure>::Ok(std::move(record));
}

Result<Unit, PairingFailure> RendezvousDirectory::Publish(
    const DirectoryKey& key,
    const RendezvousRecord& record,
    const std::chrono::seconds ttl,
    const std::chrono::milliseconds timeout) {
    const auto started = clock_.Now();

    auto existing = store_.Get(key, timeout);
    if (existing.IsErr()) {
        return Result<Unit, PairingFailure>::Err(std::move(existing).UnwrapErr());
    }
    if (DeadlinePassed(started, timeout)) {
        return Result<Unit, PairingFailure>::Err(
            PairingFailure::DirectoryUnavailable("Directory lookup before publish timed out"));
    }
    if (const auto& current = existing.Unwrap(); current.has_value()) {
        auto live = ValidateRecord(key, *current);
        if (live.IsOk() && live.Unwrap().publisher_identifier != record.publisher_identifier) {
            return Result<Unit, PairingFailure>::Err(
                PairingFailure::DuplicateToken("A live record from another publisher holds this code"));
        }
    }

    auto encoded = EncodeRecord(record);
    if (encoded.IsErr()) {
        return Result<Unit, PairingFailure>::Err(std::move(encoded).UnwrapErr());
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock_.Now() - started);
    auto put_result = store_.Put(key, std::move(encoded).Unwrap(), ttl, timeout - elapsed);
    if (put_result.IsErr()) {
        return put_result;
    }
    if (DeadlinePassed(started, timeout)) {
        return Result<Unit, PairingFailure>::Err(
            PairingFailure::DirectoryUnavailable("Directory publish timed out"));
    }
    return Result<Unit, PairingFailure>::Ok(unit);
}

Result<RendezvousRecord, PairingFailure> RendezvousDirectory::Resolve(
    const DirectoryKey& key,
    const std::chrono::milliseconds timeout) {
    const auto started = clock_.Now();
    auto lookup = store_.Get(key, timeout);
    if (lookup.IsErr()) {
        return Result<RendezvousRecord, PairingFailure>::Err(std::move(lookup).UnwrapErr());
    }
    if (DeadlinePassed(started, timeout)) {
        return Result<RendezvousRecord, PairingFailure>::Err(
            PairingFailure::DirectoryUnavailable("Directory resolve timed out"));
    }
    const auto& value = lookup.Unwrap();
    if (!value.has_value()) {
        return Result<RendezvousRecord, PairingFailure>::Err(
            PairingFailure::NotFound("No record under this code"));
    }
    return ValidateRecord(key, *value);
}

void RendezvousDirectory::Unpublish(const DirectoryKey& key) {
    if (auto removed = store_.Remove(key); removed.IsErr()) {
        PAIRLINK_LOG_WARN("Unpublish failed, record left to expire: {}", removed.UnwrapErr().message);
    }
}

}
