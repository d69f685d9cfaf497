#include "pairlink/identity/device_identity.hpp"
#include "pairlink/crypto/sodium_interop.hpp"
#include "pairlink/core/constants.hpp"

#include <fmt/format.h>
#include <sys/utsname.h>

#include <algorithm>

namespace pairlink::identity {
using crypto::SodiumInterop;

DeviceDescriptor DeviceDescriptor::Current() {
    DeviceDescriptor descriptor;
    struct utsname info{};
    if (uname(&info) == 0) {
        descriptor.hostname = info.nodename;
        descriptor.os = info.sysname;
        descriptor.platform = info.release;
        descriptor.arch = info.machine;
    }
    return descriptor;
}

DeviceIdentity::DeviceIdentity(
    SecureMemoryHandle secret_key,
    std::vector<uint8_t> public_key,
    std::string display_name,
    const interfaces::TimePoint created_at)
    : secret_key_(std::move(secret_key))
    , public_key_(std::move(public_key))
    , public_identifier_(DeriveIdentifier(public_key_))
    , display_name_(std::move(display_name))
    , created_at_(created_at) {
}

Result<DeviceIdentity, PairingFailure> DeviceIdentity::Create(
    std::string display_name,
    const interfaces::TimePoint created_at) {
    auto keys_result = SodiumInterop::GenerateEd25519KeyPair();
    if (keys_result.IsErr()) {
        return Result<DeviceIdentity, PairingFailure>::Err(std::move(keys_result).UnwrapErr());
    }
    auto [secret_key, public_key] = std::move(keys_result).Unwrap();
    return Result<DeviceIdentity, PairingFailure>::Ok(DeviceIdentity(
        std::move(secret_key), std::move(public_key), std::move(display_name), created_at));
}

Result<DeviceIdentity, PairingFailure> DeviceIdentity::FromKeyMaterial(
    std::span<const uint8_t> ed25519_secret_key,
    std::span<const uint8_t> ed25519_public_key,
    std::string display_name,
    const interfaces::TimePoint created_at) {
    if (ed25519_secret_key.size() != kEd25519SecretKeyBytes ||
        ed25519_public_key.size() != kEd25519PublicKeyBytes) {
        return Result<DeviceIdentity, PairingFailure>::Err(
            PairingFailure::Crypto(fmt::format(
                "Ed25519 key material has wrong size (secret {}, public {})",
                ed25519_secret_key.size(), ed25519_public_key.size())));
    }

    std::vector<uint8_t> derived_public(kEd25519PublicKeyBytes);
    if (crypto_sign_ed25519_sk_to_pk(derived_public.data(), ed25519_secret_key.data()) != SodiumConstants::SUCCESS ||
        !std::equal(derived_public.begin(), derived_public.end(), ed25519_public_key.begin())) {
        return Result<DeviceIdentity, PairingFailure>::Err(
            PairingFailure::Crypto("Ed25519 public key does not match secret key"));
    }

    auto handle_result = SecureMemoryHandle::FromBytes(ed25519_secret_key);
    if (handle_result.IsErr()) {
        return Result<DeviceIdentity, PairingFailure>::Err(
            PairingFailure::FromSodiumFailure(handle_result.UnwrapErr()));
    }
    return Result<DeviceIdentity, PairingFailure>::Ok(DeviceIdentity(
        std::move(handle_result).Unwrap(),
        std::move(derived_public),
        std::move(display_name),
        created_at));
}

std::string DeviceIdentity::DeriveIdentifier(std::span<const uint8_t> ed25519_public_key) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    const auto digest = SodiumInterop::Sha256(ed25519_public_key);
    std::string identifier;
    identifier.reserve(kPeerIdentifierDigestBytes * 2);
    for (size_t i = 0; i < kPeerIdentifierDigestBytes; ++i) {
        identifier.push_back(hex_chars[(digest[i] >> 4) & 0x0F]);
        identifier.push_back(hex_chars[digest[i] & 0x0F]);
    }
    return identifier;
}

Result<std::vector<uint8_t>, PairingFailure> DeviceIdentity::Sign(std::span<const uint8_t> message) const {
    return SodiumInterop::SignDetached(secret_key_, message);
}

Result<std::vector<uint8_t>, PairingFailure> DeviceIdentity::GetSecretKeyCopy() const {
    auto read_result = secret_key_.ReadBytes(kEd25519SecretKeyBytes);
    if (read_result.IsErr()) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::FromSodiumFailure(read_result.UnwrapErr()));
    }
    return Result<std::vector<uint8_t>, PairingFailure>::Ok(std::move(read_result).Unwrap());
}

}
