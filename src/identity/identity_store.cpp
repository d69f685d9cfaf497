#include "pairlink/identity/identity_store.hpp"
#include "pairlink/crypto/aes_gcm.hpp"
#include "pairlink/crypto/hkdf.hpp"
#include "pairlink/crypto/sodium_interop.hpp"
#include "pairlink/core/constants.hpp"
#include "pairlink/core/logger.hpp"

#include "identity/identity_state.pb.h"

#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <system_error>

namespace pairlink::identity {
using crypto::AesGcm;
using crypto::Hkdf;
using crypto::SodiumInterop;

namespace {

std::span<const uint8_t> AsBytes(std::string_view text) {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

std::span<const uint8_t> AsBytes(const std::string& bytes) {
    return {reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size()};
}

void Wipe(std::string& buffer) {
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(
        reinterpret_cast<uint8_t*>(buffer.data()), buffer.size()));
}

void Wipe(std::vector<uint8_t>& buffer) {
    (void)SodiumInterop::SecureWipe(std::span<uint8_t>(buffer));
}

}

IdentityStore::IdentityStore(std::filesystem::path path, interfaces::IStateKeyProvider& key_provider)
    : path_(std::move(path))
    , key_provider_(key_provider) {
}

Result<std::vector<uint8_t>, PairingFailure> IdentityStore::DeriveSealKey(std::span<const uint8_t> salt) {
    auto state_key_result = key_provider_.GetStateEncryptionKey();
    if (state_key_result.IsErr()) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(std::move(state_key_result).UnwrapErr());
    }
    const auto state_key = std::move(state_key_result).Unwrap();
    if (state_key.Size() < kAesKeyBytes) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::Crypto(fmt::format(
                "State key must hold at least {} bytes, got {}", kAesKeyBytes, state_key.Size())));
    }

    auto derived = state_key.WithReadAccess([&salt](std::span<const uint8_t> ikm) {
        return Hkdf::DeriveKeyBytes(ikm, kAesKeyBytes, salt, kIdentitySealInfo);
    });
    if (derived.IsErr()) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::FromSodiumFailure(derived.UnwrapErr()));
    }
    return std::move(derived).Unwrap();
}

Result<std::vector<uint8_t>, PairingFailure> IdentityStore::Seal(const DeviceIdentity& identity) {
    auto secret_result = identity.GetSecretKeyCopy();
    if (secret_result.IsErr()) {
        return secret_result;
    }
    auto secret_key = std::move(secret_result).Unwrap();

    proto::identity::IdentityState state;
    state.set_version(kIdentityStateVersion);
    state.set_ed25519_secret_key(secret_key.data(), secret_key.size());
    state.set_ed25519_public_key(identity.GetPublicKey().data(), identity.GetPublicKey().size());
    state.set_display_name(identity.GetDisplayName());
    state.set_created_at_ms(interfaces::ToUnixMillis(identity.GetCreatedAt()));
    Wipe(secret_key);

    std::string plaintext;
    const bool serialized = state.SerializeToString(&plaintext);
    Wipe(*state.mutable_ed25519_secret_key());
    if (!serialized) {
        Wipe(plaintext);
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::Encode("Failed to serialize identity state"));
    }

    const auto salt = SodiumInterop::GetRandomBytes(kIdentitySealSaltBytes);
    const auto nonce = SodiumInterop::GetRandomBytes(kAesGcmNonceBytes);
    auto key_result = DeriveSealKey(salt);
    if (key_result.IsErr()) {
        Wipe(plaintext);
        return key_result;
    }
    auto seal_key = std::move(key_result).Unwrap();
    auto cipher_result = AesGcm::Encrypt(seal_key, nonce, AsBytes(plaintext), AsBytes(kIdentitySealAad));
    Wipe(seal_key);
    Wipe(plaintext);
    if (cipher_result.IsErr()) {
        return cipher_result;
    }
    const auto ciphertext = std::move(cipher_result).Unwrap();

    proto::identity::SealedIdentity sealed;
    sealed.set_version(kIdentityStateVersion);
    sealed.set_salt(salt.data(), salt.size());
    sealed.set_nonce(nonce.data(), nonce.size());
    sealed.set_ciphertext(ciphertext.data(), ciphertext.size());

    std::vector<uint8_t> output(sealed.ByteSizeLong());
    if (!sealed.SerializeToArray(output.data(), static_cast<int>(output.size()))) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::Encode("Failed to serialize sealed identity"));
    }
    return Result<std::vector<uint8_t>, PairingFailure>::Ok(std::move(output));
}

Result<DeviceIdentity, PairingFailure> IdentityStore::Open(std::span<const uint8_t> sealed_bytes) {
    proto::identity::SealedIdentity sealed;
    if (!sealed.ParseFromArray(sealed_bytes.data(), static_cast<int>(sealed_bytes.size()))) {
        return Result<DeviceIdentity, PairingFailure>::Err(
            PairingFailure::Decode("Sealed identity is not a valid message"));
    }
    if (sealed.version() != kIdentityStateVersion) {
        return Result<DeviceIdentity, PairingFailure>::Err(
            PairingFailure::Decode(fmt::format("Unsupported identity version {}", sealed.version())));
    }
    if (sealed.salt().size() != kIdentitySealSaltBytes || sealed.nonce().size() != kAesGcmNonceBytes) {
        return Result<DeviceIdentity, PairingFailure>::Err(
            PairingFailure::Decode("Sealed identity has malformed salt or nonce"));
    }

    auto key_result = DeriveSealKey(AsBytes(sealed.salt()));
    if (key_result.IsErr()) {
        return Result<DeviceIdentity, PairingFailure>::Err(std::move(key_result).UnwrapErr());
    }
    auto seal_key = std::move(key_result).Unwrap();
    auto plain_result = AesGcm::Decrypt(
        seal_key, AsBytes(sealed.nonce()), AsBytes(sealed.ciphertext()), AsBytes(kIdentitySealAad));
    Wipe(seal_key);
    if (plain_result.IsErr()) {
        return Result<DeviceIdentity, PairingFailure>::Err(std::move(plain_result).UnwrapErr());
    }
    auto plaintext = std::move(plain_result).Unwrap();

    proto::identity::IdentityState state;
    const bool parsed = state.ParseFromArray(plaintext.data(), static_cast<int>(plaintext.size()));
    Wipe(plaintext);
    if (!parsed) {
        return Result<DeviceIdentity, PairingFailure>::Err(
            PairingFailure::Decode("Identity state is not a valid message"));
    }

    auto identity_result = DeviceIdentity::FromKeyMaterial(
        AsBytes(state.ed25519_secret_key()),
        AsBytes(state.ed25519_public_key()),
        state.display_name(),
        interfaces::FromUnixMillis(state.created_at_ms()));
    Wipe(*state.mutable_ed25519_secret_key());
    return identity_result;
}

Result<Unit, PairingFailure> IdentityStore::Save(const DeviceIdentity& identity) {
    auto sealed_result = Seal(identity);
    if (sealed_result.IsErr()) {
        return Result<Unit, PairingFailure>::Err(std::move(sealed_result).UnwrapErr());
    }
    const auto sealed = std::move(sealed_result).Unwrap();

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return Result<Unit, PairingFailure>::Err(
                PairingFailure::Storage(fmt::format("Cannot create {}: {}", path_.parent_path().string(), ec.message())));
        }
    }

    auto temp_path = path_;
    temp_path += ".tmp";
    {
        std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return Result<Unit, PairingFailure>::Err(
                PairingFailure::Storage(fmt::format("Cannot open {} for writing", temp_path.string())));
        }
        out.write(reinterpret_cast<const char*>(sealed.data()), static_cast<std::streamsize>(sealed.size()));
        if (!out) {
            return Result<Unit, PairingFailure>::Err(
                PairingFailure::Storage(fmt::format("Failed writing {}", temp_path.string())));
        }
    }
    std::filesystem::rename(temp_path, path_, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        return Result<Unit, PairingFailure>::Err(
            PairingFailure::Storage(fmt::format("Cannot replace {}", path_.string())));
    }
    PAIRLINK_LOG_DEBUG("Identity {} sealed to {}", identity.GetPublicIdentifier(), path_.string());
    return Result<Unit, PairingFailure>::Ok(unit);
}

Result<DeviceIdentity, PairingFailure> IdentityStore::Load() {
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        return Result<DeviceIdentity, PairingFailure>::Err(
            PairingFailure::Storage(fmt::format("Cannot open {}", path_.string())));
    }
    const std::vector<uint8_t> sealed((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return Result<DeviceIdentity, PairingFailure>::Err(
            PairingFailure::Storage(fmt::format("Failed reading {}", path_.string())));
    }
    return Open(sealed);
}

Result<DeviceIdentity, PairingFailure> IdentityStore::LoadOrCreate(
    std::string display_name,
    const interfaces::TimePoint now) {
    if (Exists()) {
        return Load();
    }
    auto created = DeviceIdentity::Create(std::move(display_name), now);
    if (created.IsErr()) {
        return created;
    }
    auto identity = std::move(created).Unwrap();
    if (auto saved = Save(identity); saved.IsErr()) {
        return Result<DeviceIdentity, PairingFailure>::Err(std::move(saved).UnwrapErr());
    }
    PAIRLINK_LOG_INFO("Created device identity {}", identity.GetPublicIdentifier());
    return Result<DeviceIdentity, PairingFailure>::Ok(std::move(identity));
}

bool IdentityStore::Exists() const {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

}
