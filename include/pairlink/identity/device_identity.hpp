#pragma once
#include "pairlink/core/result.hpp"
#include "pairlink/core/failures.hpp"
#include "pairlink/crypto/sodium_secure_memory_handle.hpp"
#include "pairlink/interfaces/i_clock.hpp"
#include <vector>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
namespace pairlink::identity {
using crypto::SecureMemoryHandle;

/// Descriptive facts about the host, carried in rendezvous records and
/// handshake messages so the user sees which machine asks to pair.
struct DeviceDescriptor {
    std::string hostname;
    std::string os;
    std::string platform;
    std::string arch;

    /// Reads uname(2). Missing fields stay empty.
    [[nodiscard]] static DeviceDescriptor Current();
};

/**
 * @brief Long-lived device identity: the trust anchor of every pairing
 *
 * Holds an Ed25519 signing key pair (secret half in guarded memory), the
 * public identifier derived from the public key and a display name.
 * Move-only; the host builds one at startup and lends it by reference.
 */
class DeviceIdentity {
public:
    [[nodiscard]] static Result<DeviceIdentity, PairingFailure> Create(
        std::string display_name,
        interfaces::TimePoint created_at);

    /// Rebuilds an identity from stored key material. Fails with Crypto
    /// when the public key does not belong to the secret key.
    [[nodiscard]] static Result<DeviceIdentity, PairingFailure> FromKeyMaterial(
        std::span<const uint8_t> ed25519_secret_key,
        std::span<const uint8_t> ed25519_public_key,
        std::string display_name,
        interfaces::TimePoint created_at);

    /// Lowercase hex of the first 20 bytes of SHA-256(public_key).
    [[nodiscard]] static std::string DeriveIdentifier(std::span<const uint8_t> ed25519_public_key);

    [[nodiscard]] const std::string& GetPublicIdentifier() const noexcept { return public_identifier_; }
    [[nodiscard]] const std::vector<uint8_t>& GetPublicKey() const noexcept { return public_key_; }
    [[nodiscard]] const std::string& GetDisplayName() const noexcept { return display_name_; }
    [[nodiscard]] interfaces::TimePoint GetCreatedAt() const noexcept { return created_at_; }

    void SetDisplayName(std::string display_name) { display_name_ = std::move(display_name); }

    [[nodiscard]] Result<std::vector<uint8_t>, PairingFailure> Sign(std::span<const uint8_t> message) const;

    /// Copy of the 64-byte secret key; used only to seal the identity.
    [[nodiscard]] Result<std::vector<uint8_t>, PairingFailure> GetSecretKeyCopy() const;

    DeviceIdentity(DeviceIdentity&&) noexcept = default;
    DeviceIdentity& operator=(DeviceIdentity&&) noexcept = default;
    DeviceIdentity(const DeviceIdentity&) = delete;
    DeviceIdentity& operator=(const DeviceIdentity&) = delete;
    ~DeviceIdentity() = default;

private:
    DeviceIdentity(
        SecureMemoryHandle secret_key,
        std::vector<uint8_t> public_key,
        std::string display_name,
        interfaces::TimePoint created_at);

    SecureMemoryHandle secret_key_;
    std::vector<uint8_t> public_key_;
    std::string public_identifier_;
    std::string display_name_;
    interfaces::TimePoint created_at_;
};
}
