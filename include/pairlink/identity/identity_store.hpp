#pragma once
#include "pairlink/core/result.hpp"
#include "pairlink/core/failures.hpp"
#include "pairlink/identity/device_identity.hpp"
#include "pairlink/interfaces/i_state_key_provider.hpp"
#include "pairlink/interfaces/i_clock.hpp"

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace pairlink::identity {

/**
 * @brief Keeps the DeviceIdentity encrypted at rest
 *
 * Sealing: a fresh 16-byte salt and the platform state key feed
 * HKDF-SHA256 ("PairLink-Identity-Seal") to get a one-off AES-256-GCM key;
 * the serialized IdentityState is encrypted under a fresh nonce with a
 * fixed associated-data label. The SealedIdentity protobuf is what lands
 * on disk, written to a temporary file and renamed over the old one.
 *
 * Opening fails with Storage on I/O errors, Decode on a malformed file and
 * Crypto when the tag does not verify (wrong state key or tampering).
 */
class IdentityStore {
public:
    IdentityStore(std::filesystem::path path, interfaces::IStateKeyProvider& key_provider);

    [[nodiscard]] Result<std::vector<uint8_t>, PairingFailure> Seal(const DeviceIdentity& identity);

    [[nodiscard]] Result<DeviceIdentity, PairingFailure> Open(std::span<const uint8_t> sealed);

    [[nodiscard]] Result<Unit, PairingFailure> Save(const DeviceIdentity& identity);

    [[nodiscard]] Result<DeviceIdentity, PairingFailure> Load();

    /// Loads the stored identity, or creates, saves and returns a new one
    /// when no file exists yet.
    [[nodiscard]] Result<DeviceIdentity, PairingFailure> LoadOrCreate(
        std::string display_name,
        interfaces::TimePoint now);

    [[nodiscard]] bool Exists() const;

    [[nodiscard]] const std::filesystem::path& GetPath() const noexcept { return path_; }

private:
    [[nodiscard]] Result<std::vector<uint8_t>, PairingFailure> DeriveSealKey(std::span<const uint8_t> salt);

    std::filesystem::path path_;
    interfaces::IStateKeyProvider& key_provider_;
};

}
