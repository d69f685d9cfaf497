#pragma once
#include "pairlink/crypto/sodium_secure_memory_handle.hpp"

namespace pairlink::interfaces {

/// Supplies the platform-held key that seals the device identity at rest
/// (keychain, TPM, a passphrase-derived key). The returned handle holds at
/// least 32 bytes of key material.
class IStateKeyProvider {
public:
    virtual ~IStateKeyProvider() = default;

    [[nodiscard]] virtual Result<crypto::SecureMemoryHandle, PairingFailure> GetStateEncryptionKey() = 0;
};

}
