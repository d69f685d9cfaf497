#pragma once
#include "pairlink/interfaces/i_state_key_provider.hpp"
#include "pairlink/crypto/sodium_secure_memory_handle.hpp"

#include <cstdint>
#include <vector>

namespace pairlink::test_helpers {

class MockStateKeyProvider final : public interfaces::IStateKeyProvider {
public:
    explicit MockStateKeyProvider(std::vector<uint8_t> key)
        : key_(std::move(key)) {}

    [[nodiscard]] Result<crypto::SecureMemoryHandle, PairingFailure> GetStateEncryptionKey() override {
        if (fail_) {
            return Result<crypto::SecureMemoryHandle, PairingFailure>::Err(
                PairingFailure::Storage("Mock key provider: key unavailable"));
        }
        auto handle = crypto::SecureMemoryHandle::FromBytes(key_);
        if (handle.IsErr()) {
            return Result<crypto::SecureMemoryHandle, PairingFailure>::Err(
                PairingFailure::FromSodiumFailure(handle.UnwrapErr()));
        }
        return Result<crypto::SecureMemoryHandle, PairingFailure>::Ok(std::move(handle).Unwrap());
    }

    void SetFailing(const bool fail) noexcept { fail_ = fail; }

private:
    std::vector<uint8_t> key_;
    bool fail_ = false;
};

}
