#include "pairlink/crypto/sodium_interop.hpp"
#include "pairlink/crypto/sodium_secure_memory_handle.hpp"

#include <fmt/format.h>

#include <cstring>

namespace pairlink::crypto {

namespace {

template<typename T>
using KeyPairResult = Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, T>;

}

// ============================================================================
// Initialization
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::Initialize() {
    std::call_once(init_flag_, []() {
        initialized_.store(sodium_init() >= 0, std::memory_order_release);
    });

    if (!initialized_.load(std::memory_order_acquire)) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::SODIUM_INIT_FAILED)));
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

bool SodiumInterop::IsInitialized() noexcept {
    return initialized_.load(std::memory_order_acquire);
}

// ============================================================================
// Secure Memory Operations
// ============================================================================

Result<Unit, SodiumFailure> SodiumInterop::SecureWipe(std::span<uint8_t> buffer) {
    if (!IsInitialized()) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::InitializationFailed(
                std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (buffer.empty()) {
        return Result<Unit, SodiumFailure>::Ok(unit);
    }
    if (buffer.size() > SodiumConstants::MAX_BUFFER_SIZE) {
        return Result<Unit, SodiumFailure>::Err(
            SodiumFailure::BufferTooLarge(fmt::format(
                "Buffer size {} exceeds maximum {}",
                buffer.size(), SodiumConstants::MAX_BUFFER_SIZE)));
    }
    if (buffer.size() <= SodiumConstants::SMALL_BUFFER_THRESHOLD) {
        return WipeSmallBuffer(buffer);
    }
    return WipeLargeBuffer(buffer);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeSmallBuffer(std::span<uint8_t> buffer) {
    volatile uint8_t* vbuf = buffer.data();
    for (size_t i = 0; i < buffer.size(); ++i) {
        vbuf[i] = 0;
    }
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<Unit, SodiumFailure> SodiumInterop::WipeLargeBuffer(std::span<uint8_t> buffer) {
    sodium_memzero(buffer.data(), buffer.size());
    return Result<Unit, SodiumFailure>::Ok(unit);
}

Result<bool, SodiumFailure> SodiumInterop::ConstantTimeEquals(
    std::span<const uint8_t> a,
    std::span<const uint8_t> b) {
    if (!IsInitialized()) {
        return Result<bool, SodiumFailure>::Err(
            SodiumFailure::ComparisonFailed(
                std::string(ErrorMessages::CONSTANT_TIME_COMPARISON_FAILED) +
                ": " + std::string(ErrorMessages::NOT_INITIALIZED)));
    }
    if (a.size() != b.size()) {
        return Result<bool, SodiumFailure>::Ok(false);
    }
    if (a.empty()) {
        return Result<bool, SodiumFailure>::Ok(true);
    }
    return Result<bool, SodiumFailure>::Ok(
        sodium_memcmp(a.data(), b.data(), a.size()) == 0);
}

// ============================================================================
// Key Generation
// ============================================================================

KeyPairResult<PairingFailure> SodiumInterop::GenerateX25519KeyPair(std::string_view key_purpose) {
    auto sk_handle_result = SecureMemoryHandle::Allocate(kX25519PrivateKeyBytes);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult<PairingFailure>::Err(
            PairingFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> sk_bytes = GetRandomBytes(kX25519PrivateKeyBytes);
    std::vector<uint8_t> pk_bytes(kX25519PublicKeyBytes);
    const int derive_rc = crypto_scalarmult_base(pk_bytes.data(), sk_bytes.data());
    auto write_result = sk_handle.Write(sk_bytes);
    (void)SecureWipe(std::span<uint8_t>(sk_bytes));

    if (derive_rc != SodiumConstants::SUCCESS) {
        return KeyPairResult<PairingFailure>::Err(
            PairingFailure::KeyGeneration(fmt::format(
                "Failed to derive {} public key", key_purpose)));
    }
    if (write_result.IsErr()) {
        return KeyPairResult<PairingFailure>::Err(
            PairingFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    return KeyPairResult<PairingFailure>::Ok(
        std::make_pair(std::move(sk_handle), std::move(pk_bytes)));
}

KeyPairResult<PairingFailure> SodiumInterop::GenerateEd25519KeyPair() {
    auto sk_handle_result = SecureMemoryHandle::Allocate(kEd25519SecretKeyBytes);
    if (sk_handle_result.IsErr()) {
        return KeyPairResult<PairingFailure>::Err(
            PairingFailure::FromSodiumFailure(sk_handle_result.UnwrapErr()));
    }
    SecureMemoryHandle sk_handle = std::move(sk_handle_result).Unwrap();

    std::vector<uint8_t> pk(kEd25519PublicKeyBytes);
    std::vector<uint8_t> sk(kEd25519SecretKeyBytes);
    if (crypto_sign_keypair(pk.data(), sk.data()) != SodiumConstants::SUCCESS) {
        (void)SecureWipe(std::span<uint8_t>(sk));
        return KeyPairResult<PairingFailure>::Err(
            PairingFailure::KeyGeneration("Failed to generate Ed25519 key pair"));
    }

    auto write_result = sk_handle.Write(sk);
    (void)SecureWipe(std::span<uint8_t>(sk));
    if (write_result.IsErr()) {
        return KeyPairResult<PairingFailure>::Err(
            PairingFailure::FromSodiumFailure(write_result.UnwrapErr()));
    }

    return KeyPairResult<PairingFailure>::Ok(
        std::make_pair(std::move(sk_handle), std::move(pk)));
}

// ============================================================================
// Signatures and Key Agreement
// ============================================================================

Result<std::vector<uint8_t>, PairingFailure> SodiumInterop::SignDetached(
    const SecureMemoryHandle& ed25519_secret_key,
    std::span<const uint8_t> message) {
    if (ed25519_secret_key.Size() != kEd25519SecretKeyBytes) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::Crypto(fmt::format(
                "Ed25519 secret key must be {} bytes, got {}",
                kEd25519SecretKeyBytes, ed25519_secret_key.Size())));
    }

    auto signed_result = ed25519_secret_key.WithReadAccess(
        [&message](std::span<const uint8_t> sk) {
            std::vector<uint8_t> signature(kEd25519SignatureBytes);
            const int rc = crypto_sign_detached(
                signature.data(), nullptr,
                message.data(), message.size(),
                sk.data());
            if (rc != SodiumConstants::SUCCESS) {
                signature.clear();
            }
            return signature;
        });
    if (signed_result.IsErr()) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::FromSodiumFailure(signed_result.UnwrapErr()));
    }

    auto signature = std::move(signed_result).Unwrap();
    if (signature.empty()) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::Crypto("Ed25519 signing failed"));
    }
    return Result<std::vector<uint8_t>, PairingFailure>::Ok(std::move(signature));
}

bool SodiumInterop::VerifyDetached(
    std::span<const uint8_t> ed25519_public_key,
    std::span<const uint8_t> message,
    std::span<const uint8_t> signature) noexcept {
    if (ed25519_public_key.size() != kEd25519PublicKeyBytes ||
        signature.size() != kEd25519SignatureBytes) {
        return false;
    }
    return crypto_sign_verify_detached(
        signature.data(),
        message.data(), message.size(),
        ed25519_public_key.data()) == SodiumConstants::SUCCESS;
}

Result<std::vector<uint8_t>, PairingFailure> SodiumInterop::X25519SharedSecret(
    const SecureMemoryHandle& local_secret_key,
    std::span<const uint8_t> peer_public_key) {
    if (peer_public_key.size() != kX25519PublicKeyBytes) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::Crypto(fmt::format(
                "X25519 public key must be {} bytes, got {}",
                kX25519PublicKeyBytes, peer_public_key.size())));
    }

    auto dh_result = local_secret_key.WithReadAccess(
        [&peer_public_key](std::span<const uint8_t> sk) {
            std::vector<uint8_t> shared(kX25519SharedSecretBytes);
            if (crypto_scalarmult(shared.data(), sk.data(), peer_public_key.data())
                != SodiumConstants::SUCCESS) {
                shared.clear();
            }
            return shared;
        });
    if (dh_result.IsErr()) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::FromSodiumFailure(dh_result.UnwrapErr()));
    }

    auto shared = std::move(dh_result).Unwrap();
    if (shared.empty()) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::Crypto("X25519 agreement rejected peer public key"));
    }
    return Result<std::vector<uint8_t>, PairingFailure>::Ok(std::move(shared));
}

// ============================================================================
// Hashing
// ============================================================================

Sha256Digest SodiumInterop::Sha256(std::span<const uint8_t> data) {
    Sha256Digest digest{};
    crypto_hash_sha256(digest.data(), data.data(), data.size());
    return digest;
}

Result<std::vector<uint8_t>, PairingFailure> SodiumInterop::HmacSha256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> message) {
    if (key.empty()) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::Crypto("HMAC key must not be empty"));
    }

    crypto_auth_hmacsha256_state state;
    std::vector<uint8_t> mac(crypto_auth_hmacsha256_BYTES);
    if (crypto_auth_hmacsha256_init(&state, key.data(), key.size()) != SodiumConstants::SUCCESS ||
        crypto_auth_hmacsha256_update(&state, message.data(), message.size()) != SodiumConstants::SUCCESS ||
        crypto_auth_hmacsha256_final(&state, mac.data()) != SodiumConstants::SUCCESS) {
        sodium_memzero(&state, sizeof(state));
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            PairingFailure::Crypto("HMAC-SHA256 computation failed"));
    }
    sodium_memzero(&state, sizeof(state));
    return Result<std::vector<uint8_t>, PairingFailure>::Ok(std::move(mac));
}

// ============================================================================
// Random Number Generation
// ============================================================================

std::vector<uint8_t> SodiumInterop::GetRandomBytes(size_t size) {
    std::vector<uint8_t> buffer(size);
    randombytes_buf(buffer.data(), size);
    return buffer;
}

uint32_t SodiumInterop::RandomUniform(uint32_t upper_bound) {
    return randombytes_uniform(upper_bound);
}

// ============================================================================
// Memory Allocation
// ============================================================================

void* SodiumInterop::AllocateSecure(size_t size) noexcept {
    if (!IsInitialized()) {
        return nullptr;
    }
    return sodium_malloc(size);
}

void SodiumInterop::FreeSecure(void* ptr) noexcept {
    if (ptr != nullptr) {
        sodium_free(ptr);
    }
}

} // namespace pairlink::crypto
