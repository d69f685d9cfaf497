#pragma once

#include "pairlink/core/result.hpp"
#include "pairlink/core/failures.hpp"
#include "pairlink/core/constants.hpp"

#include <sodium.h>
#include <array>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <span>
#include <string_view>
#include <utility>
#include <vector>

namespace pairlink::crypto {

class SecureMemoryHandle;

using Sha256Digest = std::array<uint8_t, kSha256Bytes>;

/**
 * @brief Interop layer for libsodium
 *
 * Every primitive the pairing protocol needs goes through here: key
 * generation, Ed25519 signatures, X25519 agreement, SHA-256, HMAC and the
 * CSPRNG. Secret keys are handed out as SecureMemoryHandle, never as plain
 * vectors.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium
     *
     * Must succeed before any other call. Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * Buffers of different length compare unequal without touching contents.
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Key Generation
    // ========================================================================

    /**
     * @brief Generate an X25519 key pair for one pairing session
     *
     * @param key_purpose Used only in error messages
     * @return Ok((secret handle, public key bytes))
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, PairingFailure>
    GenerateX25519KeyPair(std::string_view key_purpose);

    /**
     * @brief Generate an Ed25519 signing key pair
     *
     * @return Ok((secret handle holding the 64-byte secret key, public key))
     */
    static Result<std::pair<SecureMemoryHandle, std::vector<uint8_t>>, PairingFailure>
    GenerateEd25519KeyPair();

    // ========================================================================
    // Signatures and Key Agreement
    // ========================================================================

    static Result<std::vector<uint8_t>, PairingFailure> SignDetached(
        const SecureMemoryHandle& ed25519_secret_key,
        std::span<const uint8_t> message);

    [[nodiscard]] static bool VerifyDetached(
        std::span<const uint8_t> ed25519_public_key,
        std::span<const uint8_t> message,
        std::span<const uint8_t> signature) noexcept;

    /**
     * @brief X25519 scalar multiplication
     *
     * Fails on a low-order peer key (all-zero shared secret).
     */
    static Result<std::vector<uint8_t>, PairingFailure> X25519SharedSecret(
        const SecureMemoryHandle& local_secret_key,
        std::span<const uint8_t> peer_public_key);

    // ========================================================================
    // Hashing
    // ========================================================================

    [[nodiscard]] static Sha256Digest Sha256(std::span<const uint8_t> data);

    static Result<std::vector<uint8_t>, PairingFailure> HmacSha256(
        std::span<const uint8_t> key,
        std::span<const uint8_t> message);

    // ========================================================================
    // Random Number Generation
    // ========================================================================

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /// Uniform value in [0, upper_bound).
    static uint32_t RandomUniform(uint32_t upper_bound);

    // ========================================================================
    // Memory Allocation (Internal)
    // ========================================================================

    /// sodium_malloc: guard-paged, locked, zeroed on free.
    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace pairlink::crypto
