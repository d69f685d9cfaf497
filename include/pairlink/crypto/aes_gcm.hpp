#pragma once
#include "pairlink/core/result.hpp"
#include "pairlink/core/failures.hpp"
#include <vector>
#include <cstdint>
#include <span>
namespace pairlink::crypto {

/**
 * AES-256-GCM authenticated encryption (OpenSSL EVP)
 *
 * Stateless primitive. The caller owns nonce uniqueness: the identity
 * store draws a fresh random nonce and a fresh salt (hence a fresh key)
 * on every seal, so a (key, nonce) pair never repeats.
 *
 * Output of Encrypt is ciphertext || 16-byte tag; Decrypt expects the same
 * layout and fails with Crypto on any tag mismatch.
 */
class AesGcm {
public:
    [[nodiscard]] static Result<std::vector<uint8_t>, PairingFailure>
    Encrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> plaintext,
        std::span<const uint8_t> associated_data = {});
    [[nodiscard]] static Result<std::vector<uint8_t>, PairingFailure>
    Decrypt(
        std::span<const uint8_t> key,
        std::span<const uint8_t> nonce,
        std::span<const uint8_t> ciphertext_with_tag,
        std::span<const uint8_t> associated_data = {});
private:
    AesGcm() = delete;
};
}
