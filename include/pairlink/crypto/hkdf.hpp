#pragma once

#include "pairlink/core/result.hpp"
#include "pairlink/core/failures.hpp"

#include <span>
#include <vector>
#include <cstdint>
#include <string_view>

namespace pairlink::crypto {

/**
 * @brief HKDF-SHA256 (RFC 5869) over OpenSSL's EVP_KDF
 *
 * Derives the per-pairing key from the X25519 shared secret and the
 * identity sealing key from the platform state key.
 */
class Hkdf {
public:
    /**
     * @brief Derive key using HKDF-SHA256
     *
     * @param ikm Input key material, must not be empty
     * @param output Output buffer to fill with derived key
     * @param salt Optional salt (empty means no salt)
     * @param info Optional context info
     */
    static Result<Unit, PairingFailure> DeriveKey(
        std::span<const uint8_t> ikm,
        std::span<uint8_t> output,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    static Result<std::vector<uint8_t>, PairingFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt = {},
        std::span<const uint8_t> info = {});

    /// Same as DeriveKeyBytes with a string label as info.
    static Result<std::vector<uint8_t>, PairingFailure> DeriveKeyBytes(
        std::span<const uint8_t> ikm,
        size_t output_size,
        std::span<const uint8_t> salt,
        std::string_view info_label);

    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t MAX_OUTPUT_LEN = 255 * HASH_LEN;

private:
    Hkdf() = delete;
};

} // namespace pairlink::crypto
