#include "pairlink/crypto/hkdf.hpp"
#include "pairlink/core/constants.hpp"

#include <fmt/format.h>

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>

#include <memory>

namespace pairlink::crypto {

namespace {
    struct EVP_KDF_Deleter {
        void operator()(EVP_KDF* kdf) const {
            if (kdf) {
                EVP_KDF_free(kdf);
            }
        }
    };
    struct EVP_KDF_CTX_Deleter {
        void operator()(EVP_KDF_CTX* ctx) const {
            if (ctx) {
                EVP_KDF_CTX_free(ctx);
            }
        }
    };
    using EVP_KDF_ptr = std::unique_ptr<EVP_KDF, EVP_KDF_Deleter>;
    using EVP_KDF_CTX_ptr = std::unique_ptr<EVP_KDF_CTX, EVP_KDF_CTX_Deleter>;
}

Result<Unit, PairingFailure> Hkdf::DeriveKey(
    std::span<const uint8_t> ikm,
    std::span<uint8_t> output,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    if (output.empty() || output.size() > MAX_OUTPUT_LEN) {
        return Result<Unit, PairingFailure>::Err(
            PairingFailure::Crypto(fmt::format(
                "HKDF output size {} outside 1..{}", output.size(), MAX_OUTPUT_LEN)));
    }
    if (ikm.empty()) {
        return Result<Unit, PairingFailure>::Err(
            PairingFailure::Crypto("HKDF input key material cannot be empty"));
    }

    EVP_KDF_ptr kdf(EVP_KDF_fetch(nullptr, "HKDF", nullptr));
    if (!kdf) {
        return Result<Unit, PairingFailure>::Err(
            PairingFailure::Crypto("Failed to fetch HKDF algorithm"));
    }
    EVP_KDF_CTX_ptr kctx(EVP_KDF_CTX_new(kdf.get()));
    if (!kctx) {
        return Result<Unit, PairingFailure>::Err(
            PairingFailure::Crypto("Failed to create HKDF context"));
    }

    OSSL_PARAM params[5];
    int param_idx = 0;
    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        "digest", const_cast<char*>("SHA256"), 0);
    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        "key", const_cast<uint8_t*>(ikm.data()), ikm.size());
    if (!salt.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            "salt", const_cast<uint8_t*>(salt.data()), salt.size());
    }
    if (!info.empty()) {
        params[param_idx++] = OSSL_PARAM_construct_octet_string(
            "info", const_cast<uint8_t*>(info.data()), info.size());
    }
    params[param_idx] = OSSL_PARAM_construct_end();

    if (EVP_KDF_derive(kctx.get(), output.data(), output.size(), params) != OpenSSLConstants::SUCCESS) {
        return Result<Unit, PairingFailure>::Err(
            PairingFailure::Crypto("HKDF key derivation failed"));
    }
    return Result<Unit, PairingFailure>::Ok(unit);
}

Result<std::vector<uint8_t>, PairingFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::span<const uint8_t> info) {

    std::vector<uint8_t> output(output_size);
    auto result = DeriveKey(ikm, output, salt, info);
    if (result.IsErr()) {
        return Result<std::vector<uint8_t>, PairingFailure>::Err(
            std::move(result).UnwrapErr());
    }
    return Result<std::vector<uint8_t>, PairingFailure>::Ok(std::move(output));
}

Result<std::vector<uint8_t>, PairingFailure> Hkdf::DeriveKeyBytes(
    std::span<const uint8_t> ikm,
    size_t output_size,
    std::span<const uint8_t> salt,
    std::string_view info_label) {
    const std::span<const uint8_t> info(
        reinterpret_cast<const uint8_t*>(info_label.data()), info_label.size());
    return DeriveKeyBytes(ikm, output_size, salt, info);
}

} // namespace pairlink::crypto
