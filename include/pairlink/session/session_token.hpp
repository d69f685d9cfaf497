#pragma once
#include "pairlink/core/constants.hpp"
#include "pairlink/core/result.hpp"
#include "pairlink/core/failures.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <span>
#include <string>

namespace pairlink::session {

/**
 * @brief 128-bit identifier of one pairing attempt
 *
 * Layout: bytes [0..4) hold the token prefix as a big-endian integer in
 * [0, kShareCodeSpace); bytes [4..16) are uniform random. Only the prefix
 * travels in a share code, so the issuing device is the only one that
 * knows the full token. Consumers key their sessions with FromPrefix(),
 * whose tail is zero.
 */
class SessionToken {
public:
    using ByteArray = std::array<uint8_t, kSessionTokenBytes>;

    SessionToken() noexcept : bytes_{} {}

    /// Fresh token from the libsodium CSPRNG. SodiumInterop must be initialized.
    [[nodiscard]] static SessionToken Generate();

    [[nodiscard]] static SessionToken FromPrefix(uint32_t prefix) noexcept;

    /// Fails with InvalidFormat on a wrong length or an out-of-range prefix.
    [[nodiscard]] static Result<SessionToken, PairingFailure> FromBytes(std::span<const uint8_t> bytes);

    [[nodiscard]] uint32_t Prefix() const noexcept;

    [[nodiscard]] const ByteArray& Data() const noexcept { return bytes_; }

    [[nodiscard]] std::span<const uint8_t> AsSpan() const noexcept { return bytes_; }

    /// Four hex characters of the token's SHA-256; the only form tokens are logged in.
    [[nodiscard]] std::string ShortTag() const;

    [[nodiscard]] bool HasValidPrefix() const noexcept {
        return Prefix() < kShareCodeSpace;
    }

    auto operator<=>(const SessionToken&) const = default;

private:
    explicit SessionToken(const ByteArray& bytes) noexcept : bytes_(bytes) {}

    ByteArray bytes_;
};

}
