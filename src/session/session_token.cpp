#include "pairlink/session/session_token.hpp"
#include "pairlink/crypto/sodium_interop.hpp"
#include "pairlink/core/logger.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace pairlink::session {

namespace {

void WritePrefix(SessionToken::ByteArray& bytes, const uint32_t prefix) noexcept {
    bytes[0] = static_cast<uint8_t>(prefix >> 24);
    bytes[1] = static_cast<uint8_t>(prefix >> 16);
    bytes[2] = static_cast<uint8_t>(prefix >> 8);
    bytes[3] = static_cast<uint8_t>(prefix);
}

}

SessionToken SessionToken::Generate() {
    ByteArray bytes{};
    WritePrefix(bytes, crypto::SodiumInterop::RandomUniform(kShareCodeSpace));
    const auto tail = crypto::SodiumInterop::GetRandomBytes(kSessionTokenBytes - kTokenPrefixBytes);
    std::copy(tail.begin(), tail.end(), bytes.begin() + kTokenPrefixBytes);
    return SessionToken(bytes);
}

SessionToken SessionToken::FromPrefix(const uint32_t prefix) noexcept {
    ByteArray bytes{};
    WritePrefix(bytes, prefix);
    return SessionToken(bytes);
}

Result<SessionToken, PairingFailure> SessionToken::FromBytes(std::span<const uint8_t> bytes) {
    if (bytes.size() != kSessionTokenBytes) {
        return Result<SessionToken, PairingFailure>::Err(
            PairingFailure::InvalidFormat(fmt::format(
                "Session token must be {} bytes, got {}", kSessionTokenBytes, bytes.size())));
    }
    ByteArray array{};
    std::copy(bytes.begin(), bytes.end(), array.begin());
    SessionToken token(array);
    if (!token.HasValidPrefix()) {
        return Result<SessionToken, PairingFailure>::Err(
            PairingFailure::InvalidFormat("Session token prefix outside the code space"));
    }
    return Result<SessionToken, PairingFailure>::Ok(token);
}

uint32_t SessionToken::Prefix() const noexcept {
    return (static_cast<uint32_t>(bytes_[0]) << 24) |
           (static_cast<uint32_t>(bytes_[1]) << 16) |
           (static_cast<uint32_t>(bytes_[2]) << 8) |
           static_cast<uint32_t>(bytes_[3]);
}

std::string SessionToken::ShortTag() const {
    const auto digest = crypto::SodiumInterop::Sha256(bytes_);
    return logging::ShortTag(digest);
}

}
