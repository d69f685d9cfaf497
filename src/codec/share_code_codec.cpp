#include "pairlink/codec/share_code_codec.hpp"
#include "pairlink/core/constants.hpp"

#include <fmt/format.h>

#include <cctype>

namespace pairlink::codec {

namespace {

constexpr int kInvalidDigit = -1;
constexpr size_t kHalfLength = kShareCodeLength / 2;

int DigitValue(const char symbol) noexcept {
    const size_t position = kShareCodeAlphabet.find(symbol);
    return position == std::string_view::npos ? kInvalidDigit : static_cast<int>(position);
}

bool IsSeparator(const char c) noexcept {
    return c == '-' || c == ' ';
}

}

Result<std::string, PairingFailure> ShareCodeCodec::Encode(const session::SessionToken& token) {
    return EncodePrefix(token.Prefix());
}

Result<std::string, PairingFailure> ShareCodeCodec::EncodePrefix(uint32_t prefix) {
    if (prefix >= kShareCodeSpace) {
        return Result<std::string, PairingFailure>::Err(
            PairingFailure::InvalidFormat(fmt::format(
                "Token prefix {} outside code space {}", prefix, kShareCodeSpace)));
    }
    std::string code(kShareCodeLength, kShareCodeAlphabet[0]);
    for (size_t i = kShareCodeLength; i > 0; --i) {
        code[i - 1] = kShareCodeAlphabet[prefix % kShareCodeRadix];
        prefix /= kShareCodeRadix;
    }
    return Result<std::string, PairingFailure>::Ok(std::move(code));
}

Result<uint32_t, PairingFailure> ShareCodeCodec::Decode(std::string_view code) {
    const std::string normalized = Normalize(code);
    if (normalized.size() != kShareCodeLength) {
        return Result<uint32_t, PairingFailure>::Err(
            PairingFailure::InvalidFormat(fmt::format(
                "Share code must have {} characters, got {}", kShareCodeLength, normalized.size())));
    }
    uint32_t prefix = 0;
    for (const char symbol : normalized) {
        const int digit = DigitValue(symbol);
        if (digit == kInvalidDigit) {
            return Result<uint32_t, PairingFailure>::Err(
                PairingFailure::InvalidFormat("Share code contains a character outside the alphabet"));
        }
        prefix = prefix * kShareCodeRadix + static_cast<uint32_t>(digit);
    }
    return Result<uint32_t, PairingFailure>::Ok(prefix);
}

std::string ShareCodeCodec::Normalize(std::string_view code) {
    size_t begin = 0;
    size_t end = code.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(code[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(code[end - 1]))) {
        --end;
    }
    code = code.substr(begin, end - begin);

    std::string normalized;
    normalized.reserve(code.size());
    bool separator_seen = false;
    for (const char c : code) {
        if (IsSeparator(c) && !separator_seen && normalized.size() == kHalfLength) {
            separator_seen = true;
            continue;
        }
        normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return normalized;
}

std::string ShareCodeCodec::Display(std::string_view canonical_code) {
    if (canonical_code.size() != kShareCodeLength) {
        return std::string(canonical_code);
    }
    return fmt::format("{}-{}", canonical_code.substr(0, kHalfLength), canonical_code.substr(kHalfLength));
}

}
