#pragma once
#include "pairlink/core/result.hpp"
#include "pairlink/core/failures.hpp"
#include "pairlink/session/session_token.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace pairlink::codec {

/**
 * @brief Six-character share codes over a 31-symbol alphabet
 *
 * The alphabet `23456789ABCDEFGHJKMNPQRSTUVWXYZ` drops the look-alikes
 * 0/O, 1/I/L. A code is the token prefix written in base 31, most
 * significant digit first, always padded to six digits, so the mapping
 * between prefixes in [0, 31^6) and codes is a bijection.
 *
 * Input is forgiving: lowercase is accepted, surrounding whitespace is
 * ignored and one `-` or space may split the code into two halves
 * ("a3f-7k2", "A3F 7K2").
 */
class ShareCodeCodec {
public:
    /// Fails with InvalidFormat if the token prefix is outside the code space.
    [[nodiscard]] static Result<std::string, PairingFailure> Encode(const session::SessionToken& token);

    [[nodiscard]] static Result<std::string, PairingFailure> EncodePrefix(uint32_t prefix);

    /// Returns the token prefix a code stands for.
    [[nodiscard]] static Result<uint32_t, PairingFailure> Decode(std::string_view code);

    /// Upper-cases and strips whitespace and a single separator. Does not
    /// validate the alphabet.
    [[nodiscard]] static std::string Normalize(std::string_view code);

    /// Formats a canonical code for display, e.g. "A3F-7K2".
    [[nodiscard]] static std::string Display(std::string_view canonical_code);

private:
    ShareCodeCodec() = delete;
};

}
