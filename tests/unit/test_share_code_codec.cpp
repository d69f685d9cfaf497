#include <catch2/catch_test_macros.hpp>
#include "pairlink/codec/share_code_codec.hpp"
#include "pairlink/crypto/sodium_interop.hpp"
#include "pairlink/core/constants.hpp"
using namespace pairlink;
using namespace pairlink::codec;
using pairlink::session::SessionToken;
TEST_CASE("ShareCodeCodec - Known values", "[share_code][codec]") {
    SECTION("A3F7K2 maps to its base-31 value") {
        auto prefix = ShareCodeCodec::Decode("A3F7K2");
        REQUIRE(prefix.IsOk());
        REQUIRE(prefix.Unwrap() == 230349344u);
        REQUIRE(ShareCodeCodec::EncodePrefix(230349344u).Unwrap() == "A3F7K2");
    }
    SECTION("Both ends of the code space") {
        REQUIRE(ShareCodeCodec::EncodePrefix(0).Unwrap() == "222222");
        REQUIRE(ShareCodeCodec::EncodePrefix(kShareCodeSpace - 1).Unwrap() == "ZZZZZZ");
        REQUIRE(ShareCodeCodec::Decode("ZZZZZZ").Unwrap() == kShareCodeSpace - 1);
    }
    SECTION("Prefix outside the code space cannot be encoded") {
        auto result = ShareCodeCodec::EncodePrefix(kShareCodeSpace);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == PairingFailureType::InvalidFormat);
    }
}
TEST_CASE("ShareCodeCodec - Encodes session tokens", "[share_code][codec]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    for (int i = 0; i < 50; ++i) {
        const auto token = SessionToken::Generate();
        auto code = ShareCodeCodec::Encode(token);
        REQUIRE(code.IsOk());
        REQUIRE(code.Unwrap().size() == kShareCodeLength);
        REQUIRE(ShareCodeCodec::Decode(code.Unwrap()).Unwrap() == token.Prefix());
    }
}
TEST_CASE("ShareCodeCodec - Lenient input", "[share_code][codec]") {
    SECTION("Lower case, separator and padding are accepted") {
        REQUIRE(ShareCodeCodec::Decode("a3f-7k2").Unwrap() == 230349344u);
        REQUIRE(ShareCodeCodec::Decode("  A3F 7K2 ").Unwrap() == 230349344u);
    }
    SECTION("Normalize canonicalizes without validating") {
        REQUIRE(ShareCodeCodec::Normalize(" a3f-7k2 ") == "A3F7K2");
        REQUIRE(ShareCodeCodec::Normalize("ab-cd") == "AB-CD");
    }
    SECTION("Display splits into two groups") {
        REQUIRE(ShareCodeCodec::Display("A3F7K2") == "A3F-7K2");
        REQUIRE(ShareCodeCodec::Display("ABC") == "ABC");
    }
}
TEST_CASE("ShareCodeCodec - Malformed input", "[share_code][codec]") {
    auto is_invalid_format = [](std::string_view code) {
        auto result = ShareCodeCodec::Decode(code);
        return result.IsErr() && result.UnwrapErr().type == PairingFailureType::InvalidFormat;
    };
    SECTION("Wrong length") {
        REQUIRE(is_invalid_format(""));
        REQUIRE(is_invalid_format("A3F7K"));
        REQUIRE(is_invalid_format("A3F7K22"));
    }
    SECTION("Ambiguous characters are not in the alphabet") {
        REQUIRE(is_invalid_format("A3F7K0"));
        REQUIRE(is_invalid_format("A3F7K1"));
        REQUIRE(is_invalid_format("A3F7KO"));
        REQUIRE(is_invalid_format("A3F7KI"));
        REQUIRE(is_invalid_format("A3F7KL"));
    }
    SECTION("Separator only between the halves") {
        REQUIRE(is_invalid_format("A3-F7K2"));
        REQUIRE(is_invalid_format("A3F--7K2"));
    }
}
