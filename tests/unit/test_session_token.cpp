#include <catch2/catch_test_macros.hpp>
#include "pairlink/session/session_token.hpp"
#include "pairlink/crypto/sodium_interop.hpp"
#include "pairlink/core/constants.hpp"
#include <set>
using namespace pairlink;
using namespace pairlink::session;
TEST_CASE("SessionToken - Generation", "[session_token][session]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    SECTION("Generated prefixes stay inside the code space") {
        for (int i = 0; i < 200; ++i) {
            REQUIRE(SessionToken::Generate().HasValidPrefix());
        }
    }
    SECTION("Generated tokens are distinct") {
        std::set<SessionToken> tokens;
        for (int i = 0; i < 200; ++i) {
            tokens.insert(SessionToken::Generate());
        }
        REQUIRE(tokens.size() == 200);
    }
}
TEST_CASE("SessionToken - Prefix layout", "[session_token][session]") {
    SECTION("FromPrefix stores the prefix big-endian with a zero tail") {
        const auto token = SessionToken::FromPrefix(0x01020304);
        REQUIRE(token.Prefix() == 0x01020304u);
        REQUIRE(token.Data()[0] == 0x01);
        REQUIRE(token.Data()[3] == 0x04);
        for (size_t i = kTokenPrefixBytes; i < kSessionTokenBytes; ++i) {
            REQUIRE(token.Data()[i] == 0);
        }
    }
    SECTION("Tokens sharing a prefix differ by tail") {
        REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
        auto generated = SessionToken::Generate();
        REQUIRE(SessionToken::FromPrefix(generated.Prefix()).Prefix() == generated.Prefix());
        REQUIRE_FALSE(SessionToken::FromPrefix(generated.Prefix()) == generated);
    }
}
TEST_CASE("SessionToken - FromBytes validation", "[session_token][session]") {
    SECTION("Accepts sixteen bytes with a valid prefix") {
        std::vector<uint8_t> bytes(kSessionTokenBytes, 0x00);
        bytes[3] = 0x2A;
        bytes[15] = 0xFF;
        auto token = SessionToken::FromBytes(bytes);
        REQUIRE(token.IsOk());
        REQUIRE(token.Unwrap().Prefix() == 0x2Au);
    }
    SECTION("Refuses a wrong length") {
        std::vector<uint8_t> bytes(8, 0x00);
        auto token = SessionToken::FromBytes(bytes);
        REQUIRE(token.IsErr());
        REQUIRE(token.UnwrapErr().type == PairingFailureType::InvalidFormat);
    }
    SECTION("Refuses a prefix outside the code space") {
        std::vector<uint8_t> bytes(kSessionTokenBytes, 0xFF);
        REQUIRE(SessionToken::FromBytes(bytes).IsErr());
        REQUIRE_FALSE(SessionToken::FromPrefix(kShareCodeSpace).HasValidPrefix());
    }
}
TEST_CASE("SessionToken - ShortTag does not reveal the prefix", "[session_token][session]") {
    REQUIRE(crypto::SodiumInterop::Initialize().IsOk());
    const auto a = SessionToken::FromPrefix(230349344u);
    REQUIRE(a.ShortTag().size() == 4);
    REQUIRE(a.ShortTag() == SessionToken::FromPrefix(230349344u).ShortTag());
    REQUIRE(a.ShortTag() != "0dba");
}
