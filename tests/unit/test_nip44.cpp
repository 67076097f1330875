#include <catch2/catch_test_macros.hpp>
#include "obscur/crypto/nip44.hpp"
#include "obscur/crypto/encoding.hpp"
#include "obscur/crypto/identity_keys.hpp"
#include "obscur/crypto/sodium_interop.hpp"
using namespace obscur::core;
using namespace obscur::core::crypto;

namespace {
    constexpr const char* VECTOR_CONVERSATION_KEY = "c41c775356fd92eadc63ff5a0dc1da211b268cbea22316767095b2871ea1412d";
    constexpr const char* VECTOR_NONCE = "0000000000000000000000000000000000000000000000000000000000000001";
    constexpr const char* VECTOR_PAYLOAD =
        "AgAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAAABee0G5VSK0/9YypIObAtDKfYEAjD35uVkHyB0F4DwrcNaCXlCWZKaArsGrY6M9wnuTMxWfp1RTN9Xga8no+kF5Vsb";
}

TEST_CASE("NIP-44 - Published vector", "[nip44][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto conversation_key = Encoding::FromHex(VECTOR_CONVERSATION_KEY).Unwrap();
    const auto nonce = Encoding::FromHex(VECTOR_NONCE).Unwrap();
    SECTION("Encrypt with fixed nonce matches") {
        auto payload = Nip44::EncryptWithNonce("a", conversation_key, nonce);
        REQUIRE(payload.IsOk());
        REQUIRE(payload.Unwrap() == VECTOR_PAYLOAD);
    }
    SECTION("Decrypt recovers the plaintext") {
        auto plaintext = Nip44::Decrypt(VECTOR_PAYLOAD, conversation_key);
        REQUIRE(plaintext.IsOk());
        REQUIRE(plaintext.Unwrap() == "a");
    }
}

TEST_CASE("NIP-44 - Padding", "[nip44][crypto]") {
    REQUIRE(Nip44::CalcPaddedLength(1) == 32);
    REQUIRE(Nip44::CalcPaddedLength(32) == 32);
    REQUIRE(Nip44::CalcPaddedLength(33) == 64);
    REQUIRE(Nip44::CalcPaddedLength(37) == 64);
    REQUIRE(Nip44::CalcPaddedLength(64) == 64);
    REQUIRE(Nip44::CalcPaddedLength(65) == 96);
    REQUIRE(Nip44::CalcPaddedLength(256) == 256);
    REQUIRE(Nip44::CalcPaddedLength(257) == 320);
    REQUIRE(Nip44::CalcPaddedLength(1000) == 1024);
    REQUIRE(Nip44::CalcPaddedLength(65535) == 65536);
}

TEST_CASE("NIP-44 - Conversation keys", "[nip44][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = IdentityKeys::Generate().Unwrap();
    auto bob = IdentityKeys::Generate().Unwrap();
    auto eve = IdentityKeys::Generate().Unwrap();
    const auto alice_view = Nip44::ConversationKey(alice.seed, bob.public_key).Unwrap();
    const auto bob_view = Nip44::ConversationKey(bob.seed, alice.public_key).Unwrap();
    SECTION("Both sides derive the same key") {
        REQUIRE(alice_view.size() == 32);
        REQUIRE(alice_view == bob_view);
    }
    SECTION("Round trip across the two sides") {
        auto payload = Nip44::Encrypt("hello bob", alice_view);
        REQUIRE(payload.IsOk());
        REQUIRE(Nip44::Decrypt(payload.Unwrap(), bob_view).Unwrap() == "hello bob");
    }
    SECTION("Third party key fails the MAC") {
        const auto eve_view = Nip44::ConversationKey(eve.seed, alice.public_key).Unwrap();
        auto payload = Nip44::Encrypt("hello bob", alice_view).Unwrap();
        auto result = Nip44::Decrypt(payload, eve_view);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ObscurFailureType::Crypto);
    }
}

TEST_CASE("NIP-44 - Malformed input", "[nip44][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const auto key = Encoding::FromHex(VECTOR_CONVERSATION_KEY).Unwrap();
    SECTION("Empty plaintext is rejected") {
        REQUIRE(Nip44::Encrypt("", key).UnwrapErr().type == ObscurFailureType::Validation);
    }
    SECTION("Oversized plaintext is rejected") {
        std::string large(65536, 'x');
        REQUIRE(Nip44::Encrypt(large, key).IsErr());
    }
    SECTION("Short payload is rejected") {
        REQUIRE(Nip44::Decrypt("AgAA", key).IsErr());
    }
    SECTION("Unknown version is rejected") {
        auto raw = Encoding::FromBase64(VECTOR_PAYLOAD).Unwrap();
        raw[0] = 1;
        auto result = Nip44::Decrypt(Encoding::ToBase64(raw), key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ObscurFailureType::Decode);
    }
    SECTION("Flipped ciphertext byte fails the MAC") {
        auto raw = Encoding::FromBase64(VECTOR_PAYLOAD).Unwrap();
        raw[40] ^= 0x01;
        REQUIRE(Nip44::Decrypt(Encoding::ToBase64(raw), key).UnwrapErr().type == ObscurFailureType::Crypto);
    }
}
