#include <catch2/catch_test_macros.hpp>
#include "obscur/crypto/identity_keys.hpp"
#include "obscur/crypto/encoding.hpp"
#include "obscur/crypto/sodium_interop.hpp"
using namespace obscur::core;
using namespace obscur::core::crypto;
TEST_CASE("IdentityKeys - Generation and signing", "[identity][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto pair = IdentityKeys::Generate().Unwrap();
    SECTION("Sizes") {
        REQUIRE(pair.seed.size() == Constants::ED_25519_SEED_SIZE);
        REQUIRE(pair.public_key.size() == Constants::ED_25519_PUBLIC_KEY_SIZE);
    }
    SECTION("Public key is recomputed from the seed") {
        REQUIRE(IdentityKeys::PublicKeyFromSeed(pair.seed).Unwrap() == pair.public_key);
    }
    SECTION("Signatures verify only for the signed message") {
        const auto message = Encoding::ToBytes("event id");
        auto signature = IdentityKeys::Sign(message, pair.seed).Unwrap();
        REQUIRE(signature.size() == Constants::ED_25519_SIGNATURE_SIZE);
        REQUIRE(IdentityKeys::Verify(message, signature, pair.public_key));
        REQUIRE_FALSE(IdentityKeys::Verify(Encoding::ToBytes("other id"), signature, pair.public_key));
        signature[0] ^= 0x01;
        REQUIRE_FALSE(IdentityKeys::Verify(message, signature, pair.public_key));
    }
    SECTION("Malformed inputs verify as false") {
        std::vector<uint8_t> short_signature(10, 0x00);
        REQUIRE_FALSE(IdentityKeys::Verify(Encoding::ToBytes("x"), short_signature, pair.public_key));
    }
}
TEST_CASE("IdentityKeys - Agreement", "[identity][crypto]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    auto alice = IdentityKeys::Generate().Unwrap();
    auto bob = IdentityKeys::Generate().Unwrap();
    auto ab = IdentityKeys::Agree(alice.seed, bob.public_key);
    auto ba = IdentityKeys::Agree(bob.seed, alice.public_key);
    REQUIRE(ab.IsOk());
    REQUIRE(ba.IsOk());
    REQUIRE(ab.Unwrap() == ba.Unwrap());
    REQUIRE(ab.Unwrap().size() == Constants::X_25519_KEY_SIZE);
}
TEST_CASE("IdentityKeys - Hashing", "[identity][crypto]") {
    REQUIRE(IdentityKeys::Sha256Hex("abc") ==
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    REQUIRE(IdentityKeys::Sha256Hex("") ==
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}
TEST_CASE("Encoding - Hex and base64", "[encoding]") {
    REQUIRE(SodiumInterop::Initialize().IsOk());
    const std::vector<uint8_t> bytes = {0x00, 0x01, 0xAB, 0xFF};
    SECTION("Hex is lowercase and reversible") {
        REQUIRE(Encoding::ToHex(bytes) == "0001abff");
        REQUIRE(Encoding::FromHex("0001ABFF").Unwrap() == bytes);
    }
    SECTION("Bad hex is rejected") {
        REQUIRE(Encoding::FromHex("0g").IsErr());
        REQUIRE(Encoding::FromHex("abc").IsErr());
    }
    SECTION("Base64 uses the padded standard alphabet") {
        REQUIRE(Encoding::ToBase64(Encoding::ToBytes("hello")) == "aGVsbG8=");
        REQUIRE(Encoding::ToString(Encoding::FromBase64("aGVsbG8=").Unwrap()) == "hello");
        REQUIRE(Encoding::FromBase64("***").IsErr());
    }
}
