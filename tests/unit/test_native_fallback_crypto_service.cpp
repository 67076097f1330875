#include <catch2/catch_test_macros.hpp>
#include "obscur/services/native_fallback_crypto_service.hpp"
#include "obscur/services/crypto_service_factory.hpp"
#include "obscur/services/software_crypto_service.hpp"
#include "helpers/mock_native_keystore_bridge.hpp"
#include "helpers/log_capture.hpp"
using namespace obscur::core;
using namespace obscur::core::services;
using namespace obscur::core::models;
using obscur::core::test_helpers::MockNativeKeystoreBridge;

namespace {
    struct Fixture {
        std::shared_ptr<MockNativeKeystoreBridge> bridge = std::make_shared<MockNativeKeystoreBridge>();
        std::shared_ptr<SoftwareCryptoService> software = SoftwareCryptoService::Create().Unwrap();
        std::shared_ptr<NativeFallbackCryptoService> service = std::make_shared<NativeFallbackCryptoService>(
            bridge, software, std::chrono::milliseconds(200));
    };
}

TEST_CASE("NativeFallback - Session handles", "[crypto][native]") {
    Fixture f;
    SECTION("Key generation returns a handle and activates it") {
        auto pair = f.service->GenerateKeyPair();
        REQUIRE(pair.IsOk());
        REQUIRE(NativeFallbackCryptoService::IsSessionHandle(pair.Unwrap().private_key));
        REQUIRE(f.service->ActiveSession() == pair.Unwrap().private_key);
    }
    SECTION("Handle-keyed signing goes through the keystore") {
        const auto pair = f.service->GenerateKeyPair().Unwrap();
        const int before = f.bridge->CallCount();
        auto signed_event = f.service->SignEvent(UnsignedEvent{"", 1700000000, 1, {}, "hi"}, pair.private_key);
        REQUIRE(signed_event.IsOk());
        REQUIRE(f.bridge->CallCount() == before + 1);
        REQUIRE(signed_event.Unwrap().pubkey == pair.public_key);
        REQUIRE(f.service->VerifyEventSignature(signed_event.Unwrap()));
    }
    SECTION("Handle failures are surfaced, not masked") {
        const auto pair = f.service->GenerateKeyPair().Unwrap();
        f.bridge->SetFailing(true);
        auto result = f.service->SignEvent(UnsignedEvent{"", 1, 1, {}, "hi"}, pair.private_key);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ObscurFailureType::Crypto);
    }
}

TEST_CASE("NativeFallback - Software fallback", "[crypto][native]") {
    Fixture f;
    const auto alice = f.software->GenerateKeyPair().Unwrap();
    const auto bob = f.software->GenerateKeyPair().Unwrap();

    SECTION("Without a session, hex keys never touch the keystore") {
        auto ciphertext = f.service->EncryptDm("hi", bob.public_key, alice.private_key);
        REQUIRE(ciphertext.IsOk());
        REQUIRE(f.bridge->CallCount() == 0);
        REQUIRE(f.software->DecryptDm(ciphertext.Unwrap(), alice.public_key, bob.private_key).Unwrap() == "hi");
    }
    SECTION("Failing keystore falls back for hex keys") {
        f.service->AttachSession(f.bridge->Import(alice));
        f.bridge->SetFailing(true);
        auto ciphertext = f.service->EncryptDm("hi", bob.public_key, alice.private_key);
        REQUIRE(ciphertext.IsOk());
        REQUIRE(f.bridge->CallCount() == 1);
        REQUIRE(f.software->DecryptDm(ciphertext.Unwrap(), alice.public_key, bob.private_key).Unwrap() == "hi");
    }
    SECTION("Key generation falls back to software keys") {
        f.bridge->SetFailing(true);
        auto pair = f.service->GenerateKeyPair();
        REQUIRE(pair.IsOk());
        REQUIRE_FALSE(NativeFallbackCryptoService::IsSessionHandle(pair.Unwrap().private_key));
        REQUIRE_FALSE(f.service->ActiveSession().has_value());
    }
    SECTION("Keystore ciphertext is readable by software") {
        const std::string handle = f.bridge->Import(alice);
        auto ciphertext = f.service->EncryptDm("via keystore", bob.public_key, handle);
        REQUIRE(ciphertext.IsOk());
        REQUIRE(f.service->DecryptDm(ciphertext.Unwrap(), alice.public_key, bob.private_key).Unwrap() ==
                "via keystore");
    }
}

TEST_CASE("NativeFallback - Timeouts", "[crypto][native][timeout]") {
    Fixture f;
    const auto alice = f.software->GenerateKeyPair().Unwrap();
    const auto bob = f.software->GenerateKeyPair().Unwrap();
    const std::string handle = f.bridge->Import(alice);
    f.bridge->SetDelay(std::chrono::milliseconds(1000));

    SECTION("Handle calls report a bridge timeout") {
        auto result = f.service->EncryptDm("slow", bob.public_key, handle);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ObscurFailureType::BridgeTimeout);
    }
    SECTION("Hex keys fall back after the deadline") {
        f.service->AttachSession(handle);
        auto result = f.service->EncryptDm("slow", bob.public_key, alice.private_key);
        REQUIRE(result.IsOk());
        REQUIRE(f.software->DecryptDm(result.Unwrap(), alice.public_key, bob.private_key).Unwrap() == "slow");
    }
}

TEST_CASE("CryptoServiceFactory - Backends", "[crypto][factory]") {
    SECTION("Native backend requires a bridge") {
        auto result = CryptoServiceFactory::Create(configuration::CryptoBackendConfig::Native());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == ObscurFailureType::Validation);
    }
    SECTION("Native backend with a bridge") {
        auto result = CryptoServiceFactory::Create(
            configuration::CryptoBackendConfig::Native(), std::make_shared<MockNativeKeystoreBridge>());
        REQUIRE(result.IsOk());
        REQUIRE(dynamic_cast<NativeFallbackCryptoService*>(result.Unwrap().get()) != nullptr);
    }
    SECTION("Software backend") {
        auto result = CryptoServiceFactory::Create(configuration::CryptoBackendConfig::Software());
        REQUIRE(result.IsOk());
        REQUIRE(dynamic_cast<SoftwareCryptoService*>(result.Unwrap().get()) != nullptr);
    }
}

TEST_CASE("NativeFallback - Keystore errors are redacted in logs", "[crypto][native][logging]") {
    Fixture f;
    const auto alice = f.software->GenerateKeyPair().Unwrap();
    const auto bob = f.software->GenerateKeyPair().Unwrap();
    test_helpers::LogCapture capture;

    f.service->AttachSession(f.bridge->Import(alice));
    f.bridge->SetFailing(true);
    f.bridge->SetFailureMessage("Keystore rejected privateKey=" + alice.private_key +
                                " content: attack-at-dawn raw " + bob.private_key);
    auto ciphertext = f.service->EncryptDm("attack-at-dawn", bob.public_key, alice.private_key);
    REQUIRE(ciphertext.IsOk());

    const auto output = capture.Text();
    REQUIRE(output.find("Native encryption failed") != std::string::npos);
    REQUIRE(output.find("[REDACTED]") != std::string::npos);
    REQUIRE(output.find(alice.private_key) == std::string::npos);
    REQUIRE(output.find(bob.private_key) == std::string::npos);
    REQUIRE(output.find("attack-at-dawn") == std::string::npos);
}
