#pragma once
#include "obscur/interfaces/i_crypto_service.hpp"
#include <memory>
namespace obscur::core::services {

using models::InvitePayload;
using models::Keypair;
using models::NostrEvent;
using models::UnsignedEvent;

/**
 * In-process ICryptoService over libsodium and OpenSSL.
 *
 * Identity keys are Ed25519 seeds in hex. DMs use AES-256-GCM under
 * SHA-256 of the X25519 shared secret, gift wraps use NIP-44 v2, and events
 * carry detached Ed25519 signatures over their id. Native session handles are
 * rejected with a Validation error; they only mean something to the keystore.
 */
class SoftwareCryptoService final : public interfaces::ICryptoService {
public:
    static Result<std::shared_ptr<SoftwareCryptoService>, ObscurFailure> Create();

    [[nodiscard]] Result<Keypair, ObscurFailure> GenerateKeyPair() override;
    [[nodiscard]] Result<std::string, ObscurFailure> EncryptDm(
        std::string_view plaintext,
        std::string_view recipient_pubkey,
        std::string_view sender_privkey) override;
    [[nodiscard]] Result<std::string, ObscurFailure> DecryptDm(
        std::string_view ciphertext,
        std::string_view sender_pubkey,
        std::string_view recipient_privkey) override;
    [[nodiscard]] Result<NostrEvent, ObscurFailure> SignEvent(
        const UnsignedEvent& event,
        std::string_view privkey) override;
    [[nodiscard]] bool VerifyEventSignature(const NostrEvent& event) override;
    [[nodiscard]] Result<NostrEvent, ObscurFailure> EncryptGiftWrap(
        const UnsignedEvent& rumor,
        std::string_view sender_privkey,
        std::string_view recipient_pubkey) override;
    [[nodiscard]] Result<NostrEvent, ObscurFailure> DecryptGiftWrap(
        const NostrEvent& gift_wrap,
        std::string_view recipient_privkey) override;
    [[nodiscard]] Result<std::vector<uint8_t>, ObscurFailure> DeriveSharedSecret(
        std::string_view privkey,
        std::string_view pubkey) override;
    [[nodiscard]] Result<std::string, ObscurFailure> GenerateInviteId() override;
    [[nodiscard]] Result<std::string, ObscurFailure> SignInviteData(
        const InvitePayload& payload,
        std::string_view privkey) override;
    [[nodiscard]] bool VerifyInviteSignature(
        const InvitePayload& payload,
        std::string_view signature,
        std::string_view pubkey) override;
    [[nodiscard]] Result<std::string, ObscurFailure> EncryptInviteData(
        std::string_view plaintext,
        std::span<const uint8_t> key) override;
    [[nodiscard]] Result<std::string, ObscurFailure> DecryptInviteData(
        std::string_view encrypted,
        std::span<const uint8_t> key) override;
    [[nodiscard]] Result<std::vector<uint8_t>, ObscurFailure> GenerateSecureRandom(
        int64_t length) override;
    [[nodiscard]] bool IsValidPubkey(std::string_view pubkey) override;
    [[nodiscard]] std::string NormalizeKey(std::string_view key) override;

private:
    SoftwareCryptoService() = default;

    Result<NostrEvent, ObscurFailure> SealLayer(
        const NostrEvent& inner,
        int kind,
        models::Tags tags,
        std::string_view recipient_pubkey);
    Result<NostrEvent, ObscurFailure> OpenLayer(
        const NostrEvent& outer,
        int expected_kind,
        std::string_view recipient_privkey);
};
}
