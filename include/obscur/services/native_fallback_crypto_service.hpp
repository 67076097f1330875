#pragma once
#include "obscur/interfaces/i_crypto_service.hpp"
#include "obscur/interfaces/i_native_keystore_bridge.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
namespace obscur::core::services {

using models::InvitePayload;
using models::Keypair;
using models::NostrEvent;
using models::UnsignedEvent;

/**
 * Routes signing and NIP-04 through the platform keystore when a session
 * handle is in play and everything else through a software service.
 *
 * A private key argument that starts with "native-session:" always goes to
 * the bridge and its failure is surfaced. A real hex key goes to the bridge
 * only while a keystore session is active, and falls back to software if the
 * bridge fails or misses its deadline.
 */
class NativeFallbackCryptoService final : public interfaces::ICryptoService {
public:
    NativeFallbackCryptoService(
        std::shared_ptr<interfaces::INativeKeystoreBridge> bridge,
        std::shared_ptr<interfaces::ICryptoService> software,
        std::chrono::milliseconds bridge_timeout);

    void AttachSession(std::string handle);
    void DetachSession();
    [[nodiscard]] std::optional<std::string> ActiveSession() const;
    [[nodiscard]] static bool IsSessionHandle(std::string_view key) noexcept;

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
    template<typename T, typename Call>
    Result<T, ObscurFailure> CallBridge(std::string_view operation, Call call);

    [[nodiscard]] std::optional<std::string> ResolveHandle(std::string_view privkey) const;

    std::shared_ptr<interfaces::INativeKeystoreBridge> bridge_;
    std::shared_ptr<interfaces::ICryptoService> software_;
    std::chrono::milliseconds bridge_timeout_;
    mutable std::mutex session_mutex_;
    std::optional<std::string> active_session_;
};
}
