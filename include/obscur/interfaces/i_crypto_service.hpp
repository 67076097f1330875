#pragma once
#include "obscur/core/result.hpp"
#include "obscur/core/failures.hpp"
#include "obscur/models/nostr_event.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
namespace obscur::core::interfaces {
using models::InvitePayload;
using models::Keypair;
using models::NostrEvent;
using models::UnsignedEvent;
class ICryptoService {
public:
    virtual ~ICryptoService() = default;
    [[nodiscard]] virtual Result<Keypair, ObscurFailure> GenerateKeyPair() = 0;
    [[nodiscard]] virtual Result<std::string, ObscurFailure> EncryptDm(
        std::string_view plaintext,
        std::string_view recipient_pubkey,
        std::string_view sender_privkey) = 0;
    [[nodiscard]] virtual Result<std::string, ObscurFailure> DecryptDm(
        std::string_view ciphertext,
        std::string_view sender_pubkey,
        std::string_view recipient_privkey) = 0;
    [[nodiscard]] virtual Result<NostrEvent, ObscurFailure> SignEvent(
        const UnsignedEvent& event,
        std::string_view privkey) = 0;
    [[nodiscard]] virtual bool VerifyEventSignature(const NostrEvent& event) = 0;
    [[nodiscard]] virtual Result<NostrEvent, ObscurFailure> EncryptGiftWrap(
        const UnsignedEvent& rumor,
        std::string_view sender_privkey,
        std::string_view recipient_pubkey) = 0;
    [[nodiscard]] virtual Result<NostrEvent, ObscurFailure> DecryptGiftWrap(
        const NostrEvent& gift_wrap,
        std::string_view recipient_privkey) = 0;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ObscurFailure> DeriveSharedSecret(
        std::string_view privkey,
        std::string_view pubkey) = 0;
    [[nodiscard]] virtual Result<std::string, ObscurFailure> GenerateInviteId() = 0;
    [[nodiscard]] virtual Result<std::string, ObscurFailure> SignInviteData(
        const InvitePayload& payload,
        std::string_view privkey) = 0;
    [[nodiscard]] virtual bool VerifyInviteSignature(
        const InvitePayload& payload,
        std::string_view signature,
        std::string_view pubkey) = 0;
    [[nodiscard]] virtual Result<std::string, ObscurFailure> EncryptInviteData(
        std::string_view plaintext,
        std::span<const uint8_t> key) = 0;
    [[nodiscard]] virtual Result<std::string, ObscurFailure> DecryptInviteData(
        std::string_view encrypted,
        std::span<const uint8_t> key) = 0;
    [[nodiscard]] virtual Result<std::vector<uint8_t>, ObscurFailure> GenerateSecureRandom(
        int64_t length) = 0;
    [[nodiscard]] virtual bool IsValidPubkey(std::string_view pubkey) = 0;
    [[nodiscard]] virtual std::string NormalizeKey(std::string_view key) = 0;
};
}
