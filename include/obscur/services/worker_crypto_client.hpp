#pragma once
#include "obscur/interfaces/i_crypto_service.hpp"
#include "obscur/interfaces/i_message_channel.hpp"
#include "worker/crypto_envelope.pb.h"
#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
namespace obscur::core::services {

/**
 * ICryptoService proxy that forwards every call to a CryptoWorker.
 *
 * Each call is tagged with a fresh correlation id and waits on its own
 * future. A response that arrives after the deadline is discarded.
 */
class WorkerCryptoClient final : public interfaces::ICryptoService {
public:
    WorkerCryptoClient(
        std::shared_ptr<interfaces::IMessageChannel> channel,
        std::chrono::milliseconds timeout);
    ~WorkerCryptoClient() override;

    WorkerCryptoClient(const WorkerCryptoClient&) = delete;
    WorkerCryptoClient& operator=(const WorkerCryptoClient&) = delete;

    [[nodiscard]] size_t PendingCount() const;

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
    struct PendingRequests {
        mutable std::mutex mutex;
        std::map<std::string, std::promise<proto::worker::CryptoResponse>> by_correlation_id;
    };

    Result<proto::worker::CryptoResponse, ObscurFailure> Call(proto::worker::CryptoRequest request);

    std::shared_ptr<interfaces::IMessageChannel> channel_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<PendingRequests> pending_;
};
}
