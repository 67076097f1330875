#include "obscur/services/native_fallback_crypto_service.hpp"
#include "obscur/core/constants.hpp"
#include "obscur/logging/logger.hpp"

#include <fmt/format.h>

#include <future>
#include <thread>

namespace obscur::core::services {

NativeFallbackCryptoService::NativeFallbackCryptoService(
    std::shared_ptr<interfaces::INativeKeystoreBridge> bridge,
    std::shared_ptr<interfaces::ICryptoService> software,
    std::chrono::milliseconds bridge_timeout)
    : bridge_(std::move(bridge))
    , software_(std::move(software))
    , bridge_timeout_(bridge_timeout) {}

void NativeFallbackCryptoService::AttachSession(std::string handle) {
    std::lock_guard lock(session_mutex_);
    active_session_ = std::move(handle);
}

void NativeFallbackCryptoService::DetachSession() {
    std::lock_guard lock(session_mutex_);
    active_session_.reset();
}

std::optional<std::string> NativeFallbackCryptoService::ActiveSession() const {
    std::lock_guard lock(session_mutex_);
    return active_session_;
}

bool NativeFallbackCryptoService::IsSessionHandle(std::string_view key) noexcept {
    return key.starts_with(BridgeConstants::NATIVE_SESSION_PREFIX);
}

std::optional<std::string> NativeFallbackCryptoService::ResolveHandle(std::string_view privkey) const {
    if (IsSessionHandle(privkey)) {
        return std::string(privkey);
    }
    return ActiveSession();
}

template<typename T, typename Call>
Result<T, ObscurFailure> NativeFallbackCryptoService::CallBridge(std::string_view operation, Call call) {
    // The worker thread owns the task, so a timed-out call finishes in the background.
    auto task = std::make_shared<std::packaged_task<Result<T, ObscurFailure>()>>(std::move(call));
    auto future = task->get_future();
    std::thread([task]() { (*task)(); }).detach();
    if (future.wait_for(bridge_timeout_) == std::future_status::timeout) {
        logging::Logger()->warn("Native bridge {} timed out after {}ms", operation, bridge_timeout_.count());
        return Result<T, ObscurFailure>::Err(ObscurFailure::BridgeTimeout(
            fmt::format("Native {} timed out after {}ms", operation, bridge_timeout_.count())));
    }
    try {
        return future.get();
    } catch (const std::exception& ex) {
        return Result<T, ObscurFailure>::Err(ObscurFailure::Crypto(
            fmt::format("Native {} failed: {}", operation, ex.what())));
    }
}

Result<Keypair, ObscurFailure> NativeFallbackCryptoService::GenerateKeyPair() {
    auto bridge = bridge_;
    auto native = CallBridge<Keypair>("key generation", [bridge]() { return bridge->GenerateKey(); });
    if (native.IsOk()) {
        AttachSession(native.Unwrap().private_key);
        return native;
    }
    logging::LogFailure(spdlog::level::warn, "Native key generation failed, using software keys", native.UnwrapErr());
    return software_->GenerateKeyPair();
}

Result<std::string, ObscurFailure> NativeFallbackCryptoService::EncryptDm(
    std::string_view plaintext,
    std::string_view recipient_pubkey,
    std::string_view sender_privkey) {
    const auto handle = ResolveHandle(sender_privkey);
    if (!handle) {
        return software_->EncryptDm(plaintext, recipient_pubkey, sender_privkey);
    }
    auto bridge = bridge_;
    auto native = CallBridge<std::string>("encryption",
        [bridge, text = std::string(plaintext), peer = std::string(recipient_pubkey), key = *handle]() {
            return bridge->EncryptNip04(text, peer, key);
        });
    if (native.IsOk() || IsSessionHandle(sender_privkey)) {
        return native;
    }
    logging::LogFailure(spdlog::level::warn, "Native encryption failed, falling back to software", native.UnwrapErr());
    return software_->EncryptDm(plaintext, recipient_pubkey, sender_privkey);
}

Result<std::string, ObscurFailure> NativeFallbackCryptoService::DecryptDm(
    std::string_view ciphertext,
    std::string_view sender_pubkey,
    std::string_view recipient_privkey) {
    const auto handle = ResolveHandle(recipient_privkey);
    if (!handle) {
        return software_->DecryptDm(ciphertext, sender_pubkey, recipient_privkey);
    }
    auto bridge = bridge_;
    auto native = CallBridge<std::string>("decryption",
        [bridge, text = std::string(ciphertext), peer = std::string(sender_pubkey), key = *handle]() {
            return bridge->DecryptNip04(text, peer, key);
        });
    if (native.IsOk() || IsSessionHandle(recipient_privkey)) {
        return native;
    }
    logging::LogFailure(spdlog::level::warn, "Native decryption failed, falling back to software", native.UnwrapErr());
    return software_->DecryptDm(ciphertext, sender_pubkey, recipient_privkey);
}

Result<NostrEvent, ObscurFailure> NativeFallbackCryptoService::SignEvent(
    const UnsignedEvent& event,
    std::string_view privkey) {
    const auto handle = ResolveHandle(privkey);
    if (!handle) {
        return software_->SignEvent(event, privkey);
    }
    auto bridge = bridge_;
    auto native = CallBridge<NostrEvent>("signing",
        [bridge, event, key = *handle]() { return bridge->SignEvent(event, key); });
    if (native.IsOk() || IsSessionHandle(privkey)) {
        return native;
    }
    logging::LogFailure(spdlog::level::warn, "Native signing failed, falling back to software", native.UnwrapErr());
    return software_->SignEvent(event, privkey);
}

bool NativeFallbackCryptoService::VerifyEventSignature(const NostrEvent& event) {
    return software_->VerifyEventSignature(event);
}

Result<NostrEvent, ObscurFailure> NativeFallbackCryptoService::EncryptGiftWrap(
    const UnsignedEvent& rumor,
    std::string_view sender_privkey,
    std::string_view recipient_pubkey) {
    return software_->EncryptGiftWrap(rumor, sender_privkey, recipient_pubkey);
}

Result<NostrEvent, ObscurFailure> NativeFallbackCryptoService::DecryptGiftWrap(
    const NostrEvent& gift_wrap,
    std::string_view recipient_privkey) {
    return software_->DecryptGiftWrap(gift_wrap, recipient_privkey);
}

Result<std::vector<uint8_t>, ObscurFailure> NativeFallbackCryptoService::DeriveSharedSecret(
    std::string_view privkey,
    std::string_view pubkey) {
    return software_->DeriveSharedSecret(privkey, pubkey);
}

Result<std::string, ObscurFailure> NativeFallbackCryptoService::GenerateInviteId() {
    return software_->GenerateInviteId();
}

Result<std::string, ObscurFailure> NativeFallbackCryptoService::SignInviteData(
    const InvitePayload& payload,
    std::string_view privkey) {
    return software_->SignInviteData(payload, privkey);
}

bool NativeFallbackCryptoService::VerifyInviteSignature(
    const InvitePayload& payload,
    std::string_view signature,
    std::string_view pubkey) {
    return software_->VerifyInviteSignature(payload, signature, pubkey);
}

Result<std::string, ObscurFailure> NativeFallbackCryptoService::EncryptInviteData(
    std::string_view plaintext,
    std::span<const uint8_t> key) {
    return software_->EncryptInviteData(plaintext, key);
}

Result<std::string, ObscurFailure> NativeFallbackCryptoService::DecryptInviteData(
    std::string_view encrypted,
    std::span<const uint8_t> key) {
    return software_->DecryptInviteData(encrypted, key);
}

Result<std::vector<uint8_t>, ObscurFailure> NativeFallbackCryptoService::GenerateSecureRandom(int64_t length) {
    return software_->GenerateSecureRandom(length);
}

bool NativeFallbackCryptoService::IsValidPubkey(std::string_view pubkey) {
    return software_->IsValidPubkey(pubkey);
}

std::string NativeFallbackCryptoService::NormalizeKey(std::string_view key) {
    return software_->NormalizeKey(key);
}

}
