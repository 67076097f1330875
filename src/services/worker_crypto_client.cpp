#include "obscur/services/worker_crypto_client.hpp"
#include "obscur/crypto/encoding.hpp"
#include "obscur/crypto/sodium_interop.hpp"
#include "obscur/utilities/event_codec.hpp"
#include "obscur/logging/logger.hpp"

#include <fmt/format.h>

namespace obscur::core::services {

using proto::worker::CryptoOperation;
using proto::worker::CryptoRequest;
using proto::worker::CryptoResponse;
using utilities::EventCodec;
using StringResult = Result<std::string, ObscurFailure>;
using BytesResult = Result<std::vector<uint8_t>, ObscurFailure>;
using EventResult = Result<NostrEvent, ObscurFailure>;

namespace {
    constexpr size_t CORRELATION_ID_SIZE = 16;

    CryptoRequest MakeRequest(CryptoOperation operation, std::initializer_list<std::string_view> args = {}) {
        CryptoRequest request;
        request.set_operation(operation);
        for (const auto arg : args) {
            request.add_args(std::string(arg));
        }
        return request;
    }

    void InviteToProto(const models::InvitePayload& payload, proto::worker::InvitePayload* out) {
        out->set_public_key(payload.public_key);
        if (payload.display_name) {
            out->set_display_name(*payload.display_name);
        }
        if (payload.avatar) {
            out->set_avatar(*payload.avatar);
        }
        if (payload.message) {
            out->set_message(*payload.message);
        }
        if (payload.timestamp) {
            out->set_timestamp(*payload.timestamp);
        }
        if (payload.expiration_time) {
            out->set_expiration_time(*payload.expiration_time);
        }
        if (payload.invite_id) {
            out->set_invite_id(*payload.invite_id);
        }
    }

    StringResult ToText(Result<CryptoResponse, ObscurFailure> response) {
        if (response.IsErr()) {
            return StringResult::Err(std::move(response).UnwrapErr());
        }
        return StringResult::Ok(response.Unwrap().text());
    }

    BytesResult ToBytes(Result<CryptoResponse, ObscurFailure> response) {
        if (response.IsErr()) {
            return BytesResult::Err(std::move(response).UnwrapErr());
        }
        const auto& data = response.Unwrap().data();
        return BytesResult::Ok(std::vector<uint8_t>(data.begin(), data.end()));
    }

    EventResult ToEvent(Result<CryptoResponse, ObscurFailure> response) {
        if (response.IsErr()) {
            return EventResult::Err(std::move(response).UnwrapErr());
        }
        return EventResult::Ok(EventCodec::FromProto(response.Unwrap().event()));
    }

    bool ToFlag(Result<CryptoResponse, ObscurFailure> response) {
        return response.IsOk() && response.Unwrap().flag();
    }
}

WorkerCryptoClient::WorkerCryptoClient(
    std::shared_ptr<interfaces::IMessageChannel> channel,
    std::chrono::milliseconds timeout)
    : channel_(std::move(channel))
    , timeout_(timeout)
    , pending_(std::make_shared<PendingRequests>()) {
    std::weak_ptr<PendingRequests> weak_pending = pending_;
    channel_->OnWorkerFrame([weak_pending](const std::string& frame) {
        auto pending = weak_pending.lock();
        if (!pending) {
            return;
        }
        CryptoResponse response;
        if (!response.ParseFromString(frame)) {
            proto::worker::FrameHeader header;
            if (!header.ParseFromString(frame) || header.correlation_id().empty()) {
                logging::Logger()->error("Crypto client dropped an unparseable response frame");
                return;
            }
            response.Clear();
            response.set_correlation_id(header.correlation_id());
            response.set_ok(false);
            response.set_failure_type(static_cast<int32_t>(ObscurFailureType::Decode));
            response.set_failure_message("Malformed crypto response");
        }
        std::lock_guard lock(pending->mutex);
        auto it = pending->by_correlation_id.find(response.correlation_id());
        if (it == pending->by_correlation_id.end()) {
            logging::Logger()->debug("Late crypto response {} discarded", response.correlation_id());
            return;
        }
        it->second.set_value(std::move(response));
        pending->by_correlation_id.erase(it);
    });
}

WorkerCryptoClient::~WorkerCryptoClient() {
    channel_->OnWorkerFrame(nullptr);
}

size_t WorkerCryptoClient::PendingCount() const {
    std::lock_guard lock(pending_->mutex);
    return pending_->by_correlation_id.size();
}

Result<CryptoResponse, ObscurFailure> WorkerCryptoClient::Call(CryptoRequest request) {
    const std::string correlation_id =
        crypto::Encoding::ToHex(crypto::SodiumInterop::GetRandomBytes(CORRELATION_ID_SIZE));
    request.set_correlation_id(correlation_id);
    std::string frame;
    if (!request.SerializeToString(&frame)) {
        return Result<CryptoResponse, ObscurFailure>::Err(
            ObscurFailure::Encode("Failed to serialize crypto request"));
    }
    std::future<CryptoResponse> future;
    {
        std::lock_guard lock(pending_->mutex);
        future = pending_->by_correlation_id[correlation_id].get_future();
    }
    channel_->SendToWorker(frame);
    if (future.wait_for(timeout_) == std::future_status::timeout) {
        std::lock_guard lock(pending_->mutex);
        pending_->by_correlation_id.erase(correlation_id);
        return Result<CryptoResponse, ObscurFailure>::Err(ObscurFailure::BridgeTimeout(
            fmt::format("Crypto worker did not answer within {}ms", timeout_.count())));
    }
    CryptoResponse response = future.get();
    if (!response.ok()) {
        return Result<CryptoResponse, ObscurFailure>::Err(ObscurFailure(
            static_cast<ObscurFailureType>(response.failure_type()), response.failure_message()));
    }
    return Result<CryptoResponse, ObscurFailure>::Ok(std::move(response));
}

Result<Keypair, ObscurFailure> WorkerCryptoClient::GenerateKeyPair() {
    auto response = Call(MakeRequest(CryptoOperation::GENERATE_KEY_PAIR));
    if (response.IsErr()) {
        return Result<Keypair, ObscurFailure>::Err(std::move(response).UnwrapErr());
    }
    return Result<Keypair, ObscurFailure>::Ok(
        Keypair{response.Unwrap().public_key(), response.Unwrap().private_key()});
}

StringResult WorkerCryptoClient::EncryptDm(
    std::string_view plaintext,
    std::string_view recipient_pubkey,
    std::string_view sender_privkey) {
    return ToText(Call(MakeRequest(CryptoOperation::ENCRYPT_DM, {plaintext, recipient_pubkey, sender_privkey})));
}

StringResult WorkerCryptoClient::DecryptDm(
    std::string_view ciphertext,
    std::string_view sender_pubkey,
    std::string_view recipient_privkey) {
    return ToText(Call(MakeRequest(CryptoOperation::DECRYPT_DM, {ciphertext, sender_pubkey, recipient_privkey})));
}

EventResult WorkerCryptoClient::SignEvent(const UnsignedEvent& event, std::string_view privkey) {
    auto request = MakeRequest(CryptoOperation::SIGN_EVENT, {privkey});
    EventCodec::ToProto(event, request.mutable_event());
    return ToEvent(Call(std::move(request)));
}

bool WorkerCryptoClient::VerifyEventSignature(const NostrEvent& event) {
    auto request = MakeRequest(CryptoOperation::VERIFY_EVENT_SIGNATURE);
    EventCodec::ToProto(event, request.mutable_event());
    return ToFlag(Call(std::move(request)));
}

EventResult WorkerCryptoClient::EncryptGiftWrap(
    const UnsignedEvent& rumor,
    std::string_view sender_privkey,
    std::string_view recipient_pubkey) {
    auto request = MakeRequest(CryptoOperation::ENCRYPT_GIFT_WRAP, {sender_privkey, recipient_pubkey});
    EventCodec::ToProto(rumor, request.mutable_event());
    return ToEvent(Call(std::move(request)));
}

EventResult WorkerCryptoClient::DecryptGiftWrap(const NostrEvent& gift_wrap, std::string_view recipient_privkey) {
    auto request = MakeRequest(CryptoOperation::DECRYPT_GIFT_WRAP, {recipient_privkey});
    EventCodec::ToProto(gift_wrap, request.mutable_event());
    return ToEvent(Call(std::move(request)));
}

BytesResult WorkerCryptoClient::DeriveSharedSecret(std::string_view privkey, std::string_view pubkey) {
    return ToBytes(Call(MakeRequest(CryptoOperation::DERIVE_SHARED_SECRET, {privkey, pubkey})));
}

StringResult WorkerCryptoClient::GenerateInviteId() {
    return ToText(Call(MakeRequest(CryptoOperation::GENERATE_INVITE_ID)));
}

StringResult WorkerCryptoClient::SignInviteData(const InvitePayload& payload, std::string_view privkey) {
    auto request = MakeRequest(CryptoOperation::SIGN_INVITE_DATA, {privkey});
    InviteToProto(payload, request.mutable_invite());
    return ToText(Call(std::move(request)));
}

bool WorkerCryptoClient::VerifyInviteSignature(
    const InvitePayload& payload,
    std::string_view signature,
    std::string_view pubkey) {
    auto request = MakeRequest(CryptoOperation::VERIFY_INVITE_SIGNATURE, {signature, pubkey});
    InviteToProto(payload, request.mutable_invite());
    return ToFlag(Call(std::move(request)));
}

StringResult WorkerCryptoClient::EncryptInviteData(std::string_view plaintext, std::span<const uint8_t> key) {
    auto request = MakeRequest(CryptoOperation::ENCRYPT_INVITE_DATA, {plaintext});
    request.set_key(key.data(), key.size());
    return ToText(Call(std::move(request)));
}

StringResult WorkerCryptoClient::DecryptInviteData(std::string_view encrypted, std::span<const uint8_t> key) {
    auto request = MakeRequest(CryptoOperation::DECRYPT_INVITE_DATA, {encrypted});
    request.set_key(key.data(), key.size());
    return ToText(Call(std::move(request)));
}

BytesResult WorkerCryptoClient::GenerateSecureRandom(int64_t length) {
    auto request = MakeRequest(CryptoOperation::GENERATE_SECURE_RANDOM);
    request.set_length(length);
    return ToBytes(Call(std::move(request)));
}

bool WorkerCryptoClient::IsValidPubkey(std::string_view pubkey) {
    return ToFlag(Call(MakeRequest(CryptoOperation::IS_VALID_PUBKEY, {pubkey})));
}

std::string WorkerCryptoClient::NormalizeKey(std::string_view key) {
    auto response = Call(MakeRequest(CryptoOperation::NORMALIZE_KEY, {key}));
    if (response.IsErr()) {
        logging::LogFailure(spdlog::level::warn, "Key normalization through worker failed", response.UnwrapErr());
        return {};
    }
    return response.Unwrap().text();
}

}
