#include "obscur/services/crypto_worker.hpp"
#include "obscur/utilities/event_codec.hpp"
#include "obscur/logging/logger.hpp"

namespace obscur::core::services {

using proto::worker::CryptoOperation;
using proto::worker::CryptoRequest;
using proto::worker::CryptoResponse;
using utilities::EventCodec;

namespace {
    void SetFailure(CryptoResponse& response, const ObscurFailure& failure) {
        response.set_ok(false);
        response.set_failure_type(static_cast<int32_t>(failure.type));
        response.set_failure_message(failure.message);
    }

    template<typename T, typename OnOk>
    void Complete(CryptoResponse& response, Result<T, ObscurFailure> result, OnOk&& on_ok) {
        if (result.IsErr()) {
            SetFailure(response, result.UnwrapErr());
            return;
        }
        response.set_ok(true);
        std::forward<OnOk>(on_ok)(std::move(result).Unwrap());
    }

    models::InvitePayload InviteFromProto(const proto::worker::InvitePayload& proto_invite) {
        models::InvitePayload payload;
        payload.public_key = proto_invite.public_key();
        if (proto_invite.has_display_name()) {
            payload.display_name = proto_invite.display_name();
        }
        if (proto_invite.has_avatar()) {
            payload.avatar = proto_invite.avatar();
        }
        if (proto_invite.has_message()) {
            payload.message = proto_invite.message();
        }
        if (proto_invite.has_timestamp()) {
            payload.timestamp = proto_invite.timestamp();
        }
        if (proto_invite.has_expiration_time()) {
            payload.expiration_time = proto_invite.expiration_time();
        }
        if (proto_invite.has_invite_id()) {
            payload.invite_id = proto_invite.invite_id();
        }
        return payload;
    }

    std::span<const uint8_t> KeyBytes(const CryptoRequest& request) {
        return {reinterpret_cast<const uint8_t*>(request.key().data()), request.key().size()};
    }
}

CryptoWorker::CryptoWorker(
    std::shared_ptr<interfaces::IMessageChannel> channel,
    std::shared_ptr<interfaces::ICryptoService> service)
    : channel_(std::move(channel))
    , service_(std::move(service))
    , inbox_(std::make_shared<Inbox>()) {}

CryptoWorker::~CryptoWorker() {
    Stop();
}

void CryptoWorker::Start() {
    if (thread_.joinable()) {
        return;
    }
    std::weak_ptr<Inbox> weak_inbox = inbox_;
    channel_->OnClientFrame([weak_inbox](const std::string& frame) {
        auto inbox = weak_inbox.lock();
        if (!inbox) {
            return;
        }
        {
            std::lock_guard lock(inbox->mutex);
            inbox->frames.push_back(frame);
        }
        inbox->cv.notify_one();
    });
    thread_ = std::jthread([this](std::stop_token stop_token) { Run(stop_token); });
}

void CryptoWorker::Stop() {
    channel_->OnClientFrame(nullptr);
    if (thread_.joinable()) {
        thread_.request_stop();
        inbox_->cv.notify_all();
        thread_.join();
    }
}

void CryptoWorker::Run(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        std::string frame;
        {
            std::unique_lock lock(inbox_->mutex);
            if (!inbox_->cv.wait(lock, stop_token, [this]() { return !inbox_->frames.empty(); })) {
                return;
            }
            frame = std::move(inbox_->frames.front());
            inbox_->frames.pop_front();
        }
        CryptoRequest request;
        if (!request.ParseFromString(frame)) {
            RejectFrame(frame);
            continue;
        }
        Reply(Handle(request));
    }
}

void CryptoWorker::Reply(const CryptoResponse& response) {
    std::string out;
    if (!response.SerializeToString(&out)) {
        logging::Logger()->error("Crypto worker failed to encode response {}", response.correlation_id());
        return;
    }
    channel_->SendToClient(out);
}

void CryptoWorker::RejectFrame(const std::string& frame) {
    proto::worker::FrameHeader header;
    if (!header.ParseFromString(frame) || header.correlation_id().empty()) {
        logging::Logger()->error("Crypto worker dropped an unparseable request frame");
        return;
    }
    logging::Logger()->warn("Crypto worker could not decode request {}", header.correlation_id());
    CryptoResponse response;
    response.set_correlation_id(header.correlation_id());
    SetFailure(response, ObscurFailure::Decode("Malformed crypto request"));
    Reply(response);
}

CryptoResponse CryptoWorker::Handle(const CryptoRequest& request) {
    CryptoResponse response;
    response.set_correlation_id(request.correlation_id());
    const auto& args = request.args();
    auto arg = [&args](int index) -> std::string_view {
        return index < args.size() ? std::string_view(args.Get(index)) : std::string_view();
    };
    auto set_text = [&response](std::string value) { response.set_text(std::move(value)); };
    auto set_event = [&response](models::NostrEvent event) {
        EventCodec::ToProto(event, response.mutable_event());
    };
    auto set_data = [&response](std::vector<uint8_t> data) {
        response.set_data(data.data(), data.size());
    };

    switch (request.operation()) {
        case CryptoOperation::GENERATE_KEY_PAIR:
            Complete(response, service_->GenerateKeyPair(), [&response](models::Keypair keypair) {
                response.set_public_key(keypair.public_key);
                response.set_private_key(keypair.private_key);
            });
            break;
        case CryptoOperation::ENCRYPT_DM:
            Complete(response, service_->EncryptDm(arg(0), arg(1), arg(2)), set_text);
            break;
        case CryptoOperation::DECRYPT_DM:
            Complete(response, service_->DecryptDm(arg(0), arg(1), arg(2)), set_text);
            break;
        case CryptoOperation::SIGN_EVENT:
            Complete(response, service_->SignEvent(EventCodec::UnsignedFromProto(request.event()), arg(0)), set_event);
            break;
        case CryptoOperation::VERIFY_EVENT_SIGNATURE:
            response.set_ok(true);
            response.set_flag(service_->VerifyEventSignature(EventCodec::FromProto(request.event())));
            break;
        case CryptoOperation::ENCRYPT_GIFT_WRAP:
            Complete(response,
                     service_->EncryptGiftWrap(EventCodec::UnsignedFromProto(request.event()), arg(0), arg(1)),
                     set_event);
            break;
        case CryptoOperation::DECRYPT_GIFT_WRAP:
            Complete(response, service_->DecryptGiftWrap(EventCodec::FromProto(request.event()), arg(0)), set_event);
            break;
        case CryptoOperation::DERIVE_SHARED_SECRET:
            Complete(response, service_->DeriveSharedSecret(arg(0), arg(1)), set_data);
            break;
        case CryptoOperation::GENERATE_INVITE_ID:
            Complete(response, service_->GenerateInviteId(), set_text);
            break;
        case CryptoOperation::SIGN_INVITE_DATA:
            Complete(response, service_->SignInviteData(InviteFromProto(request.invite()), arg(0)), set_text);
            break;
        case CryptoOperation::VERIFY_INVITE_SIGNATURE:
            response.set_ok(true);
            response.set_flag(service_->VerifyInviteSignature(InviteFromProto(request.invite()), arg(0), arg(1)));
            break;
        case CryptoOperation::ENCRYPT_INVITE_DATA:
            Complete(response, service_->EncryptInviteData(arg(0), KeyBytes(request)), set_text);
            break;
        case CryptoOperation::DECRYPT_INVITE_DATA:
            Complete(response, service_->DecryptInviteData(arg(0), KeyBytes(request)), set_text);
            break;
        case CryptoOperation::GENERATE_SECURE_RANDOM:
            Complete(response, service_->GenerateSecureRandom(request.length()), set_data);
            break;
        case CryptoOperation::IS_VALID_PUBKEY:
            response.set_ok(true);
            response.set_flag(service_->IsValidPubkey(arg(0)));
            break;
        case CryptoOperation::NORMALIZE_KEY:
            response.set_ok(true);
            response.set_text(service_->NormalizeKey(arg(0)));
            break;
        default:
            SetFailure(response, ObscurFailure::Validation("Unknown crypto operation"));
            break;
    }
    return response;
}

}
