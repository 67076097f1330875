#include "obscur/storage/message_store.hpp"
#include "obscur/storage/sqlite_document_store.hpp"
#include "obscur/core/constants.hpp"
#include "obscur/crypto/aes_gcm.hpp"
#include "obscur/crypto/encoding.hpp"
#include "obscur/crypto/identity_keys.hpp"
#include "obscur/crypto/security_utils.hpp"
#include "obscur/crypto/sodium_interop.hpp"
#include "obscur/logging/logger.hpp"
#include "obscur/utilities/event_codec.hpp"
#include "storage/stored_message.pb.h"

#include <fmt/format.h>

#include <algorithm>
#include <functional>

namespace obscur::core::storage {

using crypto::AesGcm;
using crypto::Encoding;
using crypto::IdentityKeys;
using crypto::SecureMemoryHandle;
using crypto::SecurityUtils;
using crypto::SodiumInterop;
using interfaces::Collection;
using interfaces::Document;
using interfaces::Index;
using interfaces::IndexQuery;
using models::Message;
using models::MessageStatus;
using models::OutgoingMessage;
using models::Timestamp;
using models::FromUnixMillis;
using models::ToUnixMillis;
using BytesResult = Result<std::vector<uint8_t>, ObscurFailure>;

namespace {
    using StoreResult = Result<std::unique_ptr<MessageStore>, ObscurFailure>;

    void CopyAttachments(const std::vector<models::Attachment>& from,
                         google::protobuf::RepeatedPtrField<proto::storage::Attachment>* to) {
        for (const auto& attachment : from) {
            auto* out = to->Add();
            out->set_kind(static_cast<int32_t>(attachment.kind));
            out->set_url(attachment.url);
            out->set_content_type(attachment.content_type);
            out->set_file_name(attachment.file_name);
        }
    }

    std::vector<models::Attachment> ReadAttachments(
        const google::protobuf::RepeatedPtrField<proto::storage::Attachment>& from) {
        std::vector<models::Attachment> attachments;
        attachments.reserve(static_cast<size_t>(from.size()));
        for (const auto& in : from) {
            attachments.push_back(models::Attachment{
                static_cast<models::AttachmentKind>(in.kind()),
                in.url(),
                in.content_type(),
                in.file_name()});
        }
        return attachments;
    }

    void WriteSensitive(const Message& message, proto::storage::SensitiveFields* out) {
        out->set_content(message.content);
        if (message.encrypted_content) {
            out->set_encrypted_content(*message.encrypted_content);
        }
        CopyAttachments(message.attachments, out->mutable_attachments());
        if (message.reply_to) {
            out->mutable_reply_to()->set_message_id(message.reply_to->message_id);
            out->mutable_reply_to()->set_preview_text(message.reply_to->preview_text);
        }
    }

    void ReadSensitive(const proto::storage::SensitiveFields& in, Message& message) {
        message.content = in.content();
        if (in.has_encrypted_content()) {
            message.encrypted_content = in.encrypted_content();
        }
        message.attachments = ReadAttachments(in.attachments());
        if (in.has_reply_to()) {
            message.reply_to = models::ReplyTo{in.reply_to().message_id(), in.reply_to().preview_text()};
        }
    }

    std::string EncodeOutgoing(const OutgoingMessage& message) {
        proto::storage::StoredOutgoingMessage record;
        record.set_id(message.id);
        record.set_conversation_id(message.conversation_id);
        record.set_content(message.content);
        record.set_recipient_pubkey(message.recipient_pubkey);
        record.set_created_at_ms(ToUnixMillis(message.created_at));
        record.set_retry_count(message.retry_count);
        record.set_next_retry_at_ms(ToUnixMillis(message.next_retry_at));
        if (message.signed_event) {
            utilities::EventCodec::ToProto(*message.signed_event, record.mutable_signed_event());
        }
        return record.SerializeAsString();
    }

    std::optional<OutgoingMessage> DecodeOutgoing(const Document& document) {
        proto::storage::StoredOutgoingMessage record;
        if (!record.ParseFromString(document.payload)) {
            return std::nullopt;
        }
        OutgoingMessage message;
        message.id = record.id();
        message.conversation_id = record.conversation_id();
        message.content = record.content();
        message.recipient_pubkey = record.recipient_pubkey();
        message.created_at = FromUnixMillis(record.created_at_ms());
        message.retry_count = record.retry_count();
        message.next_retry_at = FromUnixMillis(record.next_retry_at_ms());
        if (record.has_signed_event()) {
            message.signed_event = utilities::EventCodec::FromProto(record.signed_event());
        }
        return message;
    }
}

MessageStore::MessageStore(
    std::shared_ptr<interfaces::IDocumentStore> documents,
    SecureMemoryHandle key,
    const bool encrypt_at_rest,
    const int max_retries)
    : documents_(std::move(documents))
    , key_(std::move(key))
    , encrypt_at_rest_(encrypt_at_rest)
    , max_retries_(max_retries) {}

StoreResult MessageStore::Create(
    std::shared_ptr<interfaces::IDocumentStore> documents,
    configuration::StoreConfig config) {
    if (!documents) {
        return StoreResult::Err(ObscurFailure::Validation("Document store is required"));
    }
    if (config.identity_pubkey.empty() && !config.encryption_secret) {
        return StoreResult::Err(ObscurFailure::Validation("Identity public key or encryption secret is required"));
    }
    if (config.max_retries < 0) {
        return StoreResult::Err(ObscurFailure::Validation("Max retries must not be negative"));
    }
    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return StoreResult::Err(ObscurFailure::FromSodiumFailure(init.UnwrapErr()));
    }

    if (config.encrypt_at_rest && !config.encryption_secret) {
        logging::Logger()->warn(
            "At-rest key derived from the public key; records are readable by anyone who knows it");
    }
    const std::string& secret = config.encryption_secret ? *config.encryption_secret : config.identity_pubkey;
    auto digest = IdentityKeys::Sha256(Encoding::ToBytes(secret));
    auto handle = SecureMemoryHandle::Allocate(digest.size());
    if (handle.IsErr()) {
        SecurityUtils::ClearSensitiveBuffer(digest);
        return StoreResult::Err(ObscurFailure::FromSodiumFailure(handle.UnwrapErr()));
    }
    auto written = handle.Unwrap().Write(digest);
    SecurityUtils::ClearSensitiveBuffer(digest);
    if (written.IsErr()) {
        return StoreResult::Err(ObscurFailure::FromSodiumFailure(written.UnwrapErr()));
    }
    if (config.encryption_secret) {
        SecurityUtils::ClearSensitiveString(*config.encryption_secret);
    }

    std::unique_ptr<MessageStore> store(new MessageStore(
        std::move(documents),
        std::move(handle).Unwrap(),
        config.encrypt_at_rest,
        config.max_retries));
    return StoreResult::Ok(std::move(store));
}

StoreResult MessageStore::Open(configuration::StoreConfig config) {
    auto sqlite = SqliteDocumentStore::Open(config.database_path, config.busy_timeout);
    if (sqlite.IsErr()) {
        return StoreResult::Err(std::move(sqlite).UnwrapErr());
    }
    std::shared_ptr<interfaces::IDocumentStore> documents = std::move(sqlite).Unwrap();
    return Create(std::move(documents), std::move(config));
}

std::mutex& MessageStore::LockFor(std::string_view id) {
    return locks_[std::hash<std::string_view>{}(id) % LOCK_STRIPES];
}

void MessageStore::SetEncryptAtRest(const bool enabled) noexcept {
    encrypt_at_rest_.store(enabled);
    logging::Logger()->info("At-rest encryption {} for new writes", enabled ? "enabled" : "disabled");
}

bool MessageStore::IsEncryptAtRest() const noexcept {
    return encrypt_at_rest_.load();
}

BytesResult MessageStore::SealWithKey(std::span<const uint8_t> plaintext) const {
    auto sealed = key_.WithReadAccess([&](std::span<const uint8_t> key) {
        return AesGcm::Seal(key, plaintext);
    });
    if (sealed.IsErr()) {
        return BytesResult::Err(ObscurFailure::FromSodiumFailure(sealed.UnwrapErr()));
    }
    return std::move(sealed).Unwrap();
}

BytesResult MessageStore::OpenWithKey(std::span<const uint8_t> sealed) const {
    auto opened = key_.WithReadAccess([&](std::span<const uint8_t> key) {
        return AesGcm::Open(key, sealed);
    });
    if (opened.IsErr()) {
        return BytesResult::Err(ObscurFailure::FromSodiumFailure(opened.UnwrapErr()));
    }
    return std::move(opened).Unwrap();
}

Result<std::string, ObscurFailure> MessageStore::EncodeRecord(const Message& message) const {
    proto::storage::StoredMessage record;
    record.set_id(message.id);
    record.set_conversation_id(message.conversation_id);
    record.set_kind(static_cast<int32_t>(message.kind));
    record.set_timestamp_ms(ToUnixMillis(message.timestamp));
    record.set_is_outgoing(message.is_outgoing);
    record.set_status(static_cast<int32_t>(message.status));
    if (message.dm_format) {
        record.set_dm_format(static_cast<int32_t>(*message.dm_format));
    }
    if (message.event_id) {
        record.set_event_id(*message.event_id);
    }
    if (message.event_created_at) {
        record.set_event_created_at(*message.event_created_at);
    }
    record.set_sender_pubkey(message.sender_pubkey);
    record.set_recipient_pubkey(message.recipient_pubkey);
    for (const auto& relay : message.relay_results) {
        auto* out = record.add_relay_results();
        out->set_relay_url(relay.relay_url);
        out->set_success(relay.success);
        if (relay.error) {
            out->set_error(*relay.error);
        }
        if (relay.latency_ms) {
            out->set_latency_ms(*relay.latency_ms);
        }
    }
    if (message.synced_at) {
        record.set_synced_at_ms(ToUnixMillis(*message.synced_at));
    }
    if (message.retry_count) {
        record.set_retry_count(*message.retry_count);
    }
    for (const auto& [emoji, count] : message.reactions) {
        (*record.mutable_reactions())[emoji] = count;
    }
    if (message.deleted_at) {
        record.set_deleted_at_ms(ToUnixMillis(*message.deleted_at));
    }

    if (!encrypt_at_rest_.load()) {
        record.set_content(message.content);
        if (message.encrypted_content) {
            record.set_encrypted_content(*message.encrypted_content);
        }
        CopyAttachments(message.attachments, record.mutable_attachments());
        if (message.reply_to) {
            record.mutable_reply_to()->set_message_id(message.reply_to->message_id);
            record.mutable_reply_to()->set_preview_text(message.reply_to->preview_text);
        }
        return Result<std::string, ObscurFailure>::Ok(record.SerializeAsString());
    }

    proto::storage::SensitiveFields sensitive;
    WriteSensitive(message, &sensitive);
    std::string plaintext = sensitive.SerializeAsString();
    auto sealed = SealWithKey(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(plaintext.data()), plaintext.size()));
    SecurityUtils::ClearSensitiveString(plaintext);
    if (sealed.IsErr()) {
        return Result<std::string, ObscurFailure>::Err(ObscurFailure::Encode(
            fmt::format("Failed to encrypt message {}: {}", message.id, sealed.UnwrapErr().message)));
    }
    record.set_content(std::string(StorageConstants::ENCRYPTED_SENTINEL));
    record.set_is_encrypted(true);
    record.set_encrypted_data(Encoding::ToBase64(sealed.Unwrap()));
    return Result<std::string, ObscurFailure>::Ok(record.SerializeAsString());
}

Result<Message, ObscurFailure> MessageStore::DecodeRecord(const Document& document) const {
    proto::storage::StoredMessage record;
    if (!record.ParseFromString(document.payload)) {
        return Result<Message, ObscurFailure>::Err(
            ObscurFailure::Decode(fmt::format("Corrupt message record {}", document.id)));
    }
    Message message;
    message.id = record.id();
    message.conversation_id = record.conversation_id();
    message.kind = static_cast<models::MessageKind>(record.kind());
    message.timestamp = FromUnixMillis(record.timestamp_ms());
    message.is_outgoing = record.is_outgoing();
    message.status = static_cast<MessageStatus>(record.status());
    if (record.has_dm_format()) {
        message.dm_format = static_cast<models::DmFormat>(record.dm_format());
    }
    if (record.has_event_id()) {
        message.event_id = record.event_id();
    }
    if (record.has_event_created_at()) {
        message.event_created_at = record.event_created_at();
    }
    message.sender_pubkey = record.sender_pubkey();
    message.recipient_pubkey = record.recipient_pubkey();
    for (const auto& relay : record.relay_results()) {
        models::RelayResult result;
        result.relay_url = relay.relay_url();
        result.success = relay.success();
        if (relay.has_error()) {
            result.error = relay.error();
        }
        if (relay.has_latency_ms()) {
            result.latency_ms = relay.latency_ms();
        }
        message.relay_results.push_back(std::move(result));
    }
    if (record.has_synced_at_ms()) {
        message.synced_at = FromUnixMillis(record.synced_at_ms());
    }
    if (record.has_retry_count()) {
        message.retry_count = record.retry_count();
    }
    for (const auto& [emoji, count] : record.reactions()) {
        message.reactions[emoji] = count;
    }
    if (record.has_deleted_at_ms()) {
        message.deleted_at = FromUnixMillis(record.deleted_at_ms());
    }

    if (!record.is_encrypted()) {
        message.content = record.content();
        if (record.has_encrypted_content()) {
            message.encrypted_content = record.encrypted_content();
        }
        message.attachments = ReadAttachments(record.attachments());
        if (record.has_reply_to()) {
            message.reply_to = models::ReplyTo{record.reply_to().message_id(), record.reply_to().preview_text()};
        }
        return Result<Message, ObscurFailure>::Ok(std::move(message));
    }

    auto sealed = Encoding::FromBase64(record.encrypted_data());
    if (sealed.IsErr()) {
        return Result<Message, ObscurFailure>::Err(
            ObscurFailure::Decode(fmt::format("Corrupt encrypted payload for message {}", document.id)));
    }
    auto opened = OpenWithKey(sealed.Unwrap());
    if (opened.IsErr()) {
        return Result<Message, ObscurFailure>::Err(ObscurFailure::Crypto(
            fmt::format("Failed to decrypt message {}: {}", document.id, opened.UnwrapErr().message)));
    }
    proto::storage::SensitiveFields sensitive;
    const bool parsed = sensitive.ParseFromArray(opened.Unwrap().data(), static_cast<int>(opened.Unwrap().size()));
    SecurityUtils::ClearSensitiveBuffer(opened.Unwrap());
    if (!parsed) {
        return Result<Message, ObscurFailure>::Err(
            ObscurFailure::Decode(fmt::format("Corrupt sensitive fields for message {}", document.id)));
    }
    ReadSensitive(sensitive, message);
    return Result<Message, ObscurFailure>::Ok(std::move(message));
}

Result<Unit, ObscurFailure> MessageStore::WriteLocked(const Message& message) {
    auto payload = EncodeRecord(message);
    if (payload.IsErr()) {
        return Result<Unit, ObscurFailure>::Err(std::move(payload).UnwrapErr());
    }
    return documents_->Put(Collection::Messages, Document{
        message.id,
        message.conversation_id,
        ToUnixMillis(message.timestamp),
        std::move(payload).Unwrap()});
}

Result<std::optional<Message>, ObscurFailure> MessageStore::ReadLocked(std::string_view id) {
    auto document = documents_->Get(Collection::Messages, id);
    if (document.IsErr()) {
        return Result<std::optional<Message>, ObscurFailure>::Err(std::move(document).UnwrapErr());
    }
    if (!document.Unwrap()) {
        return Result<std::optional<Message>, ObscurFailure>::Ok(std::nullopt);
    }
    auto message = DecodeRecord(*document.Unwrap());
    if (message.IsErr()) {
        return Result<std::optional<Message>, ObscurFailure>::Err(std::move(message).UnwrapErr());
    }
    return Result<std::optional<Message>, ObscurFailure>::Ok(std::move(message).Unwrap());
}

Result<Unit, ObscurFailure> MessageStore::PersistMessage(const Message& message) {
    if (message.id.empty() || message.conversation_id.empty()) {
        return Result<Unit, ObscurFailure>::Err(
            ObscurFailure::Validation("Message id and conversation id are required"));
    }
    std::lock_guard lock(LockFor(message.id));
    auto written = WriteLocked(message);
    if (written.IsErr()) {
        logging::LogFailure(spdlog::level::err, fmt::format("Failed to persist message {}", message.id), written.UnwrapErr());
        return written;
    }
    logging::Logger()->debug("Persisted message {} in {}", message.id, message.conversation_id);
    return written;
}

Result<std::optional<Message>, ObscurFailure> MessageStore::GetMessage(std::string_view id) {
    std::lock_guard lock(LockFor(id));
    return ReadLocked(id);
}

Result<std::vector<Message>, ObscurFailure> MessageStore::GetMessages(
    std::string_view conversation_id,
    const MessageQuery& query) {
    using MessagesResult = Result<std::vector<Message>, ObscurFailure>;
    IndexQuery index_query;
    index_query.index = Index::ConversationId;
    index_query.equals = std::string(conversation_id);
    if (query.after) {
        index_query.lower = ToUnixMillis(*query.after);
    }
    if (query.before) {
        index_query.upper = ToUnixMillis(*query.before);
    }
    auto documents = documents_->GetAllByIndex(Collection::Messages, index_query);
    if (documents.IsErr()) {
        return MessagesResult::Err(std::move(documents).UnwrapErr());
    }

    std::vector<Message> messages;
    messages.reserve(documents.Unwrap().size());
    for (const auto& document : documents.Unwrap()) {
        auto message = DecodeRecord(document);
        if (message.IsErr()) {
            logging::Logger()->warn("Skipping unreadable message {}: {}",
                                    document.id, message.UnwrapErr().TypeName());
            continue;
        }
        const Timestamp timestamp = message.Unwrap().timestamp;
        if (query.before && timestamp >= *query.before) {
            continue;
        }
        if (query.after && timestamp <= *query.after) {
            continue;
        }
        messages.push_back(std::move(message).Unwrap());
    }

    const size_t skip = std::min(query.offset.value_or(0), messages.size());
    const size_t end = messages.size() - skip;
    const size_t begin = query.limit && *query.limit < end ? end - *query.limit : 0;
    std::vector<Message> window(
        std::make_move_iterator(messages.begin() + static_cast<std::ptrdiff_t>(begin)),
        std::make_move_iterator(messages.begin() + static_cast<std::ptrdiff_t>(end)));
    return MessagesResult::Ok(std::move(window));
}

Result<Unit, ObscurFailure> MessageStore::UpdateMessageStatus(std::string_view id, const MessageStatus status) {
    std::lock_guard lock(LockFor(id));
    auto current = ReadLocked(id);
    if (current.IsErr()) {
        return Result<Unit, ObscurFailure>::Err(std::move(current).UnwrapErr());
    }
    if (!current.Unwrap()) {
        return Result<Unit, ObscurFailure>::Err(
            ObscurFailure::NotFound(fmt::format("Message {} not found", id)));
    }
    Message& message = *current.Unwrap();
    if (!models::IsAllowedTransition(message.status, status)) {
        return Result<Unit, ObscurFailure>::Err(ObscurFailure::InvalidState(fmt::format(
            "Cannot move message {} from {} to {}", id, models::ToString(message.status), models::ToString(status))));
    }
    if (message.status == status) {
        return Result<Unit, ObscurFailure>::Ok(unit);
    }
    message.status = status;
    auto written = WriteLocked(message);
    if (written.IsOk()) {
        logging::Logger()->debug("Message {} is now {}", id, models::ToString(status));
    }
    return written;
}

Result<Unit, ObscurFailure> MessageStore::QueueOutgoingMessage(const OutgoingMessage& message) {
    if (message.id.empty()) {
        return Result<Unit, ObscurFailure>::Err(ObscurFailure::Validation("Queued message id is required"));
    }
    auto written = documents_->Put(Collection::Queue, Document{
        message.id,
        message.conversation_id,
        ToUnixMillis(message.next_retry_at),
        EncodeOutgoing(message)});
    if (written.IsOk()) {
        logging::Logger()->debug("Queued message {} (retry {}) for {}",
                                 message.id, message.retry_count, ToUnixMillis(message.next_retry_at));
    }
    return written;
}

Result<std::vector<OutgoingMessage>, ObscurFailure> MessageStore::GetQueuedMessages() {
    return GetQueuedMessages(models::Clock::now());
}

Result<std::vector<OutgoingMessage>, ObscurFailure> MessageStore::GetQueuedMessages(const Timestamp now) {
    using QueueResult = Result<std::vector<OutgoingMessage>, ObscurFailure>;
    IndexQuery query;
    query.index = Index::NextRetryAt;
    query.upper = ToUnixMillis(now);
    auto documents = documents_->GetAllByIndex(Collection::Queue, query);
    if (documents.IsErr()) {
        return QueueResult::Err(std::move(documents).UnwrapErr());
    }
    std::vector<OutgoingMessage> due;
    for (const auto& document : documents.Unwrap()) {
        auto message = DecodeOutgoing(document);
        if (!message) {
            logging::Logger()->warn("Skipping corrupt queue entry {}", document.id);
            continue;
        }
        if (message->retry_count < max_retries_) {
            due.push_back(std::move(*message));
        }
    }
    return QueueResult::Ok(std::move(due));
}

Result<std::optional<OutgoingMessage>, ObscurFailure> MessageStore::GetQueuedMessage(std::string_view id) {
    using EntryResult = Result<std::optional<OutgoingMessage>, ObscurFailure>;
    auto document = documents_->Get(Collection::Queue, id);
    if (document.IsErr()) {
        return EntryResult::Err(std::move(document).UnwrapErr());
    }
    if (!document.Unwrap()) {
        return EntryResult::Ok(std::nullopt);
    }
    auto message = DecodeOutgoing(*document.Unwrap());
    if (!message) {
        return EntryResult::Err(ObscurFailure::Decode(fmt::format("Corrupt queue entry {}", id)));
    }
    return EntryResult::Ok(std::move(message));
}

Result<bool, ObscurFailure> MessageStore::RemoveFromQueue(std::string_view id) {
    return documents_->Delete(Collection::Queue, id);
}

Result<Unit, ObscurFailure> MessageStore::FailQueuedMessage(std::string_view id) {
    auto removed = RemoveFromQueue(id);
    if (removed.IsErr()) {
        return Result<Unit, ObscurFailure>::Err(std::move(removed).UnwrapErr());
    }
    std::lock_guard lock(LockFor(id));
    auto current = ReadLocked(id);
    if (current.IsErr()) {
        return Result<Unit, ObscurFailure>::Err(std::move(current).UnwrapErr());
    }
    if (!current.Unwrap()) {
        return Result<Unit, ObscurFailure>::Ok(unit);
    }
    Message& message = *current.Unwrap();
    if (message.status == MessageStatus::Failed ||
        !models::IsAllowedTransition(message.status, MessageStatus::Failed)) {
        return Result<Unit, ObscurFailure>::Ok(unit);
    }
    message.status = MessageStatus::Failed;
    auto written = WriteLocked(message);
    if (written.IsOk()) {
        logging::Logger()->warn("Message {} failed after exhausting retries", id);
    }
    return written;
}

Result<std::optional<Timestamp>, ObscurFailure> MessageStore::GetLastMessageTimestamp(
    std::string_view conversation_id) {
    using TimestampResult = Result<std::optional<Timestamp>, ObscurFailure>;
    IndexQuery query;
    query.index = Index::ConversationId;
    query.equals = std::string(conversation_id);
    auto documents = documents_->GetAllByIndex(Collection::Messages, query);
    if (documents.IsErr()) {
        return TimestampResult::Err(std::move(documents).UnwrapErr());
    }
    if (documents.Unwrap().empty()) {
        return TimestampResult::Ok(std::nullopt);
    }
    return TimestampResult::Ok(FromUnixMillis(documents.Unwrap().back().order_key));
}

Result<size_t, ObscurFailure> MessageStore::MarkMessagesSynced(const std::vector<std::string>& ids) {
    const Timestamp now = models::Clock::now();
    size_t marked = 0;
    for (const auto& id : ids) {
        std::lock_guard lock(LockFor(id));
        auto current = ReadLocked(id);
        if (current.IsErr()) {
            return Result<size_t, ObscurFailure>::Err(std::move(current).UnwrapErr());
        }
        if (!current.Unwrap()) {
            continue;
        }
        current.Unwrap()->synced_at = now;
        auto written = WriteLocked(*current.Unwrap());
        if (written.IsErr()) {
            return Result<size_t, ObscurFailure>::Err(std::move(written).UnwrapErr());
        }
        ++marked;
    }
    return Result<size_t, ObscurFailure>::Ok(marked);
}

Result<size_t, ObscurFailure> MessageStore::CleanupOldMessages(const Timestamp older_than) {
    IndexQuery query;
    query.index = Index::Timestamp;
    query.upper = ToUnixMillis(older_than);
    auto documents = documents_->GetAllByIndex(Collection::Messages, query);
    if (documents.IsErr()) {
        return Result<size_t, ObscurFailure>::Err(std::move(documents).UnwrapErr());
    }
    size_t deleted = 0;
    for (const auto& document : documents.Unwrap()) {
        if (FromUnixMillis(document.order_key) >= older_than) {
            continue;
        }
        std::lock_guard lock(LockFor(document.id));
        auto removed = documents_->Delete(Collection::Messages, document.id);
        if (removed.IsErr()) {
            return Result<size_t, ObscurFailure>::Err(std::move(removed).UnwrapErr());
        }
        if (removed.Unwrap()) {
            ++deleted;
        }
    }
    logging::Logger()->info("Cleaned up {} old messages", deleted);
    return Result<size_t, ObscurFailure>::Ok(deleted);
}

Result<StorageUsage, ObscurFailure> MessageStore::GetStorageUsage() {
    auto count = documents_->Count(Collection::Messages);
    if (count.IsErr()) {
        return Result<StorageUsage, ObscurFailure>::Err(std::move(count).UnwrapErr());
    }
    auto bytes = documents_->TotalPayloadBytes(Collection::Messages);
    if (bytes.IsErr()) {
        return Result<StorageUsage, ObscurFailure>::Err(std::move(bytes).UnwrapErr());
    }
    auto range = documents_->GetOrderKeyRange(Collection::Messages);
    if (range.IsErr()) {
        return Result<StorageUsage, ObscurFailure>::Err(std::move(range).UnwrapErr());
    }
    StorageUsage usage;
    usage.total_messages = count.Unwrap();
    usage.total_size_bytes = bytes.Unwrap();
    if (const auto& keys = range.Unwrap()) {
        usage.oldest = FromUnixMillis(keys->lowest);
        usage.newest = FromUnixMillis(keys->highest);
    }
    return Result<StorageUsage, ObscurFailure>::Ok(usage);
}

}
