#pragma once
#include "obscur/core/result.hpp"
#include "obscur/core/failures.hpp"
#include "obscur/configuration/store_config.hpp"
#include "obscur/crypto/secure_memory_handle.hpp"
#include "obscur/interfaces/i_document_store.hpp"
#include "obscur/models/message.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace obscur::core::storage {

/// Window over one conversation. `before` and `after` are exclusive bounds;
/// `offset` skips the newest matches and `limit` keeps the next newest.
struct MessageQuery {
    std::optional<size_t> limit;
    std::optional<size_t> offset;
    std::optional<models::Timestamp> before;
    std::optional<models::Timestamp> after;
};

struct StorageUsage {
    size_t total_messages = 0;
    size_t total_size_bytes = 0;
    std::optional<models::Timestamp> oldest;
    std::optional<models::Timestamp> newest;
};

/**
 * @brief Per-identity message log and outgoing queue.
 *
 * Messages are kept as protobuf records in an IDocumentStore. With at-rest
 * encryption on, the sensitive fields of each record (content, encrypted
 * content, attachments, reply) are sealed together with AES-256-GCM and the
 * stored content becomes the "[ENCRYPTED]" sentinel. The key is derived once
 * and held in sodium secure memory for the lifetime of the store.
 *
 * Operations on the same message id are serialized; different ids only
 * contend on the underlying store.
 */
class MessageStore {
public:
    static Result<std::unique_ptr<MessageStore>, ObscurFailure> Create(
        std::shared_ptr<interfaces::IDocumentStore> documents,
        configuration::StoreConfig config);

    /// Opens a SQLite-backed store at config.database_path.
    static Result<std::unique_ptr<MessageStore>, ObscurFailure> Open(configuration::StoreConfig config);

    MessageStore(const MessageStore&) = delete;
    MessageStore& operator=(const MessageStore&) = delete;

    [[nodiscard]] Result<Unit, ObscurFailure> PersistMessage(const models::Message& message);

    [[nodiscard]] Result<std::optional<models::Message>, ObscurFailure> GetMessage(std::string_view id);

    /// Ascending by timestamp, then id.
    [[nodiscard]] Result<std::vector<models::Message>, ObscurFailure> GetMessages(
        std::string_view conversation_id,
        const MessageQuery& query = {});

    [[nodiscard]] Result<Unit, ObscurFailure> UpdateMessageStatus(
        std::string_view id,
        models::MessageStatus status);

    [[nodiscard]] Result<Unit, ObscurFailure> QueueOutgoingMessage(const models::OutgoingMessage& message);

    /// Entries due at `now` that have not used up their retries.
    [[nodiscard]] Result<std::vector<models::OutgoingMessage>, ObscurFailure> GetQueuedMessages();
    [[nodiscard]] Result<std::vector<models::OutgoingMessage>, ObscurFailure> GetQueuedMessages(
        models::Timestamp now);

    [[nodiscard]] Result<std::optional<models::OutgoingMessage>, ObscurFailure> GetQueuedMessage(
        std::string_view id);

    [[nodiscard]] Result<bool, ObscurFailure> RemoveFromQueue(std::string_view id);

    /// Drops the queue entry and moves the message, if stored, to Failed.
    [[nodiscard]] Result<Unit, ObscurFailure> FailQueuedMessage(std::string_view id);

    [[nodiscard]] Result<std::optional<models::Timestamp>, ObscurFailure> GetLastMessageTimestamp(
        std::string_view conversation_id);

    /// Returns how many of `ids` were found and marked.
    [[nodiscard]] Result<size_t, ObscurFailure> MarkMessagesSynced(const std::vector<std::string>& ids);

    /// Deletes messages with timestamp strictly before `older_than`.
    [[nodiscard]] Result<size_t, ObscurFailure> CleanupOldMessages(models::Timestamp older_than);

    [[nodiscard]] Result<StorageUsage, ObscurFailure> GetStorageUsage();

    /// Applies to subsequent writes only.
    void SetEncryptAtRest(bool enabled) noexcept;
    [[nodiscard]] bool IsEncryptAtRest() const noexcept;

    [[nodiscard]] int MaxRetries() const noexcept { return max_retries_; }

private:
    static constexpr size_t LOCK_STRIPES = 64;

    MessageStore(
        std::shared_ptr<interfaces::IDocumentStore> documents,
        crypto::SecureMemoryHandle key,
        bool encrypt_at_rest,
        int max_retries);

    std::mutex& LockFor(std::string_view id);

    Result<Unit, ObscurFailure> WriteLocked(const models::Message& message);
    Result<std::optional<models::Message>, ObscurFailure> ReadLocked(std::string_view id);
    Result<models::Message, ObscurFailure> DecodeRecord(const interfaces::Document& document) const;
    Result<std::string, ObscurFailure> EncodeRecord(const models::Message& message) const;
    Result<std::vector<uint8_t>, ObscurFailure> SealWithKey(std::span<const uint8_t> plaintext) const;
    Result<std::vector<uint8_t>, ObscurFailure> OpenWithKey(std::span<const uint8_t> sealed) const;

    std::shared_ptr<interfaces::IDocumentStore> documents_;
    crypto::SecureMemoryHandle key_;
    std::atomic<bool> encrypt_at_rest_;
    int max_retries_;
    std::array<std::mutex, LOCK_STRIPES> locks_;
};

}
