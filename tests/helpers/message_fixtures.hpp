#pragma once
#include "obscur/models/message.hpp"
#include "obscur/storage/in_memory_document_store.hpp"
#include "obscur/storage/message_store.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace obscur::core::test_helpers {

inline constexpr const char* ALICE_PUBKEY = "aa11aa11aa11aa11aa11aa11aa11aa11aa11aa11aa11aa11aa11aa11aa11aa11";
inline constexpr const char* BOB_PUBKEY = "bb22bb22bb22bb22bb22bb22bb22bb22bb22bb22bb22bb22bb22bb22bb22bb22";

inline models::Timestamp At(const int64_t millis) {
    return models::FromUnixMillis(millis);
}

inline models::Message MakeMessage(
    const std::string& id,
    const std::string& content,
    const int64_t timestamp_ms,
    const std::string& conversation_id = models::DirectConversationId(ALICE_PUBKEY, BOB_PUBKEY)) {
    models::Message message;
    message.id = id;
    message.conversation_id = conversation_id;
    message.content = content;
    message.timestamp = At(timestamp_ms);
    message.is_outgoing = true;
    message.status = models::MessageStatus::Sending;
    message.sender_pubkey = ALICE_PUBKEY;
    message.recipient_pubkey = BOB_PUBKEY;
    return message;
}

inline models::OutgoingMessage MakeQueued(
    const std::string& id,
    const int retry_count = 0,
    const models::Timestamp next_retry_at = models::Clock::now() - std::chrono::seconds(1)) {
    models::OutgoingMessage message;
    message.id = id;
    message.conversation_id = models::DirectConversationId(ALICE_PUBKEY, BOB_PUBKEY);
    message.content = "queued " + id;
    message.recipient_pubkey = BOB_PUBKEY;
    message.created_at = models::Clock::now();
    message.retry_count = retry_count;
    message.next_retry_at = next_retry_at;
    return message;
}

/// MessageStore over an in-memory document store. The document store is
/// returned too so tests can inspect raw records.
struct StoreUnderTest {
    std::shared_ptr<storage::InMemoryDocumentStore> documents;
    std::shared_ptr<storage::MessageStore> store;
};

inline StoreUnderTest MakeStore(const bool encrypt_at_rest = true, const int max_retries = 5) {
    auto documents = std::make_shared<storage::InMemoryDocumentStore>();
    auto config = configuration::StoreConfig::InMemory(ALICE_PUBKEY);
    config.encrypt_at_rest = encrypt_at_rest;
    config.max_retries = max_retries;
    std::shared_ptr<storage::MessageStore> store = storage::MessageStore::Create(documents, config).Unwrap();
    return StoreUnderTest{documents, store};
}

}
