#include <catch2/catch_test_macros.hpp>
#include "obscur/storage/message_store.hpp"
#include "obscur/core/constants.hpp"
#include "helpers/message_fixtures.hpp"
#include "storage/stored_message.pb.h"
#include "helpers/log_capture.hpp"
using namespace obscur::core;
using namespace obscur::core::models;
using namespace obscur::core::storage;
using namespace obscur::core::test_helpers;
using interfaces::Collection;

namespace {
    std::vector<std::string> Ids(const std::vector<Message>& messages) {
        std::vector<std::string> ids;
        for (const auto& message : messages) {
            ids.push_back(message.id);
        }
        return ids;
    }

    const std::string CONVERSATION = DirectConversationId(ALICE_PUBKEY, BOB_PUBKEY);
}

TEST_CASE("MessageStore - Creation", "[storage][store]") {
    SECTION("Requires a document store") {
        auto result = MessageStore::Create(nullptr, configuration::StoreConfig::InMemory(ALICE_PUBKEY));
        REQUIRE(result.UnwrapErr().type == ObscurFailureType::Validation);
    }
    SECTION("Requires key material") {
        auto result = MessageStore::Create(std::make_shared<InMemoryDocumentStore>(),
                                           configuration::StoreConfig::InMemory(""));
        REQUIRE(result.UnwrapErr().type == ObscurFailureType::Validation);
    }
    SECTION("SQLite-backed store opens in memory") {
        auto result = MessageStore::Open(configuration::StoreConfig::InMemory(ALICE_PUBKEY));
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap()->PersistMessage(MakeMessage("m1", "hi", 1000)).IsOk());
        REQUIRE(result.Unwrap()->GetMessage("m1").Unwrap()->content == "hi");
    }
}

TEST_CASE("MessageStore - Public key derived at-rest key is flagged", "[storage][store][encryption]") {
    LogCapture capture;

    SECTION("Warns without a secret") {
        REQUIRE(MessageStore::Create(std::make_shared<InMemoryDocumentStore>(),
                                     configuration::StoreConfig::InMemory(ALICE_PUBKEY)).IsOk());
        REQUIRE(capture.Text().find("warning At-rest key derived from the public key") != std::string::npos);
    }
    SECTION("Silent with a secret") {
        auto config = configuration::StoreConfig::InMemory(ALICE_PUBKEY);
        config.encryption_secret = "device secret";
        REQUIRE(MessageStore::Create(std::make_shared<InMemoryDocumentStore>(), config).IsOk());
        REQUIRE(capture.Text().find("At-rest key") == std::string::npos);
    }
}

TEST_CASE("MessageStore - Persistence", "[storage][store]") {
    auto [documents, store] = MakeStore();

    SECTION("Message is readable immediately after persisting") {
        auto message = MakeMessage("m1", "Hello World", 1000);
        message.reply_to = ReplyTo{"m0", "earlier"};
        message.attachments.push_back(Attachment{AttachmentKind::Image, "https://x/a.png", "image/png", "a.png"});
        message.relay_results.push_back(RelayResult{"wss://relay", true, std::nullopt, 42});
        message.reactions["+"] = 2;
        message.dm_format = DmFormat::Nip17;
        REQUIRE(store->PersistMessage(message).IsOk());

        auto loaded = store->GetMessage("m1");
        REQUIRE(loaded.IsOk());
        REQUIRE(loaded.Unwrap().has_value());
        const auto& m = *loaded.Unwrap();
        REQUIRE(m.content == "Hello World");
        REQUIRE(m.timestamp == At(1000));
        REQUIRE(m.reply_to->preview_text == "earlier");
        REQUIRE(m.attachments.size() == 1);
        REQUIRE(m.attachments[0].file_name == "a.png");
        REQUIRE(m.relay_results[0].latency_ms == 42);
        REQUIRE(m.reactions.at("+") == 2);
        REQUIRE(m.dm_format == DmFormat::Nip17);
    }
    SECTION("Missing message is empty, not an error") {
        auto loaded = store->GetMessage("nope");
        REQUIRE(loaded.IsOk());
        REQUIRE_FALSE(loaded.Unwrap().has_value());
    }
    SECTION("Ids are required") {
        REQUIRE(store->PersistMessage(MakeMessage("", "x", 1)).UnwrapErr().type == ObscurFailureType::Validation);
    }
    SECTION("Content that is not UTF-8 survives storage") {
        const std::string binary_text = std::string("caf\xe9 \xff") + '\0' + "!";
        REQUIRE(store->PersistMessage(MakeMessage("bin", binary_text, 1000)).IsOk());
        REQUIRE(store->GetMessage("bin").Unwrap()->content == binary_text);

        auto plain = MakeStore(false).store;
        REQUIRE(plain->PersistMessage(MakeMessage("bin", binary_text, 1000)).IsOk());
        REQUIRE(plain->GetMessage("bin").Unwrap()->content == binary_text);
    }
    SECTION("Persisting again replaces the record") {
        REQUIRE(store->PersistMessage(MakeMessage("m1", "first", 1000)).IsOk());
        REQUIRE(store->PersistMessage(MakeMessage("m1", "second", 1000)).IsOk());
        REQUIRE(store->GetMessage("m1").Unwrap()->content == "second");
        REQUIRE(documents->Count(Collection::Messages).Unwrap() == 1);
    }
}

TEST_CASE("MessageStore - Encryption at rest", "[storage][store][encryption]") {
    auto [documents, store] = MakeStore(true);
    auto message = MakeMessage("m1", "Hello World", 1000);
    message.reply_to = ReplyTo{"m0", "quoted secret"};
    REQUIRE(store->PersistMessage(message).IsOk());

    const auto raw = documents->Get(Collection::Messages, "m1").Unwrap();
    REQUIRE(raw.has_value());

    SECTION("Raw record hides sensitive fields") {
        REQUIRE(raw->payload.find("Hello World") == std::string::npos);
        REQUIRE(raw->payload.find("quoted secret") == std::string::npos);
        obscur::proto::storage::StoredMessage record;
        REQUIRE(record.ParseFromString(raw->payload));
        REQUIRE(record.is_encrypted());
        REQUIRE(record.content() == StorageConstants::ENCRYPTED_SENTINEL);
        REQUIRE_FALSE(record.encrypted_data().empty());
        REQUIRE(record.conversation_id() == CONVERSATION);
    }
    SECTION("Another identity's key cannot read it") {
        auto config = configuration::StoreConfig::InMemory(BOB_PUBKEY);
        auto other = MessageStore::Create(documents, config).Unwrap();
        auto loaded = other->GetMessage("m1");
        REQUIRE(loaded.IsErr());
        REQUIRE(loaded.UnwrapErr().type == ObscurFailureType::Crypto);
        REQUIRE(other->GetMessages(CONVERSATION).Unwrap().empty());
    }
    SECTION("Explicit secret overrides the identity key") {
        auto config = configuration::StoreConfig::InMemory(ALICE_PUBKEY);
        config.encryption_secret = "passphrase";
        auto other = MessageStore::Create(documents, config).Unwrap();
        REQUIRE(other->GetMessage("m1").IsErr());
    }
    SECTION("Disabling applies to new writes only") {
        store->SetEncryptAtRest(false);
        REQUIRE_FALSE(store->IsEncryptAtRest());
        REQUIRE(store->PersistMessage(MakeMessage("m2", "plain text", 2000)).IsOk());
        REQUIRE(documents->Get(Collection::Messages, "m2").Unwrap()->payload.find("plain text") != std::string::npos);
        REQUIRE(store->GetMessage("m1").Unwrap()->content == "Hello World");
        REQUIRE(store->GetMessage("m2").Unwrap()->content == "plain text");
    }
}

TEST_CASE("MessageStore - Unencrypted store", "[storage][store]") {
    auto [documents, store] = MakeStore(false);
    REQUIRE(store->PersistMessage(MakeMessage("m1", "visible", 1000)).IsOk());
    obscur::proto::storage::StoredMessage record;
    REQUIRE(record.ParseFromString(documents->Get(Collection::Messages, "m1").Unwrap()->payload));
    REQUIRE_FALSE(record.is_encrypted());
    REQUIRE(record.content() == "visible");
}

TEST_CASE("MessageStore - Pagination", "[storage][store][pagination]") {
    auto [documents, store] = MakeStore();
    for (int i = 1; i <= 5; ++i) {
        REQUIRE(store->PersistMessage(MakeMessage("m" + std::to_string(i), "msg", i * 1000)).IsOk());
    }
    REQUIRE(store->PersistMessage(MakeMessage("other", "msg", 2500, GroupConversationId("g"))).IsOk());

    SECTION("Whole conversation ascending") {
        REQUIRE(Ids(store->GetMessages(CONVERSATION).Unwrap()) ==
                std::vector<std::string>{"m1", "m2", "m3", "m4", "m5"});
    }
    SECTION("Limit keeps the newest") {
        REQUIRE(Ids(store->GetMessages(CONVERSATION, MessageQuery{2, {}, {}, {}}).Unwrap()) ==
                std::vector<std::string>{"m4", "m5"});
    }
    SECTION("Offset skips the newest") {
        REQUIRE(Ids(store->GetMessages(CONVERSATION, MessageQuery{2, 1, {}, {}}).Unwrap()) ==
                std::vector<std::string>{"m3", "m4"});
        REQUIRE(store->GetMessages(CONVERSATION, MessageQuery{{}, 10, {}, {}}).Unwrap().empty());
    }
    SECTION("Bounds are exclusive") {
        REQUIRE(Ids(store->GetMessages(CONVERSATION, MessageQuery{{}, {}, At(4000), At(2000)}).Unwrap()) ==
                std::vector<std::string>{"m3"});
    }
    SECTION("Before plus limit pages backwards") {
        REQUIRE(Ids(store->GetMessages(CONVERSATION, MessageQuery{2, {}, At(4000), {}}).Unwrap()) ==
                std::vector<std::string>{"m2", "m3"});
    }
    SECTION("Last timestamp per conversation") {
        REQUIRE(store->GetLastMessageTimestamp(CONVERSATION).Unwrap() == At(5000));
        REQUIRE(store->GetLastMessageTimestamp(GroupConversationId("g")).Unwrap() == At(2500));
        REQUIRE_FALSE(store->GetLastMessageTimestamp("unknown").Unwrap().has_value());
    }
}

TEST_CASE("MessageStore - Status updates", "[storage][store][status]") {
    auto [documents, store] = MakeStore();
    REQUIRE(store->PersistMessage(MakeMessage("m1", "x", 1000)).IsOk());

    SECTION("Forward updates persist") {
        REQUIRE(store->UpdateMessageStatus("m1", MessageStatus::Accepted).IsOk());
        REQUIRE(store->GetMessage("m1").Unwrap()->status == MessageStatus::Accepted);
        REQUIRE(store->UpdateMessageStatus("m1", MessageStatus::Delivered).IsOk());
        REQUIRE(store->GetMessage("m1").Unwrap()->status == MessageStatus::Delivered);
    }
    SECTION("Same status is a no-op") {
        REQUIRE(store->UpdateMessageStatus("m1", MessageStatus::Sending).IsOk());
    }
    SECTION("Regressions are refused") {
        REQUIRE(store->UpdateMessageStatus("m1", MessageStatus::Delivered).IsOk());
        auto result = store->UpdateMessageStatus("m1", MessageStatus::Queued);
        REQUIRE(result.UnwrapErr().type == ObscurFailureType::InvalidState);
        REQUIRE(store->GetMessage("m1").Unwrap()->status == MessageStatus::Delivered);
    }
    SECTION("Unknown message") {
        REQUIRE(store->UpdateMessageStatus("nope", MessageStatus::Accepted).UnwrapErr().type ==
                ObscurFailureType::NotFound);
    }
    SECTION("Content survives status rewrites") {
        REQUIRE(store->UpdateMessageStatus("m1", MessageStatus::Queued).IsOk());
        REQUIRE(store->GetMessage("m1").Unwrap()->content == "x");
    }
}

TEST_CASE("MessageStore - Outgoing queue", "[storage][store][queue]") {
    auto [documents, store] = MakeStore(true, 3);
    const auto now = Clock::now();

    REQUIRE(store->QueueOutgoingMessage(MakeQueued("due", 0, now - std::chrono::seconds(5))).IsOk());
    REQUIRE(store->QueueOutgoingMessage(MakeQueued("later", 1, now + std::chrono::minutes(5))).IsOk());
    REQUIRE(store->QueueOutgoingMessage(MakeQueued("exhausted", 3, now - std::chrono::seconds(5))).IsOk());

    SECTION("Only due entries with retries left are returned") {
        auto due = store->GetQueuedMessages(now);
        REQUIRE(due.IsOk());
        REQUIRE(due.Unwrap().size() == 1);
        REQUIRE(due.Unwrap()[0].id == "due");
        REQUIRE(due.Unwrap()[0].content == "queued due");
    }
    SECTION("Later entries become due") {
        auto due = store->GetQueuedMessages(now + std::chrono::minutes(10));
        REQUIRE(due.Unwrap().size() == 2);
        REQUIRE(due.Unwrap()[0].id == "due");
        REQUIRE(due.Unwrap()[1].id == "later");
    }
    SECTION("Signed events survive the queue") {
        auto queued = MakeQueued("signed");
        queued.signed_event = NostrEvent{"id", ALICE_PUBKEY, 1, 4, {{"p", BOB_PUBKEY}}, "c", "s"};
        REQUIRE(store->QueueOutgoingMessage(queued).IsOk());
        auto loaded = store->GetQueuedMessage("signed").Unwrap();
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->signed_event->tags == queued.signed_event->tags);
    }
    SECTION("Removal") {
        REQUIRE(store->RemoveFromQueue("due").Unwrap());
        REQUIRE_FALSE(store->RemoveFromQueue("due").Unwrap());
        REQUIRE_FALSE(store->GetQueuedMessage("due").Unwrap().has_value());
    }
    SECTION("Failing an entry marks the message failed") {
        auto message = MakeMessage("due", "x", 1000);
        message.status = MessageStatus::Queued;
        REQUIRE(store->PersistMessage(message).IsOk());
        REQUIRE(store->FailQueuedMessage("due").IsOk());
        REQUIRE_FALSE(store->GetQueuedMessage("due").Unwrap().has_value());
        REQUIRE(store->GetMessage("due").Unwrap()->status == MessageStatus::Failed);
    }
    SECTION("Failing an entry leaves delivered messages alone") {
        auto message = MakeMessage("due", "x", 1000);
        message.status = MessageStatus::Delivered;
        REQUIRE(store->PersistMessage(message).IsOk());
        REQUIRE(store->FailQueuedMessage("due").IsOk());
        REQUIRE(store->GetMessage("due").Unwrap()->status == MessageStatus::Delivered);
    }
}

TEST_CASE("MessageStore - Maintenance", "[storage][store]") {
    auto [documents, store] = MakeStore();
    REQUIRE(store->PersistMessage(MakeMessage("old", "a", 1000)).IsOk());
    REQUIRE(store->PersistMessage(MakeMessage("edge", "b", 2000)).IsOk());
    REQUIRE(store->PersistMessage(MakeMessage("new", "c", 3000)).IsOk());

    SECTION("Sync marks only known ids") {
        auto marked = store->MarkMessagesSynced({"old", "missing", "new"});
        REQUIRE(marked.Unwrap() == 2);
        REQUIRE(store->GetMessage("old").Unwrap()->synced_at.has_value());
        REQUIRE_FALSE(store->GetMessage("edge").Unwrap()->synced_at.has_value());
    }
    SECTION("Cleanup removes strictly older messages") {
        REQUIRE(store->CleanupOldMessages(At(2000)).Unwrap() == 1);
        REQUIRE_FALSE(store->GetMessage("old").Unwrap().has_value());
        REQUIRE(store->GetMessage("edge").Unwrap().has_value());
    }
    SECTION("Usage") {
        auto usage = store->GetStorageUsage().Unwrap();
        REQUIRE(usage.total_messages == 3);
        REQUIRE(usage.total_size_bytes > 0);
        REQUIRE(usage.oldest == At(1000));
        REQUIRE(usage.newest == At(3000));
    }
    SECTION("Empty usage") {
        auto empty = MakeStore().store->GetStorageUsage().Unwrap();
        REQUIRE(empty.total_messages == 0);
        REQUIRE_FALSE(empty.oldest.has_value());
    }
}
