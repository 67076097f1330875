#include <catch2/catch_test_macros.hpp>
#include "obscur/storage/in_memory_document_store.hpp"
#include "obscur/storage/sqlite_document_store.hpp"
using namespace obscur::core;
using namespace obscur::core::interfaces;
using namespace obscur::core::storage;

namespace {
    std::vector<std::string> Ids(const std::vector<Document>& documents) {
        std::vector<std::string> ids;
        for (const auto& document : documents) {
            ids.push_back(document.id);
        }
        return ids;
    }

    void ExerciseStore(IDocumentStore& store) {
        REQUIRE_FALSE(store.GetOrderKeyRange(Collection::Messages).Unwrap().has_value());

        REQUIRE(store.Put(Collection::Messages, Document{"m3", "c1", 300, "three"}).IsOk());
        REQUIRE(store.Put(Collection::Messages, Document{"m1", "c1", 100, "one"}).IsOk());
        REQUIRE(store.Put(Collection::Messages, Document{"m2", "c2", 200, "two"}).IsOk());
        REQUIRE(store.Put(Collection::Messages, Document{"m0", "c1", 100, "zero"}).IsOk());

        auto fetched = store.Get(Collection::Messages, "m1");
        REQUIRE(fetched.IsOk());
        REQUIRE(fetched.Unwrap().has_value());
        REQUIRE(fetched.Unwrap()->payload == "one");
        REQUIRE_FALSE(store.Get(Collection::Messages, "missing").Unwrap().has_value());

        auto by_conversation = store.GetAllByIndex(
            Collection::Messages, IndexQuery{Index::ConversationId, std::string("c1"), {}, {}});
        REQUIRE(by_conversation.IsOk());
        REQUIRE(Ids(by_conversation.Unwrap()) == std::vector<std::string>{"m0", "m1", "m3"});

        auto ranged = store.GetAllByIndex(Collection::Messages, IndexQuery{Index::Timestamp, {}, 100, 200});
        REQUIRE(Ids(ranged.Unwrap()) == std::vector<std::string>{"m0", "m1", "m2"});

        auto unkeyed = store.GetAllByIndex(Collection::Messages, IndexQuery{Index::ConversationId, {}, {}, {}});
        REQUIRE(unkeyed.IsErr());
        REQUIRE(unkeyed.UnwrapErr().type == ObscurFailureType::Validation);

        REQUIRE(store.Put(Collection::Messages, Document{"m1", "c1", 400, "updated"}).IsOk());
        REQUIRE(store.Get(Collection::Messages, "m1").Unwrap()->order_key == 400);
        REQUIRE(store.Count(Collection::Messages).Unwrap() == 4);
        REQUIRE(store.TotalPayloadBytes(Collection::Messages).Unwrap() ==
                std::string("three").size() + std::string("updated").size() +
                std::string("two").size() + std::string("zero").size());

        REQUIRE(store.Delete(Collection::Messages, "m3").Unwrap());
        REQUIRE_FALSE(store.Delete(Collection::Messages, "m3").Unwrap());
        REQUIRE(store.Count(Collection::Messages).Unwrap() == 3);
        const auto range = store.GetOrderKeyRange(Collection::Messages).Unwrap();
        REQUIRE(range.has_value());
        REQUIRE(range->lowest == 100);
        REQUIRE(range->highest == 400);

        REQUIRE(store.Put(Collection::Queue, Document{"q1", "c1", 50, "queued"}).IsOk());
        REQUIRE(store.Count(Collection::Queue).Unwrap() == 1);
        REQUIRE(store.GetOrderKeyRange(Collection::Queue).Unwrap()->highest == 50);
        REQUIRE_FALSE(store.Get(Collection::Messages, "q1").Unwrap().has_value());
        auto due = store.GetAllByIndex(Collection::Queue, IndexQuery{Index::NextRetryAt, {}, {}, 60});
        REQUIRE(Ids(due.Unwrap()) == std::vector<std::string>{"q1"});
        auto not_due = store.GetAllByIndex(Collection::Queue, IndexQuery{Index::NextRetryAt, {}, {}, 40});
        REQUIRE(not_due.Unwrap().empty());
    }
}

TEST_CASE("InMemoryDocumentStore - Contract", "[storage][documents]") {
    InMemoryDocumentStore store;
    ExerciseStore(store);
}

TEST_CASE("SqliteDocumentStore - Contract", "[storage][documents][sqlite]") {
    auto opened = SqliteDocumentStore::Open(":memory:", std::chrono::milliseconds(1000));
    REQUIRE(opened.IsOk());
    ExerciseStore(*opened.Unwrap());
}

TEST_CASE("SqliteDocumentStore - Binary payloads", "[storage][documents][sqlite]") {
    auto store = SqliteDocumentStore::Open(":memory:", std::chrono::milliseconds(1000)).Unwrap();
    const std::string payload("a\0b\xff", 4);
    REQUIRE(store->Put(Collection::Messages, Document{"bin", "c", 1, payload}).IsOk());
    REQUIRE(store->Get(Collection::Messages, "bin").Unwrap()->payload == payload);
}

TEST_CASE("SqliteDocumentStore - Bad path", "[storage][documents][sqlite]") {
    auto opened = SqliteDocumentStore::Open("/nonexistent-dir/obscur.db", std::chrono::milliseconds(10));
    REQUIRE(opened.IsErr());
    REQUIRE(opened.UnwrapErr().type == ObscurFailureType::Storage);
}
