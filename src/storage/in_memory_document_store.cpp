#include "obscur/storage/in_memory_document_store.hpp"
#include <algorithm>
namespace obscur::core::storage {
using interfaces::Collection;
using interfaces::Document;
using interfaces::Index;
using interfaces::IndexQuery;
using interfaces::OrderKeyRange;

InMemoryDocumentStore::Table& InMemoryDocumentStore::TableFor(Collection collection) {
    return collection == Collection::Messages ? messages_ : queue_;
}

Result<Unit, ObscurFailure> InMemoryDocumentStore::Put(Collection collection, const Document& document) {
    std::lock_guard lock(mutex_);
    TableFor(collection).insert_or_assign(document.id, document);
    return Result<Unit, ObscurFailure>::Ok(unit);
}

Result<std::optional<Document>, ObscurFailure> InMemoryDocumentStore::Get(Collection collection, std::string_view id) {
    std::lock_guard lock(mutex_);
    const auto& table = TableFor(collection);
    const auto it = table.find(id);
    if (it == table.end()) {
        return Result<std::optional<Document>, ObscurFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<Document>, ObscurFailure>::Ok(it->second);
}

Result<bool, ObscurFailure> InMemoryDocumentStore::Delete(Collection collection, std::string_view id) {
    std::lock_guard lock(mutex_);
    auto& table = TableFor(collection);
    const auto it = table.find(id);
    if (it == table.end()) {
        return Result<bool, ObscurFailure>::Ok(false);
    }
    table.erase(it);
    return Result<bool, ObscurFailure>::Ok(true);
}

Result<std::vector<Document>, ObscurFailure> InMemoryDocumentStore::GetAllByIndex(
    Collection collection,
    const IndexQuery& query) {
    if (query.index == Index::ConversationId && !query.equals) {
        return Result<std::vector<Document>, ObscurFailure>::Err(
            ObscurFailure::Validation("Conversation index query requires a conversation id"));
    }
    std::vector<Document> matches;
    {
        std::lock_guard lock(mutex_);
        for (const auto& [id, document] : TableFor(collection)) {
            if (query.equals && document.conversation_id != *query.equals) {
                continue;
            }
            if ((query.lower && document.order_key < *query.lower) ||
                (query.upper && document.order_key > *query.upper)) {
                continue;
            }
            matches.push_back(document);
        }
    }
    std::stable_sort(matches.begin(), matches.end(), [](const Document& a, const Document& b) {
        return a.order_key < b.order_key;
    });
    return Result<std::vector<Document>, ObscurFailure>::Ok(std::move(matches));
}

Result<size_t, ObscurFailure> InMemoryDocumentStore::Count(Collection collection) {
    std::lock_guard lock(mutex_);
    return Result<size_t, ObscurFailure>::Ok(TableFor(collection).size());
}

Result<size_t, ObscurFailure> InMemoryDocumentStore::TotalPayloadBytes(Collection collection) {
    std::lock_guard lock(mutex_);
    size_t total = 0;
    for (const auto& [id, document] : TableFor(collection)) {
        total += document.payload.size();
    }
    return Result<size_t, ObscurFailure>::Ok(total);
}

Result<std::optional<OrderKeyRange>, ObscurFailure> InMemoryDocumentStore::GetOrderKeyRange(Collection collection) {
    std::lock_guard lock(mutex_);
    const auto& table = TableFor(collection);
    if (table.empty()) {
        return Result<std::optional<OrderKeyRange>, ObscurFailure>::Ok(std::nullopt);
    }
    OrderKeyRange range{table.begin()->second.order_key, table.begin()->second.order_key};
    for (const auto& [id, document] : table) {
        range.lowest = std::min(range.lowest, document.order_key);
        range.highest = std::max(range.highest, document.order_key);
    }
    return Result<std::optional<OrderKeyRange>, ObscurFailure>::Ok(range);
}
}
