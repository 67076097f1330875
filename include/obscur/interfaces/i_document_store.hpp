#pragma once
#include "obscur/core/result.hpp"
#include "obscur/core/failures.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
namespace obscur::core::interfaces {

enum class Collection {
    Messages,
    Queue
};

/// Timestamp indexes messages, NextRetryAt indexes the queue; both read order_key.
enum class Index {
    ConversationId,
    Timestamp,
    NextRetryAt
};

struct Document {
    std::string id;
    std::string conversation_id;
    int64_t order_key = 0;
    std::string payload;
};

/// Exact match on conversation_id (ConversationId index) plus an optional
/// inclusive order_key range. Results are ascending by order_key, then id.
struct IndexQuery {
    Index index = Index::Timestamp;
    std::optional<std::string> equals;
    std::optional<int64_t> lower;
    std::optional<int64_t> upper;
};

struct OrderKeyRange {
    int64_t lowest = 0;
    int64_t highest = 0;
};

class IDocumentStore {
public:
    virtual ~IDocumentStore() = default;
    [[nodiscard]] virtual Result<Unit, ObscurFailure> Put(Collection collection, const Document& document) = 0;
    [[nodiscard]] virtual Result<std::optional<Document>, ObscurFailure> Get(
        Collection collection,
        std::string_view id) = 0;
    [[nodiscard]] virtual Result<bool, ObscurFailure> Delete(Collection collection, std::string_view id) = 0;
    [[nodiscard]] virtual Result<std::vector<Document>, ObscurFailure> GetAllByIndex(
        Collection collection,
        const IndexQuery& query) = 0;
    [[nodiscard]] virtual Result<size_t, ObscurFailure> Count(Collection collection) = 0;
    [[nodiscard]] virtual Result<size_t, ObscurFailure> TotalPayloadBytes(Collection collection) = 0;
    /// Smallest and largest order_key, or nullopt for an empty collection.
    [[nodiscard]] virtual Result<std::optional<OrderKeyRange>, ObscurFailure> GetOrderKeyRange(
        Collection collection) = 0;
};
}
