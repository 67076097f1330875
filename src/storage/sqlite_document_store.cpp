#include "obscur/storage/sqlite_document_store.hpp"
#include "obscur/core/constants.hpp"
#include "obscur/logging/logger.hpp"

#include <fmt/format.h>

namespace obscur::core::storage {

using interfaces::Collection;
using interfaces::Document;
using interfaces::Index;
using interfaces::IndexQuery;
using interfaces::OrderKeyRange;

namespace {
    struct StatementDeleter {
        void operator()(sqlite3_stmt* stmt) const {
            if (stmt) {
                sqlite3_finalize(stmt);
            }
        }
    };
    using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

    std::string_view TableName(Collection collection) {
        return collection == Collection::Messages
            ? StorageConstants::MESSAGES_COLLECTION
            : StorageConstants::QUEUE_COLLECTION;
    }

    void BindText(sqlite3_stmt* stmt, int index, std::string_view value) {
        sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    }

    std::string ColumnText(sqlite3_stmt* stmt, int column) {
        const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
        return text ? std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, column))) : std::string();
    }

    std::string ColumnBlob(sqlite3_stmt* stmt, int column) {
        const auto* blob = static_cast<const char*>(sqlite3_column_blob(stmt, column));
        return blob ? std::string(blob, static_cast<size_t>(sqlite3_column_bytes(stmt, column))) : std::string();
    }

    Document ReadDocument(sqlite3_stmt* stmt) {
        return Document{
            ColumnText(stmt, 0),
            ColumnText(stmt, 1),
            sqlite3_column_int64(stmt, 2),
            ColumnBlob(stmt, 3)};
    }
}

Result<std::unique_ptr<SqliteDocumentStore>, ObscurFailure> SqliteDocumentStore::Open(
    const std::string& path,
    std::chrono::milliseconds busy_timeout) {
    sqlite3* db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        std::string message = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        return Result<std::unique_ptr<SqliteDocumentStore>, ObscurFailure>::Err(
            ObscurFailure::Storage(fmt::format("Failed to open database {}: {}", path, message)));
    }
    std::unique_ptr<SqliteDocumentStore> store(new SqliteDocumentStore(db));
    sqlite3_busy_timeout(db, static_cast<int>(busy_timeout.count()));
    auto schema = store->InitSchema();
    if (schema.IsErr()) {
        return Result<std::unique_ptr<SqliteDocumentStore>, ObscurFailure>::Err(std::move(schema).UnwrapErr());
    }
    logging::Logger()->debug("Opened document store at {}", path);
    return Result<std::unique_ptr<SqliteDocumentStore>, ObscurFailure>::Ok(std::move(store));
}

SqliteDocumentStore::~SqliteDocumentStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

ObscurFailure SqliteDocumentStore::LastError(std::string_view what) const {
    return ObscurFailure::Storage(fmt::format("{}: {}", what, sqlite3_errmsg(db_)));
}

Result<Unit, ObscurFailure> SqliteDocumentStore::InitSchema() {
    static constexpr const char* SCHEMA =
        "PRAGMA journal_mode=WAL;"
        "CREATE TABLE IF NOT EXISTS messages ("
        "  id TEXT PRIMARY KEY,"
        "  conversation_id TEXT NOT NULL,"
        "  order_key INTEGER NOT NULL,"
        "  payload BLOB NOT NULL);"
        "CREATE INDEX IF NOT EXISTS idx_messages_conversation ON messages(conversation_id, order_key);"
        "CREATE INDEX IF NOT EXISTS idx_messages_timestamp ON messages(order_key);"
        "CREATE TABLE IF NOT EXISTS queue ("
        "  id TEXT PRIMARY KEY,"
        "  conversation_id TEXT NOT NULL,"
        "  order_key INTEGER NOT NULL,"
        "  payload BLOB NOT NULL);"
        "CREATE INDEX IF NOT EXISTS idx_queue_conversation ON queue(conversation_id, order_key);"
        "CREATE INDEX IF NOT EXISTS idx_queue_next_retry ON queue(order_key);";
    std::lock_guard lock(mutex_);
    char* error = nullptr;
    if (sqlite3_exec(db_, SCHEMA, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "unknown error";
        sqlite3_free(error);
        return Result<Unit, ObscurFailure>::Err(
            ObscurFailure::Storage(fmt::format("Failed to create schema: {}", message)));
    }
    return Result<Unit, ObscurFailure>::Ok(unit);
}

Result<Unit, ObscurFailure> SqliteDocumentStore::Put(Collection collection, const Document& document) {
    const std::string sql = fmt::format(
        "INSERT OR REPLACE INTO {} (id, conversation_id, order_key, payload) VALUES (?1, ?2, ?3, ?4)",
        TableName(collection));
    std::lock_guard lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return Result<Unit, ObscurFailure>::Err(LastError("Failed to prepare put"));
    }
    StatementPtr stmt(raw);
    BindText(stmt.get(), 1, document.id);
    BindText(stmt.get(), 2, document.conversation_id);
    sqlite3_bind_int64(stmt.get(), 3, document.order_key);
    sqlite3_bind_blob(stmt.get(), 4, document.payload.data(),
                      static_cast<int>(document.payload.size()), SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return Result<Unit, ObscurFailure>::Err(LastError("Failed to write document"));
    }
    return Result<Unit, ObscurFailure>::Ok(unit);
}

Result<std::optional<Document>, ObscurFailure> SqliteDocumentStore::Get(Collection collection, std::string_view id) {
    const std::string sql = fmt::format(
        "SELECT id, conversation_id, order_key, payload FROM {} WHERE id = ?1", TableName(collection));
    std::lock_guard lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return Result<std::optional<Document>, ObscurFailure>::Err(LastError("Failed to prepare get"));
    }
    StatementPtr stmt(raw);
    BindText(stmt.get(), 1, id);
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        return Result<std::optional<Document>, ObscurFailure>::Ok(std::nullopt);
    }
    if (rc != SQLITE_ROW) {
        return Result<std::optional<Document>, ObscurFailure>::Err(LastError("Failed to read document"));
    }
    return Result<std::optional<Document>, ObscurFailure>::Ok(ReadDocument(stmt.get()));
}

Result<bool, ObscurFailure> SqliteDocumentStore::Delete(Collection collection, std::string_view id) {
    const std::string sql = fmt::format("DELETE FROM {} WHERE id = ?1", TableName(collection));
    std::lock_guard lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return Result<bool, ObscurFailure>::Err(LastError("Failed to prepare delete"));
    }
    StatementPtr stmt(raw);
    BindText(stmt.get(), 1, id);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        return Result<bool, ObscurFailure>::Err(LastError("Failed to delete document"));
    }
    return Result<bool, ObscurFailure>::Ok(sqlite3_changes(db_) > 0);
}

Result<std::vector<Document>, ObscurFailure> SqliteDocumentStore::GetAllByIndex(
    Collection collection,
    const IndexQuery& query) {
    if (query.index == Index::ConversationId && !query.equals) {
        return Result<std::vector<Document>, ObscurFailure>::Err(
            ObscurFailure::Validation("Conversation index query requires a conversation id"));
    }
    std::string sql = fmt::format(
        "SELECT id, conversation_id, order_key, payload FROM {} WHERE 1 = 1", TableName(collection));
    if (query.equals) {
        sql += " AND conversation_id = ?1";
    }
    if (query.lower) {
        sql += " AND order_key >= ?2";
    }
    if (query.upper) {
        sql += " AND order_key <= ?3";
    }
    sql += " ORDER BY order_key ASC, id ASC";

    std::lock_guard lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return Result<std::vector<Document>, ObscurFailure>::Err(LastError("Failed to prepare index query"));
    }
    StatementPtr stmt(raw);
    if (query.equals) {
        BindText(stmt.get(), 1, *query.equals);
    }
    if (query.lower) {
        sqlite3_bind_int64(stmt.get(), 2, *query.lower);
    }
    if (query.upper) {
        sqlite3_bind_int64(stmt.get(), 3, *query.upper);
    }
    std::vector<Document> documents;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        documents.push_back(ReadDocument(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        return Result<std::vector<Document>, ObscurFailure>::Err(LastError("Failed to scan index"));
    }
    return Result<std::vector<Document>, ObscurFailure>::Ok(std::move(documents));
}

Result<size_t, ObscurFailure> SqliteDocumentStore::Count(Collection collection) {
    const std::string sql = fmt::format("SELECT COUNT(*) FROM {}", TableName(collection));
    std::lock_guard lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return Result<size_t, ObscurFailure>::Err(LastError("Failed to prepare count"));
    }
    StatementPtr stmt(raw);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return Result<size_t, ObscurFailure>::Err(LastError("Failed to count documents"));
    }
    return Result<size_t, ObscurFailure>::Ok(static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0)));
}

Result<size_t, ObscurFailure> SqliteDocumentStore::TotalPayloadBytes(Collection collection) {
    const std::string sql = fmt::format("SELECT COALESCE(SUM(LENGTH(payload)), 0) FROM {}", TableName(collection));
    std::lock_guard lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return Result<size_t, ObscurFailure>::Err(LastError("Failed to prepare size query"));
    }
    StatementPtr stmt(raw);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return Result<size_t, ObscurFailure>::Err(LastError("Failed to sum payload sizes"));
    }
    return Result<size_t, ObscurFailure>::Ok(static_cast<size_t>(sqlite3_column_int64(stmt.get(), 0)));
}

Result<std::optional<OrderKeyRange>, ObscurFailure> SqliteDocumentStore::GetOrderKeyRange(Collection collection) {
    const std::string sql = fmt::format("SELECT MIN(order_key), MAX(order_key) FROM {}", TableName(collection));
    std::lock_guard lock(mutex_);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        return Result<std::optional<OrderKeyRange>, ObscurFailure>::Err(LastError("Failed to prepare range query"));
    }
    StatementPtr stmt(raw);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return Result<std::optional<OrderKeyRange>, ObscurFailure>::Err(LastError("Failed to read order key range"));
    }
    if (sqlite3_column_type(stmt.get(), 0) == SQLITE_NULL) {
        return Result<std::optional<OrderKeyRange>, ObscurFailure>::Ok(std::nullopt);
    }
    return Result<std::optional<OrderKeyRange>, ObscurFailure>::Ok(OrderKeyRange{
        sqlite3_column_int64(stmt.get(), 0),
        sqlite3_column_int64(stmt.get(), 1)});
}

}
