#pragma once
#include "obscur/interfaces/i_document_store.hpp"
#include <sqlite3.h>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
namespace obscur::core::storage {

/**
 * IDocumentStore on a single SQLite connection in WAL mode.
 *
 * Each collection is a table `(id PRIMARY KEY, conversation_id, order_key,
 * payload BLOB)` with indexes on conversation_id and order_key. Calls are
 * serialized on the connection mutex; SQLite errors come back as Storage
 * failures carrying sqlite3_errmsg.
 */
class SqliteDocumentStore final : public interfaces::IDocumentStore {
public:
    static Result<std::unique_ptr<SqliteDocumentStore>, ObscurFailure> Open(
        const std::string& path,
        std::chrono::milliseconds busy_timeout);
    ~SqliteDocumentStore() override;

    SqliteDocumentStore(const SqliteDocumentStore&) = delete;
    SqliteDocumentStore& operator=(const SqliteDocumentStore&) = delete;

    [[nodiscard]] Result<Unit, ObscurFailure> Put(
        interfaces::Collection collection,
        const interfaces::Document& document) override;
    [[nodiscard]] Result<std::optional<interfaces::Document>, ObscurFailure> Get(
        interfaces::Collection collection,
        std::string_view id) override;
    [[nodiscard]] Result<bool, ObscurFailure> Delete(
        interfaces::Collection collection,
        std::string_view id) override;
    [[nodiscard]] Result<std::vector<interfaces::Document>, ObscurFailure> GetAllByIndex(
        interfaces::Collection collection,
        const interfaces::IndexQuery& query) override;
    [[nodiscard]] Result<size_t, ObscurFailure> Count(interfaces::Collection collection) override;
    [[nodiscard]] Result<size_t, ObscurFailure> TotalPayloadBytes(interfaces::Collection collection) override;
    [[nodiscard]] Result<std::optional<interfaces::OrderKeyRange>, ObscurFailure> GetOrderKeyRange(
        interfaces::Collection collection) override;

private:
    explicit SqliteDocumentStore(sqlite3* db) noexcept : db_(db) {}

    Result<Unit, ObscurFailure> InitSchema();
    ObscurFailure LastError(std::string_view what) const;

    sqlite3* db_;
    std::mutex mutex_;
};
}
