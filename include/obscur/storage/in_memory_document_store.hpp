#pragma once
#include "obscur/interfaces/i_document_store.hpp"
#include <map>
#include <mutex>
namespace obscur::core::storage {
class InMemoryDocumentStore final : public interfaces::IDocumentStore {
public:
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
    using Table = std::map<std::string, interfaces::Document, std::less<>>;
    Table& TableFor(interfaces::Collection collection);
    std::mutex mutex_;
    Table messages_;
    Table queue_;
};
}
