#pragma once
#include "obscur/core/failures.hpp"
#include "obscur/models/message.hpp"
#include "obscur/retry/retry_coordinator.hpp"
#include "obscur/storage/message_store.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace obscur::core::retry {

struct QueueProcessingResult {
    size_t processed = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    std::vector<ObscurFailure> errors;
};

/// Publishes one queued message to the given relays and reports per-relay outcomes.
using PublishFunction = std::function<std::vector<models::RelayResult>(
    const models::OutgoingMessage& message,
    const std::vector<std::string>& relay_urls)>;

/**
 * @brief Drains due entries of the outgoing queue.
 *
 * Each due entry is offered to the relays whose breakers are closed. One
 * accepting relay is enough: the entry leaves the queue and the message
 * becomes Accepted. Otherwise the entry is requeued with the next backoff
 * deadline, or failed once its retries are used up.
 *
 * A call made while another run is in progress returns an empty result.
 */
class QueueProcessor {
public:
    QueueProcessor(std::shared_ptr<storage::MessageStore> store, std::shared_ptr<RetryCoordinator> coordinator);

    QueueProcessingResult ProcessQueue(const std::vector<std::string>& relay_urls, const PublishFunction& publish);

    [[nodiscard]] bool IsProcessing() const noexcept { return processing_.load(); }

private:
    void ProcessEntry(
        models::OutgoingMessage entry,
        const std::vector<std::string>& relay_urls,
        const PublishFunction& publish,
        QueueProcessingResult& result);

    void MoveStatus(const std::string& id, models::MessageStatus status);

    std::shared_ptr<storage::MessageStore> store_;
    std::shared_ptr<RetryCoordinator> coordinator_;
    std::atomic<bool> processing_{false};
};

}
