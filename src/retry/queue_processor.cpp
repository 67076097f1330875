#include "obscur/retry/queue_processor.hpp"
#include "obscur/logging/logger.hpp"

#include <fmt/format.h>


namespace obscur::core::retry {

using models::MessageStatus;
using models::OutgoingMessage;
using models::RelayResult;

namespace {
    class ProcessingGuard {
    public:
        explicit ProcessingGuard(std::atomic<bool>& flag) noexcept : flag_(flag) {}
        ~ProcessingGuard() { flag_.store(false); }
        ProcessingGuard(const ProcessingGuard&) = delete;
        ProcessingGuard& operator=(const ProcessingGuard&) = delete;
    private:
        std::atomic<bool>& flag_;
    };

    std::string SummarizeFailures(const std::vector<RelayResult>& results) {
        if (results.empty()) {
            return "No relay available";
        }
        std::string summary;
        for (const auto& result : results) {
            if (!summary.empty()) {
                summary += "; ";
            }
            summary += fmt::format("{}: {}", result.relay_url, result.error.value_or("rejected"));
        }
        return summary;
    }
}

QueueProcessor::QueueProcessor(
    std::shared_ptr<storage::MessageStore> store,
    std::shared_ptr<RetryCoordinator> coordinator)
    : store_(std::move(store))
    , coordinator_(std::move(coordinator)) {}

QueueProcessingResult QueueProcessor::ProcessQueue(
    const std::vector<std::string>& relay_urls,
    const PublishFunction& publish) {
    bool expected = false;
    if (!processing_.compare_exchange_strong(expected, true)) {
        logging::Logger()->debug("Queue processing already in progress");
        return {};
    }
    ProcessingGuard guard(processing_);

    QueueProcessingResult result;
    auto due = store_->GetQueuedMessages();
    if (due.IsErr()) {
        logging::LogFailure(spdlog::level::err, "Failed to read outgoing queue", due.UnwrapErr());
        result.errors.push_back(std::move(due).UnwrapErr());
        return result;
    }
    for (auto& entry : due.Unwrap()) {
        ProcessEntry(std::move(entry), relay_urls, publish, result);
    }
    if (result.processed > 0) {
        logging::Logger()->info("Processed {} queued messages: {} sent, {} failed",
                                result.processed, result.succeeded, result.failed);
    }
    return result;
}

void QueueProcessor::ProcessEntry(
    OutgoingMessage entry,
    const std::vector<std::string>& relay_urls,
    const PublishFunction& publish,
    QueueProcessingResult& result) {
    ++result.processed;
    const auto available = coordinator_->GetAvailableRelays(relay_urls);
    std::vector<RelayResult> outcomes;
    if (!available.empty()) {
        outcomes = publish(entry, available);
    }

    bool accepted = false;
    for (const auto& outcome : outcomes) {
        if (outcome.success) {
            coordinator_->RecordRelaySuccess(outcome.relay_url);
            accepted = true;
        } else {
            coordinator_->RecordRelayFailure(outcome.relay_url, outcome.error);
        }
    }

    if (accepted) {
        auto removed = store_->RemoveFromQueue(entry.id);
        if (removed.IsErr()) {
            result.errors.push_back(std::move(removed).UnwrapErr());
            return;
        }
        coordinator_->CancelRetry(entry.id);
        MoveStatus(entry.id, MessageStatus::Accepted);
        ++result.succeeded;
        return;
    }

    const std::string reason = SummarizeFailures(outcomes);
    // Backoff grows from the attempts made before this one. An entry whose
    // next count would hide it from GetQueuedMessages is failed now.
    const RetryDecision decision = coordinator_->ShouldRetry(entry, reason);
    ++entry.retry_count;
    if (decision.should_retry && decision.next_retry_at && entry.retry_count < store_->MaxRetries()) {
        entry.next_retry_at = *decision.next_retry_at;
        auto queued = store_->QueueOutgoingMessage(entry);
        if (queued.IsErr()) {
            result.errors.push_back(std::move(queued).UnwrapErr());
            return;
        }
        MoveStatus(entry.id, MessageStatus::Queued);
        logging::Logger()->debug("Message {} requeued after attempt {}", entry.id, entry.retry_count);
        return;
    }

    auto failed = store_->FailQueuedMessage(entry.id);
    if (failed.IsErr()) {
        result.errors.push_back(std::move(failed).UnwrapErr());
        return;
    }
    ++result.failed;
    result.errors.push_back(ObscurFailure::RetryExhausted(
        fmt::format("Message {}: {}", entry.id, decision.error.value_or("Max retries exceeded"))));
}

void QueueProcessor::MoveStatus(const std::string& id, const MessageStatus status) {
    auto updated = store_->UpdateMessageStatus(id, status);
    if (updated.IsErr()) {
        const auto& failure = updated.UnwrapErr();
        if (failure.type == ObscurFailureType::NotFound || failure.type == ObscurFailureType::InvalidState) {
            logging::LogFailure(spdlog::level::debug, fmt::format("Status of message {} left unchanged", id), failure);
        } else {
            logging::LogFailure(spdlog::level::err, fmt::format("Failed to update status of message {}", id), failure);
        }
    }
}

}
