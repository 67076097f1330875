#pragma once
#include "obscur/configuration/retry_config.hpp"
#include "obscur/models/message.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace obscur::core::retry {

enum class BreakerState {
    Closed,
    Open
};

struct CircuitBreaker {
    int failure_count = 0;
    int success_count = 0;
    BreakerState state = BreakerState::Closed;
    models::Timestamp last_change_at{};
    models::Timestamp last_activity_at{};
    std::optional<std::string> last_error;
};

struct RetryDecision {
    bool should_retry = false;
    std::optional<models::Timestamp> next_retry_at;
    std::optional<std::string> error;
};

/**
 * @brief Retry scheduling and per-relay circuit breakers.
 *
 * A breaker opens after `failure_threshold` consecutive failures and closes
 * again once successes bring the failure count back under the threshold.
 * There is no time-based half-open state.
 *
 * Each scheduled retry owns a jthread that sleeps until its deadline. A timer
 * cancelled before the deadline never runs its callback; a timer that ran
 * removes its own entry and releases its thread. Breaker state is guarded by
 * one mutex; timers by another, so callbacks may call back into the
 * coordinator.
 */
class RetryCoordinator {
public:
    explicit RetryCoordinator(configuration::RetryConfig config = configuration::RetryConfig::Default());
    ~RetryCoordinator();

    RetryCoordinator(const RetryCoordinator&) = delete;
    RetryCoordinator& operator=(const RetryCoordinator&) = delete;

    [[nodiscard]] models::Timestamp ComputeNextRetry(int retry_count) const;
    [[nodiscard]] models::Timestamp ComputeNextRetry(int retry_count, models::Timestamp base) const;

    [[nodiscard]] RetryDecision ShouldRetry(
        const models::OutgoingMessage& message,
        std::optional<std::string> error = std::nullopt) const;

    /// Replaces any timer already armed for `message_id`.
    /// Returns false when no timer thread could be started.
    bool ScheduleRetry(const std::string& message_id, models::Timestamp at, std::function<void()> callback);

    /// Returns false when no timer was armed for the id.
    bool CancelRetry(const std::string& message_id);

    [[nodiscard]] bool HasPendingRetry(const std::string& message_id) const;
    [[nodiscard]] size_t PendingRetryCount() const;

    /// Timers still held, including ones whose callback is running.
    [[nodiscard]] size_t TimerCount() const;

    /// Cancels every timer and drops breakers idle past the retention window.
    /// Returns the number of breakers dropped.
    size_t Cleanup();
    size_t Cleanup(models::Timestamp now);

    void RecordRelayFailure(const std::string& relay_url, std::optional<std::string> error = std::nullopt);
    void RecordRelaySuccess(const std::string& relay_url);

    [[nodiscard]] bool IsRelayAvailable(std::string_view relay_url) const;
    [[nodiscard]] std::vector<std::string> GetAvailableRelays(const std::vector<std::string>& relay_urls) const;

    [[nodiscard]] std::map<std::string, CircuitBreaker> GetCircuitBreakerStatus() const;
    void ResetCircuitBreaker(std::string_view relay_url);

    [[nodiscard]] const configuration::RetryConfig& Config() const noexcept { return config_; }

private:
    struct Timer {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> fired;
    };

    struct TimerTable {
        std::mutex mutex;
        std::map<std::string, Timer> timers;
    };

    static void Dispose(std::vector<Timer>& timers);
    static void Release(const std::weak_ptr<TimerTable>& table,
                        const std::string& message_id,
                        const std::shared_ptr<std::atomic<bool>>& fired);
    std::vector<Timer> TakeAllTimers();

    configuration::RetryConfig config_;

    mutable std::mutex breakers_mutex_;
    std::map<std::string, CircuitBreaker, std::less<>> breakers_;

    std::shared_ptr<TimerTable> timer_table_;
};

}
