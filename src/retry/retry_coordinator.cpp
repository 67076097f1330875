#include "obscur/retry/retry_coordinator.hpp"
#include "obscur/logging/logger.hpp"
#include "obscur/crypto/security_utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <iterator>
#include <random>
#include <stop_token>
#include <system_error>

namespace obscur::core::retry {

using models::Clock;
using models::Timestamp;

namespace {
    int64_t RandomJitterMillis(int64_t upper) {
        if (upper <= 0) {
            return 0;
        }
        thread_local std::mt19937_64 engine{std::random_device{}()};
        std::uniform_int_distribution<int64_t> distribution(0, upper);
        return distribution(engine);
    }
}

RetryCoordinator::RetryCoordinator(configuration::RetryConfig config)
    : config_(config)
    , timer_table_(std::make_shared<TimerTable>()) {}

RetryCoordinator::~RetryCoordinator() {
    auto pending = TakeAllTimers();
    Dispose(pending);
}

std::vector<RetryCoordinator::Timer> RetryCoordinator::TakeAllTimers() {
    std::vector<Timer> taken;
    std::lock_guard lock(timer_table_->mutex);
    for (auto& [id, timer] : timer_table_->timers) {
        taken.push_back(std::move(timer));
    }
    timer_table_->timers.clear();
    return taken;
}

void RetryCoordinator::Dispose(std::vector<Timer>& timers) {
    for (auto& timer : timers) {
        timer.thread.request_stop();
        if (timer.thread.joinable()) {
            if (timer.thread.get_id() == std::this_thread::get_id()) {
                timer.thread.detach();
            } else {
                timer.thread.join();
            }
        }
    }
    timers.clear();
}

void RetryCoordinator::Release(
    const std::weak_ptr<TimerTable>& table,
    const std::string& message_id,
    const std::shared_ptr<std::atomic<bool>>& fired) {
    auto shared_table = table.lock();
    if (!shared_table) {
        return;
    }
    std::jthread self;
    {
        std::lock_guard lock(shared_table->mutex);
        auto existing = shared_table->timers.find(message_id);
        if (existing == shared_table->timers.end() || existing->second.fired != fired) {
            return;
        }
        self = std::move(existing->second.thread);
        shared_table->timers.erase(existing);
    }
    // Called on the timer's own thread, which cannot join itself.
    self.detach();
}

Timestamp RetryCoordinator::ComputeNextRetry(const int retry_count) const {
    return ComputeNextRetry(retry_count, Clock::now());
}

Timestamp RetryCoordinator::ComputeNextRetry(const int retry_count, const Timestamp base) const {
    const double base_ms = static_cast<double>(config_.GetBaseDelay().count());
    const double cap_ms = static_cast<double>(config_.GetMaxDelay().count());
    const double grown = base_ms * std::pow(config_.GetBackoffMultiplier(), std::max(retry_count, 0));
    const auto delay = static_cast<int64_t>(std::min(grown, cap_ms));
    const int64_t jitter = RandomJitterMillis(config_.GetJitter().count());
    return base + std::chrono::milliseconds(delay + jitter);
}

RetryDecision RetryCoordinator::ShouldRetry(
    const models::OutgoingMessage& message,
    std::optional<std::string> error) const {
    if (message.retry_count >= config_.GetMaxRetries()) {
        return RetryDecision{false, std::nullopt, std::string("Max retries exceeded")};
    }
    return RetryDecision{true, ComputeNextRetry(message.retry_count), std::move(error)};
}

bool RetryCoordinator::ScheduleRetry(
    const std::string& message_id,
    const Timestamp at,
    std::function<void()> callback) {
    auto fired = std::make_shared<std::atomic<bool>>(false);
    std::weak_ptr<TimerTable> table = timer_table_;
    std::vector<Timer> replaced;
    {
        // Started under the table lock so the thread cannot release an entry
        // that has not been inserted yet.
        std::lock_guard lock(timer_table_->mutex);
        std::jthread thread;
        try {
            thread = std::jthread(
                [message_id, at, fired, table, callback = std::move(callback)](std::stop_token stop_token) {
                    std::mutex wait_mutex;
                    std::condition_variable_any wait_cv;
                    {
                        std::unique_lock wait_lock(wait_mutex);
                        wait_cv.wait_until(wait_lock, stop_token, at, [] { return false; });
                    }
                    if (stop_token.stop_requested()) {
                        return;
                    }
                    fired->store(true);
                    try {
                        callback();
                    } catch (const std::exception& ex) {
                        logging::LogSanitized(spdlog::level::err,
                            fmt::format("Retry callback for message {} failed", message_id),
                            crypto::SecurityUtils::SanitizeForLogging(ex));
                    }
                    Release(table, message_id, fired);
                });
        } catch (const std::system_error& ex) {
            logging::Logger()->error("Could not start retry timer for message {}: {}", message_id, ex.what());
            return false;
        }
        auto existing = timer_table_->timers.find(message_id);
        if (existing != timer_table_->timers.end()) {
            replaced.push_back(std::move(existing->second));
            existing->second = Timer{std::move(thread), std::move(fired)};
        } else {
            timer_table_->timers.emplace(message_id, Timer{std::move(thread), std::move(fired)});
        }
    }
    Dispose(replaced);
    logging::Logger()->debug("Scheduled retry for message {}", message_id);
    return true;
}

bool RetryCoordinator::CancelRetry(const std::string& message_id) {
    std::vector<Timer> cancelled;
    {
        std::lock_guard lock(timer_table_->mutex);
        auto existing = timer_table_->timers.find(message_id);
        if (existing == timer_table_->timers.end()) {
            return false;
        }
        cancelled.push_back(std::move(existing->second));
        timer_table_->timers.erase(existing);
    }
    Dispose(cancelled);
    return true;
}

bool RetryCoordinator::HasPendingRetry(const std::string& message_id) const {
    std::lock_guard lock(timer_table_->mutex);
    auto existing = timer_table_->timers.find(message_id);
    return existing != timer_table_->timers.end() && !existing->second.fired->load();
}

size_t RetryCoordinator::PendingRetryCount() const {
    std::lock_guard lock(timer_table_->mutex);
    return static_cast<size_t>(std::count_if(timer_table_->timers.begin(), timer_table_->timers.end(),
        [](const auto& entry) { return !entry.second.fired->load(); }));
}

size_t RetryCoordinator::TimerCount() const {
    std::lock_guard lock(timer_table_->mutex);
    return timer_table_->timers.size();
}

size_t RetryCoordinator::Cleanup() {
    return Cleanup(Clock::now());
}

size_t RetryCoordinator::Cleanup(const Timestamp now) {
    auto cancelled = TakeAllTimers();
    Dispose(cancelled);

    size_t pruned = 0;
    std::lock_guard lock(breakers_mutex_);
    for (auto it = breakers_.begin(); it != breakers_.end();) {
        if (now - it->second.last_activity_at > config_.GetBreakerRetention()) {
            it = breakers_.erase(it);
            ++pruned;
        } else {
            ++it;
        }
    }
    if (pruned > 0) {
        logging::Logger()->info("Pruned {} idle circuit breakers", pruned);
    }
    return pruned;
}

void RetryCoordinator::RecordRelayFailure(const std::string& relay_url, std::optional<std::string> error) {
    const Timestamp now = Clock::now();
    std::lock_guard lock(breakers_mutex_);
    auto [it, created] = breakers_.try_emplace(relay_url);
    CircuitBreaker& breaker = it->second;
    if (created) {
        breaker.last_change_at = now;
    }
    ++breaker.failure_count;
    breaker.success_count = 0;
    breaker.last_activity_at = now;
    breaker.last_error = std::move(error);
    if (breaker.state == BreakerState::Closed && breaker.failure_count >= config_.GetFailureThreshold()) {
        breaker.state = BreakerState::Open;
        breaker.last_change_at = now;
        logging::Logger()->warn("Circuit breaker opened for relay {} after {} failures",
                                relay_url, breaker.failure_count);
    }
}

void RetryCoordinator::RecordRelaySuccess(const std::string& relay_url) {
    const Timestamp now = Clock::now();
    std::lock_guard lock(breakers_mutex_);
    auto [it, created] = breakers_.try_emplace(relay_url);
    CircuitBreaker& breaker = it->second;
    if (created) {
        breaker.last_change_at = now;
    }
    ++breaker.success_count;
    breaker.failure_count = std::max(0, breaker.failure_count - 1);
    breaker.last_activity_at = now;
    if (breaker.state == BreakerState::Open && breaker.failure_count < config_.GetFailureThreshold()) {
        breaker.state = BreakerState::Closed;
        breaker.last_change_at = now;
        breaker.last_error.reset();
        logging::Logger()->info("Circuit breaker closed for relay {}", relay_url);
    }
}

bool RetryCoordinator::IsRelayAvailable(std::string_view relay_url) const {
    std::lock_guard lock(breakers_mutex_);
    auto it = breakers_.find(relay_url);
    return it == breakers_.end() || it->second.state == BreakerState::Closed;
}

std::vector<std::string> RetryCoordinator::GetAvailableRelays(const std::vector<std::string>& relay_urls) const {
    std::vector<std::string> available;
    std::copy_if(relay_urls.begin(), relay_urls.end(), std::back_inserter(available),
                 [this](const std::string& url) { return IsRelayAvailable(url); });
    return available;
}

std::map<std::string, CircuitBreaker> RetryCoordinator::GetCircuitBreakerStatus() const {
    std::lock_guard lock(breakers_mutex_);
    return {breakers_.begin(), breakers_.end()};
}

void RetryCoordinator::ResetCircuitBreaker(std::string_view relay_url) {
    std::lock_guard lock(breakers_mutex_);
    auto it = breakers_.find(relay_url);
    if (it == breakers_.end()) {
        return;
    }
    CircuitBreaker& breaker = it->second;
    breaker.failure_count = 0;
    breaker.success_count = 0;
    breaker.state = BreakerState::Closed;
    breaker.last_change_at = Clock::now();
    breaker.last_error.reset();
    logging::Logger()->info("Circuit breaker reset for relay {}", relay_url);
}

}
