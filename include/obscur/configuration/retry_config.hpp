#pragma once

#include <chrono>
#include <cstdint>

namespace obscur::core::configuration {

/**
 * @brief Backoff and circuit-breaker parameters for outgoing delivery.
 *
 * Retry n is scheduled at
 * `min(base_delay * backoff_multiplier^n, max_delay) + uniform[0, jitter]`
 * after the failure. A relay's breaker opens after `failure_threshold`
 * consecutive failures and is forgotten once it has been idle for
 * `breaker_retention`.
 *
 * **Usage Example**:
 * ```cpp
 * auto config = RetryConfig::Default();
 * RetryCoordinator coordinator(config);
 * ```
 */
class RetryConfig {
public:
    RetryConfig(
        int max_retries,
        std::chrono::milliseconds base_delay,
        std::chrono::milliseconds max_delay,
        double backoff_multiplier,
        std::chrono::milliseconds jitter,
        int failure_threshold,
        std::chrono::milliseconds breaker_retention) noexcept
        : max_retries_(max_retries)
        , base_delay_(base_delay)
        , max_delay_(max_delay)
        , backoff_multiplier_(backoff_multiplier)
        , jitter_(jitter)
        , failure_threshold_(failure_threshold)
        , breaker_retention_(breaker_retention) {}

    /**
     * @brief 5 retries, 1 s base, 5 min cap, x2 growth, 1 s jitter,
     * breaker at 5 failures, 24 h retention.
     */
    [[nodiscard]] static RetryConfig Default() noexcept {
        return RetryConfig(
            5,
            std::chrono::milliseconds(1000),
            std::chrono::milliseconds(300000),
            2.0,
            std::chrono::milliseconds(1000),
            5,
            std::chrono::hours(24));
    }

    /**
     * @brief Default policy without jitter, for deterministic schedules.
     */
    [[nodiscard]] static RetryConfig WithoutJitter() noexcept {
        RetryConfig config = Default();
        config.jitter_ = std::chrono::milliseconds(0);
        return config;
    }

    [[nodiscard]] int GetMaxRetries() const noexcept { return max_retries_; }
    [[nodiscard]] std::chrono::milliseconds GetBaseDelay() const noexcept { return base_delay_; }
    [[nodiscard]] std::chrono::milliseconds GetMaxDelay() const noexcept { return max_delay_; }
    [[nodiscard]] double GetBackoffMultiplier() const noexcept { return backoff_multiplier_; }
    [[nodiscard]] std::chrono::milliseconds GetJitter() const noexcept { return jitter_; }
    [[nodiscard]] int GetFailureThreshold() const noexcept { return failure_threshold_; }
    [[nodiscard]] std::chrono::milliseconds GetBreakerRetention() const noexcept { return breaker_retention_; }

private:
    int max_retries_;
    std::chrono::milliseconds base_delay_;
    std::chrono::milliseconds max_delay_;
    double backoff_multiplier_;
    std::chrono::milliseconds jitter_;
    int failure_threshold_;
    std::chrono::milliseconds breaker_retention_;
};

}
