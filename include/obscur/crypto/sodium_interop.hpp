#pragma once

#include "obscur/core/result.hpp"
#include "obscur/core/failures.hpp"
#include "obscur/core/constants.hpp"

#include <sodium.h>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace obscur::core::crypto {

/**
 * @brief Thin wrapper over the libsodium primitives used across the core.
 *
 * Initialize() must succeed before any other call. It is thread-safe and
 * idempotent, so every service constructor calls it.
 */
class SodiumInterop {
public:
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    /**
     * @brief Zeroes a buffer in a way the optimizer cannot elide.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    static Result<Unit, SodiumFailure> SecureWipe(std::span<const uint8_t> buffer);

    /**
     * @brief Constant-time comparison. Buffers of different size are unequal.
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    static std::vector<uint8_t> GetRandomBytes(size_t size);

    /// Uniform value in [0, upper_bound). Returns 0 when upper_bound is 0.
    static uint32_t RandomUniform(uint32_t upper_bound);

    static void* AllocateSecure(size_t size) noexcept;

    static void FreeSecure(void* ptr) noexcept;

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

}
