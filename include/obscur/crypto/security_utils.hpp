#pragma once

#include "obscur/core/failures.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <exception>
#include <span>
#include <string>
#include <string_view>

namespace obscur::core::crypto {

class SecurityUtils {
public:
    static void ClearSensitiveBuffer(std::span<uint8_t> buffer);

    static void ClearSensitiveString(std::string& value);

    /**
     * @brief Timing-safe byte comparison.
     *
     * Walks the longer input even when the sizes differ so that the scan
     * length does not depend on where the inputs diverge.
     */
    [[nodiscard]] static bool ConstantTimeCompare(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b) noexcept;

    [[nodiscard]] static bool ConstantTimeStringCompare(
        std::string_view a,
        std::string_view b) noexcept;

    /**
     * @brief Deep copy of value with every sensitive field replaced by
     * "[REDACTED]". Keys are matched case-insensitively by substring.
     */
    [[nodiscard]] static nlohmann::json SanitizeForLogging(const nlohmann::json& value);

    [[nodiscard]] static nlohmann::json SanitizeForLogging(const ObscurFailure& failure);

    [[nodiscard]] static nlohmann::json SanitizeForLogging(const std::exception& ex);

    /// Masks values of sensitive `name=value` / `name: value` pairs and any
    /// run of key-like characters long enough to be key or ciphertext material.
    [[nodiscard]] static std::string RedactText(std::string_view text);

    [[nodiscard]] static bool IsSensitiveKey(std::string_view key);

private:
    SecurityUtils() = delete;
};

}
