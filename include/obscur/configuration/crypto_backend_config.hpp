#pragma once

#include "obscur/core/constants.hpp"

#include <chrono>

namespace obscur::core::configuration {

enum class CryptoBackendKind {
    Software,
    NativeWithFallback,
    Worker
};

struct CryptoBackendConfig {
    CryptoBackendKind kind = CryptoBackendKind::Software;
    std::chrono::milliseconds bridge_timeout = BridgeConstants::DEFAULT_BRIDGE_TIMEOUT;
    std::chrono::milliseconds worker_timeout = BridgeConstants::DEFAULT_WORKER_TIMEOUT;

    [[nodiscard]] static CryptoBackendConfig Software() noexcept {
        return CryptoBackendConfig{};
    }

    [[nodiscard]] static CryptoBackendConfig Native() noexcept {
        CryptoBackendConfig config;
        config.kind = CryptoBackendKind::NativeWithFallback;
        return config;
    }

    [[nodiscard]] static CryptoBackendConfig Worker() noexcept {
        CryptoBackendConfig config;
        config.kind = CryptoBackendKind::Worker;
        return config;
    }
};

}
