#pragma once
#include "obscur/configuration/crypto_backend_config.hpp"
#include "obscur/interfaces/i_crypto_service.hpp"
#include "obscur/interfaces/i_native_keystore_bridge.hpp"
#include <memory>
namespace obscur::core::services {
class CryptoServiceFactory {
public:
    /**
     * @brief Builds the ICryptoService for the configured backend.
     *
     * NativeWithFallback requires a bridge. Worker starts an in-process
     * CryptoWorker whose lifetime is tied to the returned pointer.
     */
    [[nodiscard]] static Result<std::shared_ptr<interfaces::ICryptoService>, ObscurFailure> Create(
        const configuration::CryptoBackendConfig& config,
        std::shared_ptr<interfaces::INativeKeystoreBridge> bridge = nullptr);
private:
    CryptoServiceFactory() = delete;
};
}
