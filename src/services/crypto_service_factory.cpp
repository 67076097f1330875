#include "obscur/services/crypto_service_factory.hpp"
#include "obscur/services/crypto_worker.hpp"
#include "obscur/services/in_process_channel.hpp"
#include "obscur/services/native_fallback_crypto_service.hpp"
#include "obscur/services/software_crypto_service.hpp"
#include "obscur/services/worker_crypto_client.hpp"
#include "obscur/logging/logger.hpp"

namespace obscur::core::services {

using ServiceResult = Result<std::shared_ptr<interfaces::ICryptoService>, ObscurFailure>;

namespace {
    struct WorkerBackend {
        std::shared_ptr<InProcessChannel> channel;
        std::unique_ptr<CryptoWorker> worker;
        std::unique_ptr<WorkerCryptoClient> client;
    };
}

ServiceResult CryptoServiceFactory::Create(
    const configuration::CryptoBackendConfig& config,
    std::shared_ptr<interfaces::INativeKeystoreBridge> bridge) {
    auto software = SoftwareCryptoService::Create();
    if (software.IsErr()) {
        return ServiceResult::Err(std::move(software).UnwrapErr());
    }
    std::shared_ptr<interfaces::ICryptoService> software_service = std::move(software).Unwrap();

    switch (config.kind) {
        case configuration::CryptoBackendKind::Software:
            logging::Logger()->info("Crypto backend: software");
            return ServiceResult::Ok(std::move(software_service));
        case configuration::CryptoBackendKind::NativeWithFallback:
            if (!bridge) {
                return ServiceResult::Err(
                    ObscurFailure::Validation("Native crypto backend requires a keystore bridge"));
            }
            logging::Logger()->info("Crypto backend: native keystore with software fallback");
            return ServiceResult::Ok(std::make_shared<NativeFallbackCryptoService>(
                std::move(bridge), std::move(software_service), config.bridge_timeout));
        case configuration::CryptoBackendKind::Worker: {
            auto backend = std::make_shared<WorkerBackend>();
            backend->channel = std::make_shared<InProcessChannel>();
            backend->worker = std::make_unique<CryptoWorker>(backend->channel, std::move(software_service));
            backend->worker->Start();
            backend->client = std::make_unique<WorkerCryptoClient>(backend->channel, config.worker_timeout);
            logging::Logger()->info("Crypto backend: worker thread");
            interfaces::ICryptoService* client = backend->client.get();
            return ServiceResult::Ok(std::shared_ptr<interfaces::ICryptoService>(std::move(backend), client));
        }
    }
    return ServiceResult::Err(ObscurFailure::Validation("Unknown crypto backend"));
}

}
