#include "obscur/logging/logger.hpp"
#include "obscur/crypto/security_utils.hpp"
#include "obscur/core/constants.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <string>

namespace obscur::core::logging {

namespace {
    std::mutex logger_mutex;
    std::shared_ptr<spdlog::logger> shared_logger;

    std::shared_ptr<spdlog::logger> CreateLocked() {
        const std::string name(LoggingConstants::LOGGER_NAME);
        if (auto existing = spdlog::get(name)) {
            return existing;
        }
        auto logger = spdlog::stderr_color_mt(name);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
        logger->set_level(spdlog::level::info);
        return logger;
    }
}

std::shared_ptr<spdlog::logger> Logger() {
    std::lock_guard lock(logger_mutex);
    if (!shared_logger) {
        shared_logger = CreateLocked();
    }
    return shared_logger;
}

void SetSink(spdlog::sink_ptr sink) {
    auto logger = Logger();
    std::lock_guard lock(logger_mutex);
    logger->sinks().clear();
    logger->sinks().push_back(std::move(sink));
}

void LogSanitized(spdlog::level::level_enum level, std::string_view message, const nlohmann::json& context) {
    const auto sanitized = crypto::SecurityUtils::SanitizeForLogging(context);
    Logger()->log(level, "{} {}", message,
                  sanitized.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void LogFailure(spdlog::level::level_enum level, std::string_view message, const ObscurFailure& failure) {
    LogSanitized(level, message, crypto::SecurityUtils::SanitizeForLogging(failure));
}

}
