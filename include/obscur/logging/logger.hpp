#pragma once

#include "obscur/core/failures.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <memory>
#include <string_view>

namespace obscur::core::logging {

/// Shared "obscur" logger. Created on first use with a colored stderr sink.
std::shared_ptr<spdlog::logger> Logger();

/// Replaces the logger's sinks with a single sink. Used by tests to capture output.
void SetSink(spdlog::sink_ptr sink);

/// Logs message followed by the redacted JSON form of context.
void LogSanitized(spdlog::level::level_enum level, std::string_view message, const nlohmann::json& context);

/// Logs a failure as its redacted {name, message} form.
void LogFailure(spdlog::level::level_enum level, std::string_view message, const ObscurFailure& failure);

}
