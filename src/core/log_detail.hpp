#pragma once

#include "blobwire/core/log.hpp"

#include <spdlog/logger.h>

#include <memory>

namespace blobwire::core::detail {

// 按 DiagnosticOptions 选出 logger：已注册的同名 logger 优先，否则用 spdlog 默认 logger。
[[nodiscard]] std::shared_ptr<spdlog::logger>
resolve_logger(const DiagnosticOptions &options);

} // namespace blobwire::core::detail
