#pragma once
#include "omemo_send/configuration/cli_options.hpp"
#include <spdlog/common.h>

namespace omemo_send::logging {

/// Pattern of every log line: left-aligned level name, then the message
inline constexpr const char* LOG_PATTERN = "%-8l %v";
inline constexpr const char* LOGGER_NAME = "omemo-send";

[[nodiscard]] spdlog::level::level_enum ToSpdlogLevel(configuration::Verbosity verbosity) noexcept;

/// Installs a colored stderr logger as the spdlog default logger.
void Initialize(configuration::Verbosity verbosity);

}
