#include "omemo_send/logging/logging.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace omemo_send::logging {

spdlog::level::level_enum ToSpdlogLevel(const configuration::Verbosity verbosity) noexcept {
    switch (verbosity) {
        case configuration::Verbosity::Error:
            return spdlog::level::err;
        case configuration::Verbosity::Debug:
            return spdlog::level::debug;
        case configuration::Verbosity::Info:
            return spdlog::level::info;
    }
    return spdlog::level::info;
}

void Initialize(const configuration::Verbosity verbosity) {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stderr_color_mt(LOGGER_NAME);
    }
    logger->set_pattern(LOG_PATTERN);
    logger->set_level(ToSpdlogLevel(verbosity));
    spdlog::set_default_logger(std::move(logger));
}

}
