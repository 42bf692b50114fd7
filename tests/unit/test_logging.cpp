#include <catch2/catch_test_macros.hpp>
#include "omemo_send/logging/logging.hpp"

#include <spdlog/spdlog.h>

using namespace omemo_send;
using configuration::Verbosity;

TEST_CASE("Logging - Verbosity mapping", "[logging]") {
    REQUIRE(logging::ToSpdlogLevel(Verbosity::Error) == spdlog::level::err);
    REQUIRE(logging::ToSpdlogLevel(Verbosity::Info) == spdlog::level::info);
    REQUIRE(logging::ToSpdlogLevel(Verbosity::Debug) == spdlog::level::debug);
}

TEST_CASE("Logging - Initialize installs the default logger", "[logging]") {
    logging::Initialize(Verbosity::Debug);
    REQUIRE(spdlog::default_logger()->name() == logging::LOGGER_NAME);
    REQUIRE(spdlog::default_logger()->level() == spdlog::level::debug);

    logging::Initialize(Verbosity::Error);
    REQUIRE(spdlog::get(logging::LOGGER_NAME) == spdlog::default_logger());
    REQUIRE(spdlog::default_logger()->level() == spdlog::level::err);
}
