#include "catch2/catch.hpp"
#include "runerip/logging.h"

namespace logging = runerip::logging;

TEST_CASE("loggers are shared by name", "[logging]")
{
    auto a = logging::get("logging-test-a");
    auto b = logging::get("logging-test-a");
    auto c = logging::get("logging-test-c");

    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE(a->name() == "logging-test-a");
}

TEST_CASE("levels", "[logging]")
{
    auto saved = logging::default_level();
    auto logger = logging::get("logging-test-levels");

    SECTION("set_level reaches existing and new loggers")
    {
        logging::set_level(logging::err);
        REQUIRE(logger->level() == logging::err);
        REQUIRE(logging::default_level() == logging::err);
        REQUIRE(logging::get("logging-test-later")->level() == logging::err);
    }

    SECTION("a single logger can differ")
    {
        logger->level(logging::debug);
        REQUIRE(logger->level() == logging::debug);
        REQUIRE(logging::default_level() == saved);
    }

    SECTION("messages below the level are dropped")
    {
        logger->level(logging::off);
        logger->error("not shown {}", 1);
        logger->warn("not shown");
    }

    logging::set_level(saved);
}
