#define CATCH_CONFIG_RUNNER
#include "catch2/catch.hpp"
#include "runerip/logging.h"

#include <cstdlib>

int main(int argc, char* argv[])
{
    // quiet unless asked, the error paths under test log a lot
    if (!std::getenv("RUNERIP_TEST_LOG"))
        runerip::logging::set_level(runerip::logging::off);

    return Catch::Session().run(argc, argv);
}
