#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <fcomb/base/checks.h>
#include <fcomb/base/contractual-constants.h>
#include <fcomb/base/system.debug.h>
#include <fcomb/base/system.h>

namespace fcomb::Checks
{
    void on_final_cleanup_and_exit() { }
}

int main(int argc, char** argv)
{
    if (fcomb::get_environment_variable(fcomb::EnvironmentVariableFcombDebug).value_or("") == "1")
    {
        fcomb::Debug::g_debugging = true;
    }

    // option parsing reads VERBOSE; keep the developer's environment from leaking into tests
    fcomb::set_environment_variable(fcomb::EnvironmentVariableVerbose, fcomb::nullopt);

    return Catch::Session().run(argc, argv);
}
