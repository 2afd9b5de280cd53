/**
 * @file main.cpp
 * @brief Catch2 entry point. Quiets the server log so only failures are printed.
 */

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "utility/misc.hpp"

int main(int argc, char* argv[]) {
    ggs::set_logging_level(ggs::log_level::Error);
    return Catch::Session().run(argc, argv);
}
