#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>
#include "Logging.hpp"

int main(int argc, char* argv[]){
    Chronicle::initLogging(plog::warning);
    return Catch::Session().run(argc, argv);
}
