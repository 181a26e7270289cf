#include <iostream>
#include <string>
#include "cli/fleet_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        FleetCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
