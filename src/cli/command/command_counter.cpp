// FILE: src/cli/command/command_counter.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"

bool handle_counter(std::istringstream& /*iss*/, nb::InteractionService& svc, HostConfig& /*config*/) {
    std::cout << "Shared access count: " << svc.cmd_access_count() << "\n";
    return true;
}

void print_help_counter(const HostConfig& /*config*/) {
    std::cout << "counter\n  Shows how many module accesses were recorded in the shared state.\n";
}
