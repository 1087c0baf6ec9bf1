// FILE: src/cli/command/command_exit.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"

bool handle_exit(std::istringstream& /*iss*/, nb::InteractionService& svc, HostConfig& /*config*/) {
    if (!svc.cmd_active_streams().empty()) {
        std::cout << "Waiting for running streams to finish...\n";
        svc.cmd_wait_streams();
    }
    return false; // signal REPL exit
}

void print_help_exit(const HostConfig& /*config*/) {
    std::cout << "exit (quit, q)\n  Waits for running streams, then leaves the shell.\n";
}
