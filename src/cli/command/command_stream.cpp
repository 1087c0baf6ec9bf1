// FILE: src/cli/command/command_stream.cpp
#include <iostream>
#include <sstream>

#include "cli/command/call_utils.hpp"
#include "cli/command/commands.hpp"

bool handle_stream(std::istringstream& iss, nb::InteractionService& svc, HostConfig& /*config*/) {
    std::string module; iss >> module;
    if (module.empty()) { std::cout << "Error: missing module name.\n"; return true; }
    auto payload = read_payload(iss);
    if (!payload) return true;
    print_response(svc.cmd_start_stream(module, *payload));
    return true;
}

bool handle_cancel(std::istringstream& iss, nb::InteractionService& svc, HostConfig& /*config*/) {
    uint64_t id = 0;
    if (!(iss >> id)) {
        auto active = svc.cmd_active_streams();
        if (active.empty()) { std::cout << "No streams are running.\n"; return true; }
        std::cout << "Running streams:";
        for (auto s : active) std::cout << " " << s;
        std::cout << "\n";
        return true;
    }
    if (svc.cmd_cancel_stream(id)) std::cout << "Cancellation requested for stream " << id << ".\n";
    else std::cout << "Stream " << id << " is not running.\n";
    return true;
}

bool handle_wait(std::istringstream& /*iss*/, nb::InteractionService& svc, HostConfig& /*config*/) {
    svc.cmd_wait_streams();
    std::cout << "All streams finished.\n";
    return true;
}

void print_help_stream(const HostConfig& /*config*/) {
    std::cout << "stream <module> [json]\n"
              << "  Starts the module's streaming entry point and returns its stream id.\n"
              << "  Messages are printed as they arrive; each stream ends with '--- finished ---'.\n";
}

void print_help_cancel(const HostConfig& /*config*/) {
    std::cout << "cancel [stream-id]\n"
              << "  Requests cooperative cancellation. Without an id, lists running streams.\n";
}

void print_help_wait(const HostConfig& /*config*/) {
    std::cout << "wait\n  Blocks until every running stream has finished.\n";
}
