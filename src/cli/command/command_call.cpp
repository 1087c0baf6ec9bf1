// FILE: src/cli/command/command_call.cpp
#include <iostream>
#include <sstream>

#include "cli/command/call_utils.hpp"
#include "cli/command/commands.hpp"

static bool run_call(std::istringstream& iss, nb::InteractionService& svc, nb::InvokeMode mode) {
    std::string module; iss >> module;
    if (module.empty()) { std::cout << "Error: missing module name.\n"; return true; }
    auto payload = read_payload(iss);
    if (!payload) return true;

    switch (mode) {
        case nb::InvokeMode::Sync: print_response(svc.cmd_call(module, *payload)); break;
        case nb::InvokeMode::External: print_response(svc.cmd_call_external(module, *payload)); break;
        case nb::InvokeMode::Stream: print_response(svc.cmd_start_stream(module, *payload)); break;
    }
    return true;
}

bool handle_call(std::istringstream& iss, nb::InteractionService& svc, HostConfig& config) {
    nb::InvokeMode mode;
    if (!nb::parse_invoke_mode(config.default_mode, mode)) {
        std::cout << "Error: config default_mode '" << config.default_mode << "' is not sync, stream or external.\n";
        return true;
    }
    return run_call(iss, svc, mode);
}

bool handle_sync(std::istringstream& iss, nb::InteractionService& svc, HostConfig& /*config*/) {
    return run_call(iss, svc, nb::InvokeMode::Sync);
}

bool handle_external(std::istringstream& iss, nb::InteractionService& svc, HostConfig& /*config*/) {
    return run_call(iss, svc, nb::InvokeMode::External);
}

bool handle_dispatch(std::istringstream& iss, nb::InteractionService& svc, HostConfig& /*config*/) {
    auto request = read_payload(iss);
    if (!request) return true;
    std::cout << svc.cmd_dispatch(*request).dump(2) << "\n";
    return true;
}

void print_help_call(const HostConfig& config) {
    std::cout << "call <module> [json]\n"
              << "  Invokes <module> in the configured default mode (currently '" << config.default_mode << "').\n";
}

void print_help_sync(const HostConfig& /*config*/) {
    std::cout << "sync <module> [json]\n"
              << "  Blocking call of the module's execute entry point.\n"
              << "  Example: sync sample {\"a\": 2, \"b\": 3}\n";
}

void print_help_external(const HostConfig& /*config*/) {
    std::cout << "external <module> [json]\n"
              << "  Blocking call of the module's execute_external entry point, which\n"
              << "  delegates to another native library.\n";
}

void print_help_dispatch(const HostConfig& /*config*/) {
    std::cout << "dispatch <json-request>\n"
              << "  Sends a raw dispatch request, e.g.\n"
              << "  dispatch {\"moduleName\": \"sample\", \"mode\": \"sync\", \"payload\": {\"a\": 2, \"b\": 3}}\n";
}
