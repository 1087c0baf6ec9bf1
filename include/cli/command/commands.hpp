// FILE: include/cli/command/commands.hpp
#pragma once

#include <string>
#include <sstream>
#include "host_config.hpp"
#include "kernel/interaction.hpp"

// Each command exposes two functions:
//  - handle_<command>: executes the command; returns whether to continue the REPL
//  - print_help_<command>: prints detailed help for the command

// help
bool handle_help(std::istringstream& iss, nb::InteractionService& svc, HostConfig& config);
void print_help_help(const HostConfig& config);

// modules
bool handle_modules(std::istringstream& iss, nb::InteractionService& svc, HostConfig& config);
void print_help_modules(const HostConfig& config);

// call (mode from config.default_mode)
bool handle_call(std::istringstream& iss, nb::InteractionService& svc, HostConfig& config);
void print_help_call(const HostConfig& config);

// sync
bool handle_sync(std::istringstream& iss, nb::InteractionService& svc, HostConfig& config);
void print_help_sync(const HostConfig& config);

// external
bool handle_external(std::istringstream& iss, nb::InteractionService& svc, HostConfig& config);
void print_help_external(const HostConfig& config);

// stream
bool handle_stream(std::istringstream& iss, nb::InteractionService& svc, HostConfig& config);
void print_help_stream(const HostConfig& config);

// dispatch (raw JSON request)
bool handle_dispatch(std::istringstream& iss, nb::InteractionService& svc, HostConfig& config);
void print_help_dispatch(const HostConfig& config);

// cancel
bool handle_cancel(std::istringstream& iss, nb::InteractionService& svc, HostConfig& config);
void print_help_cancel(const HostConfig& config);

// wait
bool handle_wait(std::istringstream& iss, nb::InteractionService& svc, HostConfig& config);
void print_help_wait(const HostConfig& config);

// counter
bool handle_counter(std::istringstream& iss, nb::InteractionService& svc, HostConfig& config);
void print_help_counter(const HostConfig& config);

// config
bool handle_config(std::istringstream& iss, nb::InteractionService& svc, HostConfig& config);
void print_help_config(const HostConfig& config);

// exit / quit / q
bool handle_exit(std::istringstream& iss, nb::InteractionService& svc, HostConfig& config);
void print_help_exit(const HostConfig& config);
