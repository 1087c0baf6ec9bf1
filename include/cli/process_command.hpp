// FILE: include/cli/process_command.hpp
#pragma once
#include <string>

#include "host_config.hpp"
#include "kernel/interaction.hpp"

// Returns whether to continue REPL (false means exit)
bool process_command(const std::string& line, nb::InteractionService& svc, HostConfig& config);
