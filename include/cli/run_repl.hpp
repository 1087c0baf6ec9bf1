// FILE: include/cli/run_repl.hpp
#pragma once
#include "host_config.hpp"
#include "kernel/interaction.hpp"

void run_repl(nb::InteractionService& svc, HostConfig& config);
