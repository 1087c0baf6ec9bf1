// FILE: src/cli/run_repl.cpp
#include <iostream>
#include <string>

#include "cli/run_repl.hpp"
#include "cli/command/call_utils.hpp"
#include "cli/process_command.hpp"
#include "cli_history.hpp"

void run_repl(nb::InteractionService& svc, HostConfig& config) {
    nb::CliHistory history;
    history.SetMaxSize(config.history_size > 0 ? static_cast<size_t>(config.history_size) : 0);

    // Stream events arrive on worker threads; print them as they come.
    int listener = svc.cmd_subscribe([](const nb::StreamEvent& ev) {
        std::cout << "\n" << format_stream_event(ev) << std::endl;
    });

    std::cout << "nativebridge add-in host. Type 'help' for commands.\n";
    std::cout << "History file: " << history.Path() << "\n";

    std::string line;
    while (true) {
        std::cout << "nb> " << std::flush;
        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }
        if (!line.empty()) {
            history.Add(line);
            history.Save();
        }
        if (!process_command(line, svc, config)) break;
    }

    svc.cmd_unsubscribe(listener);
}
