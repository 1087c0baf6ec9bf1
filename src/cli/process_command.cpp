// FILE: src/cli/process_command.cpp
#include "cli/process_command.hpp"

#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"

bool process_command(const std::string& line, nb::InteractionService& svc, HostConfig& config) {
  std::istringstream iss(line);
  std::string cmd;
  iss >> cmd;
  if (cmd.empty())
    return true;
  try {
    if (cmd == "help") {
      return handle_help(iss, svc, config);
    } else if (cmd == "modules" || cmd == "ls") {
      return handle_modules(iss, svc, config);
    } else if (cmd == "call") {
      return handle_call(iss, svc, config);
    } else if (cmd == "sync") {
      return handle_sync(iss, svc, config);
    } else if (cmd == "external" || cmd == "ext") {
      return handle_external(iss, svc, config);
    } else if (cmd == "stream") {
      return handle_stream(iss, svc, config);
    } else if (cmd == "dispatch") {
      return handle_dispatch(iss, svc, config);
    } else if (cmd == "cancel") {
      return handle_cancel(iss, svc, config);
    } else if (cmd == "wait") {
      return handle_wait(iss, svc, config);
    } else if (cmd == "counter") {
      return handle_counter(iss, svc, config);
    } else if (cmd == "config") {
      return handle_config(iss, svc, config);
    } else if (cmd == "exit" || cmd == "quit" || cmd == "q") {
      return handle_exit(iss, svc, config);
    } else {
      std::cout << "Unknown command: " << cmd
                << ". Type 'help' for a list of commands.\n";
    }
  } catch (const std::exception& e) {
    std::cout << "Error: " << e.what() << "\n";
  }
  return true;
}
