// FILE: src/cli/command/command_help.cpp
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>

#include "cli/command/commands.hpp"

// Helper to canonicalize command names and aliases
static std::string canonicalize(const std::string& cmd) {
  static const std::unordered_map<std::string, std::string> alias = {
      {"ls", "modules"},
      {"ext", "external"},
      {"q", "exit"},
      {"quit", "exit"}};
  auto it = alias.find(cmd);
  return (it == alias.end()) ? cmd : it->second;
}

// Dispatcher for printing specific command help
static bool dispatch_print(const std::string& name, const HostConfig& config) {
  const std::string cmd = canonicalize(name);
  if (cmd == "help") {
    print_help_help(config);
  } else if (cmd == "modules") {
    print_help_modules(config);
  } else if (cmd == "call") {
    print_help_call(config);
  } else if (cmd == "sync") {
    print_help_sync(config);
  } else if (cmd == "external") {
    print_help_external(config);
  } else if (cmd == "stream") {
    print_help_stream(config);
  } else if (cmd == "dispatch") {
    print_help_dispatch(config);
  } else if (cmd == "cancel") {
    print_help_cancel(config);
  } else if (cmd == "wait") {
    print_help_wait(config);
  } else if (cmd == "counter") {
    print_help_counter(config);
  } else if (cmd == "config") {
    print_help_config(config);
  } else if (cmd == "exit") {
    print_help_exit(config);
  } else {
    return false;
  }
  return true;
}

static void print_repl_help() {
  std::cout << "Available commands:\n"
            << "  modules (ls)                 List loaded modules\n"
            << "  call <module> [json]         Invoke in the default mode\n"
            << "  sync <module> [json]         Synchronous call\n"
            << "  external (ext) <module> [json]  External-library call\n"
            << "  stream <module> [json]       Start a streaming call\n"
            << "  dispatch <json-request>      Raw dispatch protocol request\n"
            << "  cancel <stream-id>           Cancel a running stream\n"
            << "  wait                         Wait for all streams to finish\n"
            << "  counter                      Show the shared access counter\n"
            << "  config [save [path]]         Show or save the configuration\n"
            << "  help [command]               Show help\n"
            << "  exit (quit, q)               Leave the shell\n";
}

bool handle_help(std::istringstream& iss, nb::InteractionService& /*svc*/, HostConfig& config) {
  std::string name;
  iss >> name;
  if (name.empty()) {
    print_repl_help();
  } else if (!dispatch_print(name, config)) {
    std::cout << "No help for unknown command '" << name << "'.\n";
  }
  return true;
}

void print_help_help(const HostConfig& /*config*/) {
  std::cout << "help [command]\n  Without arguments lists all commands; with a command name prints its details.\n";
}
