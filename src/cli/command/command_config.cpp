// FILE: src/cli/command/command_config.cpp
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"

bool handle_config(std::istringstream& iss, nb::InteractionService& /*svc*/, HostConfig& config) {
  std::string sub;
  iss >> sub;
  if (sub == "save") {
    std::string path;
    iss >> path;
    if (path.empty()) path = config.loaded_config_path.empty() ? "config.yaml" : config.loaded_config_path;
    if (write_config_to_file(config, path)) std::cout << "Configuration saved to '" << path << "'.\n";
    else std::cout << "Error: could not write '" << path << "'.\n";
    return true;
  }
  std::cout << "Configuration"
            << (config.loaded_config_path.empty() ? std::string(" (defaults)") : " (" + config.loaded_config_path + ")")
            << ":\n";
  std::cout << "  module_dirs:";
  for (const auto& d : config.module_dirs) std::cout << " " << d;
  std::cout << "\n  library_search_dirs:";
  for (const auto& d : config.library_search_dirs) std::cout << " " << d;
  std::cout << "\n  event_channel: " << config.event_channel
            << "\n  stream_workers: " << config.stream_workers
            << "\n  strict_signatures: " << (config.strict_signatures ? "true" : "false")
            << "\n  default_mode: " << config.default_mode
            << "\n  history_size: " << config.history_size << "\n";
  return true;
}

void print_help_config(const HostConfig& /*config*/) {
  std::cout << "config [save [path]]\n"
            << "  Prints the active configuration, or writes it as YAML.\n"
            << "  Module directories are scanned once at startup; edits apply on the next start.\n";
}
