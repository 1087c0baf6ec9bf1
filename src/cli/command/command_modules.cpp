// FILE: src/cli/command/command_modules.cpp
#include <filesystem>
#include <iostream>
#include <sstream>

#include "cli/command/commands.hpp"

namespace fs = std::filesystem;

bool handle_modules(std::istringstream& iss, nb::InteractionService& svc, HostConfig& /*config*/) {
    std::string flag; iss >> flag;
    const bool show_path = (flag == "-p" || flag == "--path");

    auto sources = svc.cmd_module_sources();
    if (sources.empty()) {
        std::cout << "No modules are loaded." << std::endl;
        return true;
    }
    std::cout << "Loaded modules (" << sources.size() << "):" << std::endl;
    for (const auto& [name, path] : sources) {
        std::cout << "  - " << name << "  [";
        bool first = true;
        if (auto modes = svc.cmd_module_modes(name)) {
            for (auto m : *modes) { std::cout << (first ? "" : ", ") << nb::to_string(m); first = false; }
        }
        std::cout << "]";
        std::cout << "  " << (show_path ? path : fs::path(path).filename().string());
        std::cout << std::endl;
    }
    return true;
}

void print_help_modules(const HostConfig& /*config*/) {
    std::cout << "modules [-p|--path]\n"
              << "  Lists loaded modules with the interaction modes they implement.\n"
              << "  -p shows the absolute library path instead of the file name.\n";
}
