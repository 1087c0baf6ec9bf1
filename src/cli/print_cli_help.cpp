// FILE: src/cli/print_cli_help.cpp
#include "cli/print_cli_help.hpp"

#include <iostream>

void print_cli_help() {
  std::cout
      << "Usage: addin_host [options]\n\n"
      << "Options:\n"
      << "  -h, --help                 Show this help message\n"
      << "  -m, --modules <dir>        Scan <dir> for modules (repeatable; dir/** recurses)\n"
      << "  -l, --list                 List loaded modules and their modes\n"
      << "  -c, --call <module>        Invoke <module> once\n"
      << "      --mode <mode>          sync | stream | external (default from config)\n"
      << "  -p, --payload <json>       JSON payload for --call (default {})\n"
      << "      --config <file>        Use a specific configuration file\n"
      << "      --repl                 Start interactive shell (REPL)\n"
      << std::endl;
}
