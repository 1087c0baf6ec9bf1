// Host configuration definition and YAML I/O declarations
#pragma once

#include <string>
#include <vector>

#include "kernel/bridge.hpp"

// Note: kept in the global namespace next to the CLI that owns it.
struct HostConfig {
    std::string loaded_config_path;
    std::vector<std::string> module_dirs = {"natives"};
    std::vector<std::string> library_search_dirs;
    std::string event_channel = "native-stream";
    // 0 = one worker per hardware thread (at least 2).
    int stream_workers = 0;
    bool strict_signatures = false;
    // Mode used by the REPL `call` command and `--call` when none is given.
    std::string default_mode = "sync";
    int history_size = 1000;
};

// Persist the configuration to a YAML file at `path`.
// Returns true on success.
bool write_config_to_file(const HostConfig& config, const std::string& path);

// Load an existing config from `config_path` if it exists.
// If `config_path` is the default "config.yaml" and does not exist, create it with defaults.
void load_or_create_config(const std::string& config_path, HostConfig& config);

// Bridge options derived from the configuration.
nb::Bridge::Options to_bridge_options(const HostConfig& config);
