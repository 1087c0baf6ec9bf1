// Host configuration YAML read/write implementation
#include "host_config.hpp"

#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>
#include "nb_types.hpp" // for nb::fs alias

using namespace nb; // for fs

bool write_config_to_file(const HostConfig& config, const std::string& path) {
    YAML::Node root;
    root["_comment1"] = "nativebridge host configuration.";
    root["module_dirs"] = config.module_dirs;
    root["library_search_dirs"] = config.library_search_dirs;
    root["event_channel"] = config.event_channel;
    root["stream_workers"] = config.stream_workers;
    root["strict_signatures"] = config.strict_signatures;
    root["default_mode"] = config.default_mode;
    root["history_size"] = config.history_size;

    try {
        std::ofstream fout(path);
        if (!fout) return false;
        fout << root;
        return static_cast<bool>(fout);
    } catch (const std::exception&) {
        return false;
    }
}

void load_or_create_config(const std::string& config_path, HostConfig& config) {
    if (fs::exists(config_path)) {
        config.loaded_config_path = fs::absolute(config_path).string();
        try {
            YAML::Node root = YAML::LoadFile(config_path);
            if (root["module_dirs"] && root["module_dirs"].IsSequence()) {
                config.module_dirs = root["module_dirs"].as<std::vector<std::string>>();
            } else if (root["module_dir"] && root["module_dir"].IsScalar()) {
                config.module_dirs.clear();
                config.module_dirs.push_back(root["module_dir"].as<std::string>());
            }
            if (root["library_search_dirs"] && root["library_search_dirs"].IsSequence()) {
                config.library_search_dirs = root["library_search_dirs"].as<std::vector<std::string>>();
            }
            if (root["event_channel"]) config.event_channel = root["event_channel"].as<std::string>();
            if (root["stream_workers"]) config.stream_workers = root["stream_workers"].as<int>();
            if (root["strict_signatures"]) config.strict_signatures = root["strict_signatures"].as<bool>();
            if (root["default_mode"]) config.default_mode = root["default_mode"].as<std::string>();
            if (root["history_size"]) config.history_size = root["history_size"].as<int>();
            std::cout << "Loaded configuration from '" << config_path << "'." << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Warning: Could not parse config file '" << config_path
                      << "'. Using default settings. Error: " << e.what() << std::endl;
        }
    } else if (config_path == "config.yaml") {
        std::cout << "Configuration file 'config.yaml' not found. Creating a default one." << std::endl;
        if (write_config_to_file(config, "config.yaml")) {
            config.loaded_config_path = fs::absolute("config.yaml").string();
        }
    } else {
        std::cerr << "Warning: Config file '" << config_path << "' not found. Using default settings." << std::endl;
    }
}

nb::Bridge::Options to_bridge_options(const HostConfig& config) {
    nb::Bridge::Options opts;
    opts.module_dirs = config.module_dirs;
    opts.library_search_dirs = config.library_search_dirs;
    opts.event_channel = config.event_channel;
    opts.stream_workers = config.stream_workers > 0 ? static_cast<unsigned int>(config.stream_workers) : 0u;
    opts.strict_signatures = config.strict_signatures;
    return opts;
}
