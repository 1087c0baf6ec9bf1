// FILE: cli/addin_host.cpp
#include <getopt.h>
#include <iostream>
#include <string>
#include <vector>

#include "host_config.hpp"
#include "kernel/bridge.hpp"
#include "kernel/interaction.hpp"

#include "cli/command/call_utils.hpp"
#include "cli/print_cli_help.hpp"
#include "cli/run_repl.hpp"

static void report_load_result(const nb::ModuleLoadResult& result) {
    std::cout << "Loaded " << result.loaded << " of " << result.attempted << " module file(s)";
    if (!result.loaded_names.empty()) {
        std::cout << ":";
        for (const auto& name : result.loaded_names) std::cout << " " << name;
    }
    std::cout << "\n";
    for (const auto& err : result.errors) {
        std::cerr << "Warning: skipped '" << err.path << "' (" << nb::to_string(err.code) << "): "
                  << err.message << "\n";
    }
}

static void list_modules(nb::InteractionService& svc) {
    auto names = svc.cmd_list_modules();
    if (names.empty()) { std::cout << "No modules are loaded.\n"; return; }
    for (const auto& name : names) {
        std::cout << "  - " << name << "  [";
        bool first = true;
        if (auto modes = svc.cmd_module_modes(name)) {
            for (auto m : *modes) { std::cout << (first ? "" : ", ") << nb::to_string(m); first = false; }
        }
        std::cout << "]\n";
    }
}

// Runs one call and returns the process exit code.
static int run_single_call(nb::InteractionService& svc, const std::string& module,
                           nb::InvokeMode mode, const nb::Payload& payload) {
    nb::ResponseEnvelope response;
    if (mode == nb::InvokeMode::Stream) {
        int listener = svc.cmd_subscribe([](const nb::StreamEvent& ev) {
            std::cout << format_stream_event(ev) << std::endl;
        });
        response = svc.cmd_start_stream(module, payload);
        svc.cmd_wait_streams();
        svc.cmd_unsubscribe(listener);
    } else if (mode == nb::InvokeMode::External) {
        response = svc.cmd_call_external(module, payload);
    } else {
        response = svc.cmd_call(module, payload);
    }
    print_response(response);
    return response.ok ? 0 : 3;
}

int main(int argc, char** argv) {
    // Fast path: help needs no configuration or modules.
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_cli_help();
            return 0;
        }
    }

    HostConfig config;
    std::string custom_config_path;
    std::vector<std::string> cli_module_dirs;

    const char* const short_opts = "hm:lc:p:";
    const option long_opts[] = {
        {"help", no_argument, nullptr, 'h'}, {"modules", required_argument, nullptr, 'm'},
        {"list", no_argument, nullptr, 'l'}, {"call", required_argument, nullptr, 'c'},
        {"payload", required_argument, nullptr, 'p'}, {"mode", required_argument, nullptr, 1001},
        {"repl", no_argument, nullptr, 'R'}, {"config", required_argument, nullptr, 2001},
        {nullptr, 0, nullptr, 0}
    };

    // First pass: configuration and module directories shape the Bridge.
    int opt;
    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        if (opt == 2001) custom_config_path = optarg;
        else if (opt == 'm') cli_module_dirs.push_back(optarg);
        else if (opt == '?') { print_cli_help(); return 1; }
    }
    optind = 1;

    std::string config_to_load = custom_config_path.empty() ? "config.yaml" : custom_config_path;
    load_or_create_config(config_to_load, config);
    if (!cli_module_dirs.empty()) config.module_dirs = cli_module_dirs;

    nb::Bridge bridge(to_bridge_options(config));
    nb::InteractionService svc(bridge);
    report_load_result(svc.cmd_load_modules());

    std::string call_module;
    std::string mode_text = config.default_mode;
    std::string payload_text;
    bool did_any_action = false;
    bool start_repl_after_actions = false;

    while ((opt = getopt_long(argc, argv, short_opts, long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'l': list_modules(svc); did_any_action = true; break;
        case 'c': call_module = optarg; break;
        case 'p': payload_text = optarg; break;
        case 1001: mode_text = optarg; break;
        case 'R': start_repl_after_actions = true; break;
        case 'm': case 2001: break;
        default: print_cli_help(); return 1;
        }
    }

    int exit_code = 0;
    if (!call_module.empty()) {
        nb::InvokeMode mode;
        if (!nb::parse_invoke_mode(mode_text, mode)) {
            std::cerr << "Error: unknown mode '" << mode_text << "'. Use sync, stream or external.\n";
            return 1;
        }
        nb::Payload payload = nb::Payload::object();
        if (!payload_text.empty()) {
            try {
                payload = nb::Payload::parse(payload_text);
            } catch (const nlohmann::json::parse_error& e) {
                std::cerr << "Error: payload is not valid JSON: " << e.what() << "\n";
                return 1;
            }
        }
        exit_code = run_single_call(svc, call_module, mode, payload);
        did_any_action = true;
    }

    if (start_repl_after_actions || !did_any_action) {
        if (did_any_action) {
            std::cout << "\n--- Command-line actions complete. Entering interactive shell. ---\n";
        }
        run_repl(svc, config);
    }

    return exit_code;
}
