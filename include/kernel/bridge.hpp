// nativebridge kernel: Bridge facade owning registry, channel and dispatcher
#pragma once

#include <memory>
#include <string>
#include <vector>

#include "kernel/dispatcher.hpp"
#include "kernel/module_registry.hpp"
#include "kernel/security_gate.hpp"
#include "kernel/services/event_channel.hpp"

namespace nb {

class NATIVEBRIDGE_API Bridge {
public:
    struct Options {
        std::vector<std::string> module_dirs;          // scanned at startup
        std::vector<std::string> library_search_dirs;  // extra SymbolCache dirs
        std::string event_channel = "native-stream";
        unsigned int stream_workers = 0;
        bool strict_signatures = false;
        std::shared_ptr<const SecurityGate> gate;      // null = process identity
    };

    explicit Bridge(Options options);

    Bridge(const Bridge&) = delete;
    Bridge& operator=(const Bridge&) = delete;

    // Scans the configured module directories. Their base directories are
    // also made available to the SymbolCache so modules can reach utility
    // libraries staged beside them.
    ModuleLoadResult load_modules();
    ModuleLoadResult load_modules(const std::vector<std::string>& dir_patterns);

    ModuleRegistry& modules() { return registry_; }
    const ModuleRegistry& modules() const { return registry_; }
    EventChannel& events() { return channel_; }
    Dispatcher& dispatcher() { return dispatcher_; }
    const Options& options() const { return options_; }

private:
    Options options_;
    ModuleRegistry registry_;
    EventChannel channel_;
    Dispatcher dispatcher_;
};

} // namespace nb
