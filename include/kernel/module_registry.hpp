// nativebridge kernel: ModuleRegistry interface
#pragma once

#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "kernel/module_result.hpp"
#include "kernel/security_gate.hpp"
#include "module_api.hpp"

namespace nb {

// A loaded add-in. Immutable once registered; its library stays open for
// the process lifetime.
struct NativeModule {
    std::string name;  // lowercased file stem
    fs::path path;
    void* library = nullptr;
    AllowList allowed_hosts;

    nb_execute_fn execute = nullptr;
    nb_execute_streaming_fn execute_streaming = nullptr;
    nb_execute_external_fn execute_external = nullptr;
    nb_free_string_fn free_string = nullptr;

    bool supports(InvokeMode mode) const {
        switch (mode) {
            case InvokeMode::Sync: return execute != nullptr;
            case InvokeMode::Stream: return execute_streaming != nullptr;
            case InvokeMode::External: return execute_external != nullptr;
        }
        return false;
    }
};

// Maps logical module names to their entry points.
// - Populated by load_from_dirs() (see module_loader.hpp).
// - Names are case-insensitive; a registered name is never replaced.
class NATIVEBRIDGE_API ModuleRegistry {
public:
    // Scan the given directory patterns and register every valid module.
    ModuleLoadResult load_from_dirs(const std::vector<std::string>& dir_patterns);

    // Returns false when the name is taken.
    bool add(std::shared_ptr<const NativeModule> module);

    std::shared_ptr<const NativeModule> find(const std::string& name) const;
    bool contains(const std::string& name) const;
    std::vector<std::string> names() const;
    size_t size() const;

    // Module name -> absolute path of its library.
    std::map<std::string, std::string> sources() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::shared_ptr<const NativeModule>> modules_;
};

} // namespace nb
