// Implementation of module loading
#include "module_loader.hpp"

#include <memory>
#include <system_error>

#include "kernel/module_registry.hpp"
#include "module_api.hpp"

#ifdef _WIN32
  #include <windows.h>
#else
  #include <dlfcn.h>
#endif

namespace nb {

namespace {

void close_library(void* handle) {
#ifdef _WIN32
    FreeLibrary(reinterpret_cast<HMODULE>(handle));
#else
    dlclose(handle);
#endif
}

} // namespace

std::pair<std::string, bool> parse_dir_pattern(const std::string& pattern) {
    // Interpret simple wildcard suffixes:
    //   path/**  => recursive
    //   path/*   => shallow (explicit)
    //   path     => shallow
    std::string path_str = pattern;
    if (path_str.size() >= 3 && path_str.substr(path_str.size() - 3) == "/**") {
        return {path_str.substr(0, path_str.size() - 3), true};
    }
    if (path_str.size() >= 2 && path_str.substr(path_str.size() - 2) == "/*") {
        return {path_str.substr(0, path_str.size() - 2), false};
    }
    return {path_str, false};
}

ModuleLoadResult load_modules(const std::vector<std::string>& dir_patterns,
                              ModuleRegistry& registry) {
    ModuleLoadResult result;
    const std::string extension = native_library_extension();

    auto process_path = [&](const fs::path& path) {
        if (to_lower(path.extension().string()) != extension) return; // skip non-shared libraries

        std::error_code ec;
        const fs::path abs_path = fs::absolute(path, ec);
        const std::string abs = abs_path.string();
        const std::string name = to_lower(path.stem().string());

        // One-shot loading: a module seen by an earlier scan is left alone.
        if (auto existing = registry.find(name)) {
            if (existing->path == abs_path) return;
            ++result.attempted;
            result.errors.push_back({abs, BridgeErrc::InvalidModule,
                                     "Module name '" + name + "' is already provided by " + existing->path.string()});
            return;
        }
        ++result.attempted;

        #ifdef _WIN32
        HMODULE handle = LoadLibraryA(abs.c_str());
        if (!handle) { result.errors.push_back({abs, BridgeErrc::Io, "LoadLibrary failed. Code: " + std::to_string(GetLastError())}); return; }
        auto get_manifest = reinterpret_cast<nb_get_module_manifest_fn>(GetProcAddress(handle, NB_MODULE_MANIFEST_SYMBOL));
        if (!get_manifest) { result.errors.push_back({abs, BridgeErrc::InvalidModule, "Missing nb_get_module_manifest export (not a module; utility library?)"}); FreeLibrary(handle); return; }
        #else
        void* handle = dlopen(abs.c_str(), RTLD_NOW | RTLD_LOCAL);
        if (!handle) { const char* e = dlerror(); result.errors.push_back({abs, BridgeErrc::Io, e ? e : "dlopen failed"}); return; }
        dlerror();
        nb_get_module_manifest_fn get_manifest;
        *(void**)(&get_manifest) = dlsym(handle, NB_MODULE_MANIFEST_SYMBOL);
        const char* dlsym_error = dlerror();
        if (dlsym_error || !get_manifest) { result.errors.push_back({abs, BridgeErrc::InvalidModule, "Missing nb_get_module_manifest export (not a module; utility library?)"}); dlclose(handle); return; }
        #endif

        auto reject = [&](const std::string& message) {
            result.errors.push_back({abs, BridgeErrc::InvalidModule, message});
            close_library(reinterpret_cast<void*>(handle));
        };

        const NbModuleManifest* manifest = nullptr;
        try {
            manifest = get_manifest();
        } catch (const std::exception& e) {
            reject(std::string("Manifest query threw: ") + e.what());
            return;
        }
        if (!manifest) { reject("Manifest is null"); return; }
        if (manifest->abi_version != NB_MODULE_ABI_VERSION) {
            reject("Unsupported module ABI version " + std::to_string(manifest->abi_version) +
                   " (host expects " + std::to_string(NB_MODULE_ABI_VERSION) + ")");
            return;
        }
        if (!manifest->execute) { reject("Missing sync entry point 'execute'"); return; }
        if (!manifest->free_string) { reject("Missing 'free_string' deallocator"); return; }

        auto module = std::make_shared<NativeModule>();
        module->name = name;
        module->path = abs_path;
        module->library = reinterpret_cast<void*>(handle);
        module->execute = manifest->execute;
        module->execute_streaming = manifest->execute_streaming;
        module->execute_external = manifest->execute_external;
        module->free_string = manifest->free_string;
        for (size_t i = 0; i < manifest->allowed_host_count; ++i) {
            if (manifest->allowed_hosts && manifest->allowed_hosts[i]) {
                module->allowed_hosts.emplace_back(manifest->allowed_hosts[i]);
            }
        }

        if (!registry.add(module)) { reject("Module name '" + name + "' is already registered"); return; }
        ++result.loaded;
        result.loaded_names.push_back(name);
    };

    auto iter_and_load = [&](const fs::path& base_dir, bool recursive) {
        std::error_code ec;
        if (!fs::exists(base_dir, ec) || !fs::is_directory(base_dir, ec)) return;
        // Kernel layer: avoid terminal output; frontends report the result.
        try {
            if (recursive) {
                for (const auto& entry : fs::recursive_directory_iterator(base_dir)) {
                    if (entry.is_regular_file()) process_path(entry.path());
                }
            } else {
                for (const auto& entry : fs::directory_iterator(base_dir)) {
                    if (entry.is_regular_file()) process_path(entry.path());
                }
            }
        } catch (const fs::filesystem_error& e) {
            result.errors.push_back({base_dir.string(), BridgeErrc::Io, e.what()});
        }
    };

    for (const auto& raw_path : dir_patterns) {
        if (raw_path.empty()) continue;
        auto [dir, recursive] = parse_dir_pattern(raw_path);
        iter_and_load(dir, recursive);
    }
    return result;
}

} // namespace nb
