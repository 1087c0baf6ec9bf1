// nativebridge kernel: SymbolCache implementation
#include "kernel/symbol_cache.hpp"

#include <system_error>

#ifdef _WIN32
  #include <windows.h>
#else
  #include <dlfcn.h>
#endif

namespace nb {

namespace {

void* open_library(const std::string& target, std::string& error) {
#ifdef _WIN32
    HMODULE h = LoadLibraryA(target.c_str());
    if (!h) error = "LoadLibrary failed. Code: " + std::to_string(GetLastError());
    return reinterpret_cast<void*>(h);
#else
    void* h = dlopen(target.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!h) { const char* e = dlerror(); error = e ? e : "dlopen failed"; }
    return h;
#endif
}

void* find_export(void* handle, const std::string& symbol) {
#ifdef _WIN32
    return reinterpret_cast<void*>(GetProcAddress(reinterpret_cast<HMODULE>(handle), symbol.c_str()));
#else
    dlerror();
    void* addr = dlsym(handle, symbol.c_str());
    if (dlerror() != nullptr) return nullptr;
    return addr;
#endif
}

} // namespace

SymbolCache& SymbolCache::instance() {
    static SymbolCache cache;
    return cache;
}

std::string SymbolCache::normalize_library_name(const std::string& library_name) {
    const std::string ext = native_library_extension();
    if (library_name.size() >= ext.size() &&
        to_lower(library_name.substr(library_name.size() - ext.size())) == ext) {
        return library_name;
    }
    return library_name + ext;
}

void SymbolCache::add_search_dir(const fs::path& dir) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& d : search_dirs_) if (d == dir) return;
    search_dirs_.push_back(dir);
}

std::vector<fs::path> SymbolCache::search_dirs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return search_dirs_;
}

void SymbolCache::set_strict_signatures(bool strict) {
    std::lock_guard<std::mutex> lock(mutex_);
    strict_signatures_ = strict;
}

bool SymbolCache::strict_signatures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return strict_signatures_;
}

std::shared_ptr<const LoadedLibrary> SymbolCache::acquire(const std::string& library_name) {
    const std::string name = normalize_library_name(library_name);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = libraries_.find(name);
    if (it != libraries_.end()) return it->second;

    std::string error;
    fs::path resolved;
    void* handle = nullptr;
    for (const auto& dir : search_dirs_) {
        std::error_code ec;
        fs::path candidate = dir / name;
        if (!fs::is_regular_file(candidate, ec)) continue;
        handle = open_library(fs::absolute(candidate, ec).string(), error);
        if (handle) { resolved = fs::absolute(candidate, ec); break; }
    }
    if (!handle) handle = open_library(name, error);
    if (!handle) {
        throw BridgeError(BridgeErrc::LibraryNotFound,
                          "Could not load native library '" + name + "': " + error);
    }

    auto lib = std::make_shared<LoadedLibrary>();
    lib->name = name;
    lib->path = resolved;
    lib->handle = handle;
    ++load_count_;
    libraries_[name] = lib;
    return lib;
}

void* SymbolCache::resolve_address(const LoadedLibrary& lib, const std::string& function_name) const {
    void* addr = find_export(lib.handle, function_name);
    if (!addr) {
        throw BridgeError(BridgeErrc::SymbolNotFound,
                          "Export '" + function_name + "' not found in '" + lib.name + "'");
    }
    return addr;
}

void SymbolCache::check_signature(const LoadedLibrary& lib, const std::string& function_name,
                                  const std::string& expected) const {
    const auto* described = static_cast<const char*>(
        find_export(lib.handle, kSignatureSymbolPrefix + function_name));
    if (!described) {
        if (strict_signatures()) {
            throw BridgeError(BridgeErrc::SignatureMismatch,
                              "'" + lib.name + "' does not describe the signature of '" +
                              function_name + "' (expected " + expected + ")");
        }
        return;
    }
    if (expected != described) {
        throw BridgeError(BridgeErrc::SignatureMismatch,
                          "Signature mismatch for '" + function_name + "' in '" + lib.name +
                          "': library exports " + described + ", caller expects " + expected);
    }
}

bool SymbolCache::is_loaded(const std::string& library_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return libraries_.count(normalize_library_name(library_name)) != 0;
}

int SymbolCache::load_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_count_;
}

std::vector<std::string> SymbolCache::loaded_libraries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(libraries_.size());
    for (const auto& kv : libraries_) names.push_back(kv.first);
    return names;
}

} // namespace nb
