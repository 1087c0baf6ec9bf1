// nativebridge kernel: ModuleRegistry implementation
#include "kernel/module_registry.hpp"

#include <mutex>

#include "module_loader.hpp"

namespace nb {

ModuleLoadResult ModuleRegistry::load_from_dirs(const std::vector<std::string>& dir_patterns) {
    return load_modules(dir_patterns, *this);
}

bool ModuleRegistry::add(std::shared_ptr<const NativeModule> module) {
    if (!module) return false;
    const std::string key = to_lower(module->name);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return modules_.emplace(key, std::move(module)).second;
}

std::shared_ptr<const NativeModule> ModuleRegistry::find(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = modules_.find(to_lower(name));
    if (it == modules_.end()) return nullptr;
    return it->second;
}

bool ModuleRegistry::contains(const std::string& name) const {
    return find(name) != nullptr;
}

std::vector<std::string> ModuleRegistry::names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(modules_.size());
    for (const auto& kv : modules_) out.push_back(kv.first);
    return out;
}

size_t ModuleRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return modules_.size();
}

std::map<std::string, std::string> ModuleRegistry::sources() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::map<std::string, std::string> out;
    for (const auto& [name, module] : modules_) out[name] = module->path.string();
    return out;
}

} // namespace nb
