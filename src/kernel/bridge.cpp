// nativebridge kernel: Bridge implementation
#include "kernel/bridge.hpp"

#include "kernel/symbol_cache.hpp"
#include "module_loader.hpp"

namespace nb {

Bridge::Bridge(Options options)
    : options_(std::move(options)),
      channel_(options_.event_channel),
      dispatcher_(registry_, channel_, options_.gate, options_.stream_workers) {
    auto& cache = SymbolCache::instance();
    if (options_.strict_signatures) cache.set_strict_signatures(true);
    for (const auto& dir : options_.library_search_dirs) cache.add_search_dir(dir);
}

ModuleLoadResult Bridge::load_modules() {
    return load_modules(options_.module_dirs);
}

ModuleLoadResult Bridge::load_modules(const std::vector<std::string>& dir_patterns) {
    auto& cache = SymbolCache::instance();
    for (const auto& pattern : dir_patterns) {
        if (pattern.empty()) continue;
        cache.add_search_dir(parse_dir_pattern(pattern).first);
    }
    return registry_.load_from_dirs(dir_patterns);
}

} // namespace nb
