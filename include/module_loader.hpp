// Module loading utilities for nativebridge
#pragma once

#include <string>
#include <utility>
#include <vector>

// Scans directories for modules and registers them.
// - dir_patterns: list of directories or simple wildcard patterns to scan for shared libraries.
//   Suffix semantics:
//     - "path" or "path/*"  => shallow scan (only the directory itself)
//     - "path/**"            => recursive scan of all subdirectories
// - registry: receives every module that loads and exposes a valid manifest.
#include "kernel/module_result.hpp"

namespace nb {

class ModuleRegistry;

// Load modules and report result (no console I/O in kernel).
NATIVEBRIDGE_API ModuleLoadResult load_modules(const std::vector<std::string>& dir_patterns,
                                               ModuleRegistry& registry);

// Splits "dir/**" and "dir/*" patterns into (directory, recursive).
NATIVEBRIDGE_API std::pair<std::string, bool> parse_dir_pattern(const std::string& pattern);

} // namespace nb
