// Kernel module loader result and error reporting structures
#pragma once

#include <string>
#include <vector>

#include "nb_types.hpp"

namespace nb {

struct ModuleLoadError {
  std::string path;  // attempted module path
  BridgeErrc code = BridgeErrc::Unknown;
  std::string message;
};

struct ModuleLoadResult {
  int attempted = 0;
  int loaded = 0;
  std::vector<ModuleLoadError> errors;
  std::vector<std::string> loaded_names;  // logical names registered by this scan
};

}  // namespace nb
