// Plain utility library loaded by other modules through the SymbolCache.
// It publishes no manifest, so the module scan skips it.
#include <cstdint>

#include "module_api.hpp"

extern "C" {

NB_MODULE_EXPORT int32_t perform_calculation(int32_t a, int32_t b) {
    // Wraps instead of overflowing; callers range-check.
    return static_cast<int32_t>(static_cast<int64_t>(a) + b);
}

NB_MODULE_EXPORT extern const char nb_sig_perform_calculation[];
const char nb_sig_perform_calculation[] = "i32(i32,i32)";

}
